#include <rebase/ledger/rounding_error_tracker.hpp>
#include <rebase/ledger/fixed_point.hpp>

namespace rebase { namespace ledger {

using fixed_point::signed_delta;

void rounding_error_tracker::mint( const account_name& account, const uint256_t& amount ) {
   const uint256_t before = _accounts.balance_of( account );
   _inner.mint( account, amount );
   const uint256_t after = _accounts.balance_of( account );

   _supply.record_rounding_error( signed_delta( before, after ) - static_cast<int256_t>( amount ) );
}

void rounding_error_tracker::burn( const account_name& account, const uint256_t& amount ) {
   const uint256_t before = _accounts.balance_of( account );
   _inner.burn( account, amount );
   const uint256_t after = _accounts.balance_of( account );

   _supply.record_rounding_error( signed_delta( before, after ) + static_cast<int256_t>( amount ) );
}

void rounding_error_tracker::transfer( const account_name& from, const account_name& to, const uint256_t& amount ) {
   if( from == to ) {
      const uint256_t before = _accounts.balance_of( from );
      _inner.transfer( from, to, amount );
      _supply.record_rounding_error( signed_delta( before, _accounts.balance_of( from ) ) );
      return;
   }

   const uint256_t from_before = _accounts.balance_of( from );
   const uint256_t to_before   = _accounts.balance_of( to );
   _inner.transfer( from, to, amount );
   const uint256_t from_after  = _accounts.balance_of( from );
   const uint256_t to_after    = _accounts.balance_of( to );

   _supply.record_rounding_error( signed_delta( from_before, from_after ) + signed_delta( to_before, to_after ) );
}

const int256_t& rounding_error_tracker::rounding_error()const {
   return _supply.get_global().rounding_error;
}

} } /// rebase::ledger
