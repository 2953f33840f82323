#include <rebase/ledger/transfer_engine.hpp>
#include <rebase/ledger/fixed_point.hpp>

namespace rebase { namespace ledger {

void transfer_engine::apply_side( const account_object& account, const uint256_t& balance_before, const int256_t& credit_delta ) {
   if( account.non_rebasing ) {
      _supply.adjust_non_rebasing_supply( fixed_point::signed_delta( balance_before, _accounts.balance_of( account ) ) );
   } else if( credit_delta >= 0 ) {
      _supply.add_rebasing_credits( static_cast<uint256_t>( credit_delta ) );
   } else {
      _supply.sub_rebasing_credits( static_cast<uint256_t>( -credit_delta ) );
   }
}

void transfer_engine::transfer( const account_name& from, const account_name& to, const uint256_t& amount ) {
   const auto* sender = _accounts.find_account( from );
   const uint256_t from_balance = sender ? _accounts.balance_of( *sender ) : uint256_t(0);
   REBASE_ASSERT( amount <= from_balance, insufficient_balance_exception,
                  "account ${a} has balance ${b}, cannot transfer ${amt}",
                  ("a", from)("b", from_balance.str())("amt", amount.str()) );

   const auto& source = _accounts.get_or_create_account( from );
   const auto& destination = _accounts.get_or_create_account( to );

   const auto split = _rounding.split( amount, _accounts.credits_per_token( source ), _accounts.credits_per_token( destination ) );
   REBASE_ASSERT( source.credits >= split.credits_deducted, insufficient_balance_exception,
                  "account ${a} holds ${have} credits, transfer of ${amt} needs ${need}",
                  ("a", from)("have", source.credits.str())("amt", amount.str())("need", split.credits_deducted.str()) );

   if( &source == &destination ) {
      const uint256_t balance_before = _accounts.balance_of( source );
      _accounts.sub_credits( source, split.credits_deducted );
      _accounts.add_credits( source, split.credits_credited );
      apply_side( source, balance_before,
                  fixed_point::signed_delta( split.credits_deducted, split.credits_credited ) );
      return;
   }

   const uint256_t to_balance_before = _accounts.balance_of( destination );

   _accounts.sub_credits( source, split.credits_deducted );
   _accounts.add_credits( destination, split.credits_credited );

   apply_side( source, from_balance, -static_cast<int256_t>( split.credits_deducted ) );
   apply_side( destination, to_balance_before, static_cast<int256_t>( split.credits_credited ) );
}

} } /// rebase::ledger
