#include <rebase/ledger/rebase_opt_controller.hpp>
#include <rebase/ledger/fixed_point.hpp>

#include <fc/log/logger.hpp>

namespace rebase { namespace ledger {

using fixed_point::mul_truncate;
using fixed_point::div_precisely;

void rebase_opt_controller::opt_out( const account_name& account ) {
   REBASE_ASSERT( !_accounts.is_non_rebasing( account ), already_in_state_exception,
                  "account ${a} is already non-rebasing", ("a", account) );

   const auto& a = _accounts.get_or_create_account( account );
   const uint256_t rebasing_credits_per_token = _supply.get_global().rebasing_credits_per_token;
   const uint256_t balance = _accounts.balance_of( a );

   _supply.sub_rebasing_credits( a.credits );
   _supply.adjust_non_rebasing_supply( static_cast<int256_t>( balance ) );
   _accounts.lock_credits_per_token( a, rebasing_credits_per_token );

   ilog( "account ${a} opted out of rebasing with balance ${b} at ${c} credits per token",
         ("a", account)("b", balance.str())("c", rebasing_credits_per_token.str()) );
}

void rebase_opt_controller::opt_in( const account_name& account ) {
   const auto* existing = _accounts.find_account( account );
   REBASE_ASSERT( existing != nullptr && existing->non_rebasing, already_in_state_exception,
                  "account ${a} is already rebasing", ("a", account) );

   const auto& a = *existing;
   const uint256_t rebasing_credits_per_token = _supply.get_global().rebasing_credits_per_token;
   const uint256_t old_balance = _accounts.balance_of( a );

   uint256_t credits = a.credits;
   if( a.locked_credits_per_token != rebasing_credits_per_token ) {
      credits = mul_truncate( div_precisely( a.credits, a.locked_credits_per_token ), rebasing_credits_per_token );
   }

   _supply.adjust_non_rebasing_supply( -static_cast<int256_t>( old_balance ) );
   _accounts.unlock_credits_per_token( a, credits );
   _supply.add_rebasing_credits( credits );

   const uint256_t new_balance = _accounts.balance_of( a );
   _supply.adjust_total_supply( fixed_point::signed_delta( old_balance, new_balance ) );

   ilog( "account ${a} opted in to rebasing, balance ${o} -> ${n}",
         ("a", account)("o", old_balance.str())("n", new_balance.str()) );
}

} } /// rebase::ledger
