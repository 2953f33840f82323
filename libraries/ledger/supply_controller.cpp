#include <rebase/ledger/supply_controller.hpp>
#include <rebase/ledger/fixed_point.hpp>

#include <fc/log/logger.hpp>

namespace rebase { namespace ledger {

using fixed_point::mul_truncate;

void supply_controller::add_indices() {
   _db.add_index<ledger_global_index>();
}

void supply_controller::initialize_database( const uint256_t& initial_rebasing_credits_per_token ) {
   REBASE_ASSERT( initial_rebasing_credits_per_token > 0, ledger_config_exception,
                  "initial rebasing credits per token must be positive" );
   _db.create<ledger_global_object>([&]( ledger_global_object& g ) {
      g.rebasing_credits = 0;
      g.rebasing_credits_per_token = initial_rebasing_credits_per_token;
      g.non_rebasing_supply = 0;
      g.total_supply = 0;
      g.rounding_error = 0;
   });
}

const ledger_global_object& supply_controller::get_global()const {
   return _db.get<ledger_global_object>();
}

void supply_controller::change_supply( const uint256_t& new_total_supply ) {
   const auto& global = get_global();

   REBASE_ASSERT( new_total_supply <= _max_supply, invalid_supply_change_exception,
                  "new total supply ${s} exceeds the maximum supply ${m}",
                  ("s", new_total_supply.str())("m", _max_supply.str()) );

   const auto result = _supply_change.apply( global, new_total_supply );

   // a valid request for the current supply leaves the multiplier untouched
   if( new_total_supply == global.total_supply )
      return;

   _db.modify( global, [&]( ledger_global_object& g ) {
      g.rebasing_credits_per_token = result.rebasing_credits_per_token;
      g.total_supply = result.total_supply;
   });

   ilog( "supply changed to ${s} (requested ${r}), rebasing credits per token ${c}",
         ("s", result.total_supply.str())("r", new_total_supply.str())("c", result.rebasing_credits_per_token.str()) );
}

void supply_controller::mint( const account_name& account, const uint256_t& amount ) {
   const auto& global = get_global();
   REBASE_ASSERT( amount <= _max_supply && global.total_supply <= _max_supply - amount, arithmetic_overflow_exception,
                  "minting ${amt} would raise the total supply ${s} above ${m}",
                  ("amt", amount.str())("s", global.total_supply.str())("m", _max_supply.str()) );

   const auto& a = _accounts.get_or_create_account( account );
   const uint256_t credit_amount = mul_truncate( amount, _accounts.credits_per_token( a ) );

   _accounts.add_credits( a, credit_amount );

   if( a.non_rebasing ) {
      adjust_non_rebasing_supply( static_cast<int256_t>( amount ) );
   } else {
      add_rebasing_credits( credit_amount );
   }
   adjust_total_supply( static_cast<int256_t>( amount ) );
}

void supply_controller::burn( const account_name& account, const uint256_t& amount ) {
   if( amount == 0 )
      return;

   const auto* a = _accounts.find_account( account );
   REBASE_ASSERT( a != nullptr, insufficient_balance_exception,
                  "account ${a} has no balance to burn ${amt} from", ("a", account)("amt", amount.str()) );

   const uint256_t credits_per_token = _accounts.credits_per_token( *a );
   const uint256_t credit_amount = mul_truncate( amount, credits_per_token );

   _burn.validate( *a, amount, credit_amount );

   const uint256_t balance = _accounts.balance_of( *a );
   REBASE_ASSERT( amount <= balance && a->credits >= credit_amount, insufficient_balance_exception,
                  "account ${a} has balance ${b}, cannot burn ${amt}",
                  ("a", account)("b", balance.str())("amt", amount.str()) );

   _accounts.sub_credits( *a, credit_amount );

   if( a->non_rebasing ) {
      const uint256_t reduction = _burn.non_rebasing_supply_reduction( amount, credit_amount, credits_per_token );
      adjust_non_rebasing_supply( -static_cast<int256_t>( reduction ) );
   } else {
      sub_rebasing_credits( credit_amount );
   }
   adjust_total_supply( -static_cast<int256_t>( amount ) );
}

uint256_t supply_controller::reported_total_supply( bool include_rounding_error )const {
   const auto& global = get_global();
   if( !include_rounding_error )
      return global.total_supply;
   if( global.rounding_error >= 0 )
      return fixed_point::safe_add( global.total_supply, static_cast<uint256_t>( global.rounding_error ) );

   const uint256_t shortfall = static_cast<uint256_t>( -global.rounding_error );
   if( shortfall >= global.total_supply )
      return 0;
   return global.total_supply - shortfall;
}

void supply_controller::add_rebasing_credits( const uint256_t& credits ) {
   const auto& global = get_global();
   const uint256_t updated = fixed_point::safe_add( global.rebasing_credits, credits );
   _db.modify( global, [&]( ledger_global_object& g ) {
      g.rebasing_credits = updated;
   });
}

void supply_controller::sub_rebasing_credits( const uint256_t& credits ) {
   const auto& global = get_global();
   const uint256_t updated = fixed_point::safe_sub( global.rebasing_credits, credits, "rebasing credits" );
   _db.modify( global, [&]( ledger_global_object& g ) {
      g.rebasing_credits = updated;
   });
}

void supply_controller::adjust_non_rebasing_supply( const int256_t& delta ) {
   const auto& global = get_global();
   const uint256_t updated = fixed_point::apply_delta( global.non_rebasing_supply, delta, "non-rebasing supply" );
   _db.modify( global, [&]( ledger_global_object& g ) {
      g.non_rebasing_supply = updated;
   });
}

void supply_controller::adjust_total_supply( const int256_t& delta ) {
   const auto& global = get_global();
   const uint256_t updated = fixed_point::apply_delta( global.total_supply, delta, "total supply" );
   _db.modify( global, [&]( ledger_global_object& g ) {
      g.total_supply = updated;
   });
}

void supply_controller::record_rounding_error( const int256_t& delta ) {
   if( delta == 0 )
      return;
   const auto& global = get_global();
   _db.modify( global, [&]( ledger_global_object& g ) {
      g.rounding_error += delta;
   });
}

} } /// rebase::ledger
