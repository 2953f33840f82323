#include <rebase/ledger/ledger_strategies.hpp>
#include <rebase/ledger/fixed_point.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <iostream>

namespace rebase { namespace ledger {

using fixed_point::mul_truncate;
using fixed_point::div_precisely;

supply_change_result supply_change_strategy::apply( const ledger_global_object& global, const uint256_t& new_total_supply )const {
   REBASE_ASSERT( new_total_supply > global.non_rebasing_supply, invalid_supply_change_exception,
                  "new total supply ${s} must exceed the non-rebasing supply ${n}",
                  ("s", new_total_supply.str())("n", global.non_rebasing_supply.str()) );

   const uint256_t rebasing_credits_per_token = div_precisely( global.rebasing_credits,
                                                               new_total_supply - global.non_rebasing_supply );
   REBASE_ASSERT( rebasing_credits_per_token > 0, invalid_supply_change_exception,
                  "new total supply ${s} would leave ${c} rebasing credits with a zero multiplier",
                  ("s", new_total_supply.str())("c", global.rebasing_credits.str()) );

   return { rebasing_credits_per_token,
            resulting_total_supply( global, rebasing_credits_per_token, new_total_supply ) };
}

uint256_t derived_supply_change::resulting_total_supply( const ledger_global_object& global,
                                                         const uint256_t& rebasing_credits_per_token,
                                                         const uint256_t& new_total_supply )const {
   return fixed_point::safe_add( div_precisely( global.rebasing_credits, rebasing_credits_per_token ),
                                 global.non_rebasing_supply );
}

uint256_t trusted_supply_change::resulting_total_supply( const ledger_global_object& global,
                                                         const uint256_t& rebasing_credits_per_token,
                                                         const uint256_t& new_total_supply )const {
   return new_total_supply;
}

transfer_split derived_transfer_rounding::split( const uint256_t& amount,
                                                 const uint256_t& from_credits_per_token,
                                                 const uint256_t& to_credits_per_token )const {
   transfer_split result;
   if( from_credits_per_token == to_credits_per_token ) {
      result.credits_deducted = mul_truncate( amount, from_credits_per_token );
      result.credits_credited = result.credits_deducted;
   } else if( from_credits_per_token > to_credits_per_token ) {
      // the recipient side rounds coarser, the sender gives up exactly what the recipient gains
      result.credits_credited = mul_truncate( amount, to_credits_per_token );
      result.credits_deducted = mul_truncate( div_precisely( result.credits_credited, to_credits_per_token ),
                                              from_credits_per_token );
   } else {
      result.credits_deducted = mul_truncate( amount, from_credits_per_token );
      result.credits_credited = mul_truncate( div_precisely( result.credits_deducted, from_credits_per_token ),
                                              to_credits_per_token );
   }
   return result;
}

transfer_split independent_transfer_rounding::split( const uint256_t& amount,
                                                     const uint256_t& from_credits_per_token,
                                                     const uint256_t& to_credits_per_token )const {
   return { mul_truncate( amount, from_credits_per_token ), mul_truncate( amount, to_credits_per_token ) };
}

void reject_dust_burn_policy::validate( const account_object& account, const uint256_t& amount, const uint256_t& credit_amount )const {
   REBASE_ASSERT( amount == 0 || credit_amount > 0, dust_amount_burn_exception,
                  "burning ${amt} from ${a} removes no credits", ("amt", amount.str())("a", account.name) );
}

uint256_t reject_dust_burn_policy::non_rebasing_supply_reduction( const uint256_t& amount,
                                                                  const uint256_t& credit_amount,
                                                                  const uint256_t& credits_per_token )const {
   return div_precisely( credit_amount, credits_per_token );
}

std::unique_ptr<supply_change_strategy> make_supply_change_strategy( supply_change_mode mode ) {
   switch( mode ) {
      case supply_change_mode::derived: return std::make_unique<derived_supply_change>();
      case supply_change_mode::trusted: return std::make_unique<trusted_supply_change>();
   }
   REBASE_THROW( ledger_config_exception, "unknown supply change mode ${m}", ("m", static_cast<int>(mode)) );
}

std::unique_ptr<transfer_rounding_strategy> make_transfer_rounding_strategy( transfer_rounding_mode mode ) {
   switch( mode ) {
      case transfer_rounding_mode::derived:     return std::make_unique<derived_transfer_rounding>();
      case transfer_rounding_mode::independent: return std::make_unique<independent_transfer_rounding>();
   }
   REBASE_THROW( ledger_config_exception, "unknown transfer rounding mode ${m}", ("m", static_cast<int>(mode)) );
}

std::unique_ptr<burn_policy> make_burn_policy( burn_mode mode ) {
   switch( mode ) {
      case burn_mode::reject_dust: return std::make_unique<reject_dust_burn_policy>();
      case burn_mode::naive:       return std::make_unique<naive_burn_policy>();
   }
   REBASE_THROW( ledger_config_exception, "unknown burn mode ${m}", ("m", static_cast<int>(mode)) );
}

std::istream& operator>>(std::istream& in, supply_change_mode& mode) {
   std::string s;
   in >> s;
   if (s == "derived")
      mode = supply_change_mode::derived;
   else if (s == "trusted")
      mode = supply_change_mode::trusted;
   else
      in.setstate(std::ios_base::failbit);
   return in;
}

std::istream& operator>>(std::istream& in, transfer_rounding_mode& mode) {
   std::string s;
   in >> s;
   if (s == "derived")
      mode = transfer_rounding_mode::derived;
   else if (s == "independent")
      mode = transfer_rounding_mode::independent;
   else
      in.setstate(std::ios_base::failbit);
   return in;
}

std::istream& operator>>(std::istream& in, burn_mode& mode) {
   std::string s;
   in >> s;
   if (s == "reject-dust")
      mode = burn_mode::reject_dust;
   else if (s == "naive")
      mode = burn_mode::naive;
   else
      in.setstate(std::ios_base::failbit);
   return in;
}

std::ostream& operator<<(std::ostream& osm, supply_change_mode mode) {
   if ( mode == supply_change_mode::derived ) {
      osm << "derived";
   } else if ( mode == supply_change_mode::trusted ) {
      osm << "trusted";
   }
   return osm;
}

std::ostream& operator<<(std::ostream& osm, transfer_rounding_mode mode) {
   if ( mode == transfer_rounding_mode::derived ) {
      osm << "derived";
   } else if ( mode == transfer_rounding_mode::independent ) {
      osm << "independent";
   }
   return osm;
}

std::ostream& operator<<(std::ostream& osm, burn_mode mode) {
   if ( mode == burn_mode::reject_dust ) {
      osm << "reject-dust";
   } else if ( mode == burn_mode::naive ) {
      osm << "naive";
   }
   return osm;
}

} } /// rebase::ledger
