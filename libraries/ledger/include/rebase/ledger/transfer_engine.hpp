#pragma once
#include <rebase/ledger/supply_controller.hpp>

namespace rebase { namespace ledger {

   /**
    * Moves value between two accounts that may be priced under different multipliers.
    *
    * Rebasing sides move rebasing_credits by the credits they gain or lose. Non-rebasing sides
    * move non_rebasing_supply by the change of their token balance.
    */
   class transfer_engine {
      public:
         transfer_engine( account_ledger& accounts, supply_controller& supply, const transfer_rounding_strategy& rounding )
         :_accounts(accounts)
         ,_supply(supply)
         ,_rounding(rounding)
         {
         }

         void transfer( const account_name& from, const account_name& to, const uint256_t& amount );

      private:
         void apply_side( const account_object& account, const uint256_t& balance_before, const int256_t& credit_delta );

         account_ledger&                     _accounts;
         supply_controller&                  _supply;
         const transfer_rounding_strategy&   _rounding;
   };

} } /// rebase::ledger
