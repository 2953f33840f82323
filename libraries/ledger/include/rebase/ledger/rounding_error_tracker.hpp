#pragma once
#include <rebase/ledger/ledger_operations.hpp>

namespace rebase { namespace ledger {

   /**
    * Wraps the ledger operations and records the rounding error each of them introduces.
    *
    * For every mint, burn and transfer the accumulator receives the change of the sum of the
    * touched balances minus the change of the cached total supply, so that cached total supply
    * plus the accumulator follows the sum of balances across those operations.
    *
    * change_supply, opt_in and opt_out pass through unrecorded. Measuring the error of a supply
    * change would mean reading every rebasing balance.
    */
   class rounding_error_tracker : public ledger_operations {
      public:
         rounding_error_tracker( ledger_operations& inner, account_ledger& accounts, supply_controller& supply )
         :_inner(inner)
         ,_accounts(accounts)
         ,_supply(supply)
         {
         }

         void mint( const account_name& account, const uint256_t& amount ) override;
         void burn( const account_name& account, const uint256_t& amount ) override;
         void transfer( const account_name& from, const account_name& to, const uint256_t& amount ) override;

         void opt_in( const account_name& account ) override {
            _inner.opt_in( account );
         }

         void opt_out( const account_name& account ) override {
            _inner.opt_out( account );
         }

         void change_supply( const uint256_t& new_total_supply ) override {
            _inner.change_supply( new_total_supply );
         }

         const int256_t& rounding_error()const;

      private:
         ledger_operations&   _inner;
         account_ledger&      _accounts;
         supply_controller&   _supply;
   };

} } /// rebase::ledger
