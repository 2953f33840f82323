#pragma once
#include <rebase/ledger/account_ledger.hpp>
#include <rebase/ledger/ledger_strategies.hpp>

namespace rebase { namespace ledger {

   /**
    * Owns the global multiplier and the cached supply aggregates.
    *
    * change_supply redistributes yield to every rebasing account in O(1) by moving the global
    * multiplier. The sum of rebasing balances may then fall short of the cached supply by up to
    * one unit per account; that shortfall is not observable here without walking every account.
    */
   class supply_controller {
      public:
         supply_controller( chainbase::database& db, account_ledger& accounts,
                            const supply_change_strategy& supply_change, const burn_policy& burn,
                            const uint256_t& max_supply )
         :_db(db)
         ,_accounts(accounts)
         ,_supply_change(supply_change)
         ,_burn(burn)
         ,_max_supply(max_supply)
         {
         }

         void add_indices();
         void initialize_database( const uint256_t& initial_rebasing_credits_per_token );

         const ledger_global_object& get_global()const;

         void change_supply( const uint256_t& new_total_supply );
         void mint( const account_name& account, const uint256_t& amount );
         void burn( const account_name& account, const uint256_t& amount );

         /// cached total supply adjusted by the rounding error accumulator, floored at zero
         uint256_t reported_total_supply( bool include_rounding_error )const;

         void add_rebasing_credits( const uint256_t& credits );
         void sub_rebasing_credits( const uint256_t& credits );
         void adjust_non_rebasing_supply( const int256_t& delta );
         void adjust_total_supply( const int256_t& delta );
         void record_rounding_error( const int256_t& delta );

         const uint256_t& max_supply()const { return _max_supply; }

      private:
         chainbase::database&              _db;
         account_ledger&                   _accounts;
         const supply_change_strategy&     _supply_change;
         const burn_policy&                _burn;
         uint256_t                         _max_supply;
   };

} } /// rebase::ledger
