#pragma once
#include <rebase/ledger/operation.hpp>
#include <rebase/ledger/ledger_strategies.hpp>
#include <rebase/ledger/config.hpp>

#include <boost/filesystem/path.hpp>

namespace chainbase {
   class database;
}

namespace rebase { namespace ledger {

   struct controller_impl;

   /**
    * Owns the ledger state and serializes every operation on it.
    *
    * Each mutating call runs inside an undo session that is committed when the operation succeeds
    * and rolled back when it throws. Failures never escape: they are reported in the returned
    * trace, so callers must check operation_trace::succeeded().
    */
   class controller {
      public:
         struct config {
            boost::filesystem::path  state_dir                 = ledger::config::default_state_dir_name;
            uint64_t                 state_size                = ledger::config::default_state_size;
            supply_change_mode       supply_change             = supply_change_mode::derived;
            transfer_rounding_mode   transfer_rounding         = transfer_rounding_mode::derived;
            burn_mode                burn                      = burn_mode::reject_dust;
            bool                     track_rounding_error      = false;
            uint256_t                initial_rebasing_credits_per_token = ledger::config::default_rebasing_credits_per_token;
            uint256_t                max_supply                = ledger::config::default_max_supply();

            /// throws ledger_config_exception
            void validate()const;
         };

         explicit controller( const config& cfg );
         ~controller();

         /// create the global state on a fresh state directory, resume an existing one otherwise
         void startup();

         operation_trace_ptr mint( const account_name& account, const uint256_t& amount );
         operation_trace_ptr burn( const account_name& account, const uint256_t& amount );
         operation_trace_ptr transfer( const account_name& from, const account_name& to, const uint256_t& amount );
         operation_trace_ptr opt_in( const account_name& account );
         operation_trace_ptr opt_out( const account_name& account );
         operation_trace_ptr change_supply( const uint256_t& new_total_supply );

         operation_trace_ptr push_operation( const ledger_operation& op );

         uint256_t                 balance_of( const account_name& account )const;
         pair<uint256_t, uint256_t> credits_balance_of( const account_name& account )const;
         bool                      is_non_rebasing( const account_name& account )const;

         /// cached total supply, plus the rounding error accumulator when tracking, floored at zero
         uint256_t                 total_supply()const;
         uint256_t                 cached_total_supply()const;
         uint256_t                 rebasing_credits()const;
         uint256_t                 rebasing_credits_per_token()const;
         uint256_t                 non_rebasing_supply()const;
         std::optional<int256_t>   rounding_error()const;

         supply_audit              audit()const;
         vector<account_summary>   get_accounts()const;

         const config&             get_config()const;
         const chainbase::database& db()const;

         static ledger_error convert_exception_to_error( const fc::exception& e );

      private:
         std::unique_ptr<controller_impl> my;
   };

} }  /// rebase::ledger
