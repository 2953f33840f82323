#pragma once
#include <rebase/ledger/types.hpp>

#include <fc/exception/exception.hpp>

namespace rebase { namespace ledger {

   enum class operation_kind {
      mint,
      burn,
      transfer,
      opt_in,
      opt_out,
      change_supply
   };

   /**
    * Failure kinds reported in operation traces, one per leaf of the ledger exception hierarchy
    * that an operation can raise.
    */
   enum class ledger_error {
      arithmetic_overflow,
      division_by_zero,
      insufficient_balance,
      insufficient_credits,
      dust_amount_burn,
      already_in_state,
      invalid_supply_change,
      state_inconsistent,
      unknown
   };

   struct account_balance_delta {
      account_name   account;
      uint256_t      balance_before;
      uint256_t      balance_after;
      bool           non_rebasing = false;
   };

   struct operation_trace;
   using operation_trace_ptr = std::shared_ptr<operation_trace>;

   struct operation_trace {
      uint64_t                         sequence = 0;
      operation_kind                   kind = operation_kind::mint;
      vector<account_balance_delta>    account_deltas;
      uint256_t                        rebasing_credits_per_token;
      uint256_t                        total_supply;
      int256_t                         rounding_error_delta;
      std::optional<fc::exception>     except;
      std::optional<ledger_error>      error;

      bool succeeded()const { return !except; }
   };

   struct account_summary {
      account_name   account;
      uint256_t      credits;
      uint256_t      balance;
      bool           non_rebasing = false;
      uint256_t      locked_credits_per_token;
   };

   /**
    * O(n) comparison of the cached aggregates against the live balances.
    */
   struct supply_audit {
      uint64_t    accounts = 0;
      uint256_t   sum_of_balances;
      uint256_t   cached_total_supply;
      uint256_t   reported_total_supply;
      int256_t    rounding_error;
      uint256_t   rebasing_credits;
      uint256_t   sum_of_rebasing_credits;
      uint256_t   non_rebasing_supply;
      uint256_t   sum_of_non_rebasing_balances;
      int256_t    cached_gap;   ///< cached_total_supply - sum_of_balances
      int256_t    reported_gap; ///< reported_total_supply - sum_of_balances
   };

} }  /// namespace rebase::ledger

FC_REFLECT_ENUM( rebase::ledger::operation_kind, (mint)(burn)(transfer)(opt_in)(opt_out)(change_supply) )
FC_REFLECT_ENUM( rebase::ledger::ledger_error,
                 (arithmetic_overflow)(division_by_zero)(insufficient_balance)(insufficient_credits)
                 (dust_amount_burn)(already_in_state)(invalid_supply_change)(state_inconsistent)(unknown) )

FC_REFLECT( rebase::ledger::account_balance_delta,
            (account)(balance_before)(balance_after)(non_rebasing) )
FC_REFLECT( rebase::ledger::operation_trace,
            (sequence)(kind)(account_deltas)(rebasing_credits_per_token)(total_supply)(rounding_error_delta)(except)(error) )
FC_REFLECT( rebase::ledger::account_summary,
            (account)(credits)(balance)(non_rebasing)(locked_credits_per_token) )
FC_REFLECT( rebase::ledger::supply_audit,
            (accounts)(sum_of_balances)(cached_total_supply)(reported_total_supply)(rounding_error)
            (rebasing_credits)(sum_of_rebasing_credits)(non_rebasing_supply)(sum_of_non_rebasing_balances)
            (cached_gap)(reported_gap) )
