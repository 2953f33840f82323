#pragma once
#include <rebase/ledger/types.hpp>
#include <rebase/ledger/config.hpp>

#include "multi_index_includes.hpp"

namespace rebase { namespace ledger {

   /**
    * One row per account that a mutating operation has touched. Rows are never removed; an
    * account holding zero credits is a valid terminal state.
    *
    * locked_credits_per_token is the multiplier captured when the account opted out of rebasing.
    * It is non-zero exactly when non_rebasing is set.
    */
   struct account_object : public chainbase::object<account_object_type, account_object> {
      OBJECT_CTOR(account_object)

      id_type        id;
      account_name   name; //< name should not be changed within a chainbase modifier lambda
      uint256_t      credits = 0;
      bool           non_rebasing = false;
      uint256_t      locked_credits_per_token = 0;
   };

   using account_index = chainbase::shared_multi_index_container<
      account_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<account_object, account_object::id_type, &account_object::id>>,
         ordered_unique<tag<by_name>, member<account_object, account_name, &account_object::name>>
      >
   >;

   /**
    * Singleton holding the aggregates of the ledger.
    *
    * total_supply is maintained explicitly by every operation and never derived by walking the
    * accounts. rounding_error is only written while rounding error tracking is enabled.
    */
   class ledger_global_object : public chainbase::object<ledger_global_object_type, ledger_global_object>
   {
      OBJECT_CTOR(ledger_global_object)

   public:
      id_type        id;
      uint256_t      rebasing_credits = 0;
      uint256_t      rebasing_credits_per_token = config::default_rebasing_credits_per_token;
      uint256_t      non_rebasing_supply = 0;
      uint256_t      total_supply = 0;
      int256_t       rounding_error = 0;
   };

   using ledger_global_index = chainbase::shared_multi_index_container<
      ledger_global_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<ledger_global_object, ledger_global_object::id_type, &ledger_global_object::id>>
      >
   >;

} } /// rebase::ledger

CHAINBASE_SET_INDEX_TYPE(rebase::ledger::account_object,       rebase::ledger::account_index)
CHAINBASE_SET_INDEX_TYPE(rebase::ledger::ledger_global_object, rebase::ledger::ledger_global_index)

FC_REFLECT(rebase::ledger::account_object, (name)(credits)(non_rebasing)(locked_credits_per_token))
FC_REFLECT(rebase::ledger::ledger_global_object, (rebasing_credits)(rebasing_credits_per_token)(non_rebasing_supply)(total_supply)(rounding_error))
