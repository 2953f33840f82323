#pragma once
#include <rebase/ledger/ledger_objects.hpp>
#include <rebase/ledger/exceptions.hpp>

namespace rebase { namespace ledger {

   /**
    * Per account credit storage and rebasing classification.
    *
    * Credits are the internal unit; a balance is derived from them through the multiplier that
    * applies to the account: the global one for rebasing accounts, the locked snapshot for
    * non-rebasing accounts. Only supply_controller, transfer_engine and rebase_opt_controller
    * mutate credits.
    */
   class account_ledger {
      public:
         explicit account_ledger(chainbase::database& db)
         :_db(db)
         {
         }

         void add_indices();

         const account_object* find_account( const account_name& account )const;
         const account_object& get_or_create_account( const account_name& account );

         uint256_t credits_per_token( const account_object& account )const;
         uint256_t credits_per_token( const account_name& account )const;

         /// unknown accounts have a balance of zero and are not created
         uint256_t balance_of( const account_object& account )const;
         uint256_t balance_of( const account_name& account )const;

         /// @return (credits, credits_per_token)
         pair<uint256_t, uint256_t> credits_balance_of( const account_name& account )const;

         bool is_non_rebasing( const account_name& account )const;

         /// arithmetic_overflow_exception when the resulting credits no longer map to a balance
         void add_credits( const account_object& account, const uint256_t& credits );
         void sub_credits( const account_object& account, const uint256_t& credits );

         /// switch the account to non-rebasing, remembering the multiplier its credits are expressed in
         void lock_credits_per_token( const account_object& account, const uint256_t& credits_per_token );
         /// switch the account back to rebasing with credits re-expressed at the global multiplier
         void unlock_credits_per_token( const account_object& account, const uint256_t& credits );

         /**
          * Visit every account in name order. O(n); reserved for audits.
          */
         template<typename Function>
         void walk_accounts( Function&& f )const {
            const auto& idx = _db.get_index<account_index, by_name>();
            for( const auto& a : idx ) {
               f( a );
            }
         }

         size_t account_count()const;

      private:
         const uint256_t& global_credits_per_token()const;

         chainbase::database& _db;
   };

} } /// rebase::ledger
