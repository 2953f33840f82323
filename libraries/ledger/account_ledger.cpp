#include <rebase/ledger/account_ledger.hpp>
#include <rebase/ledger/fixed_point.hpp>

#include <limits>

namespace rebase { namespace ledger {

using fixed_point::div_precisely;

void account_ledger::add_indices() {
   _db.add_index<account_index>();
}

const account_object* account_ledger::find_account( const account_name& account )const {
   return _db.find<account_object, by_name>( account );
}

const account_object& account_ledger::get_or_create_account( const account_name& account ) {
   const auto* existing = find_account( account );
   if( existing )
      return *existing;

   return _db.create<account_object>([&]( account_object& a ) {
      a.name = account;
      a.credits = 0;
      a.non_rebasing = false;
      a.locked_credits_per_token = 0;
   });
}

const uint256_t& account_ledger::global_credits_per_token()const {
   return _db.get<ledger_global_object>().rebasing_credits_per_token;
}

uint256_t account_ledger::credits_per_token( const account_object& account )const {
   if( account.non_rebasing )
      return account.locked_credits_per_token;
   return global_credits_per_token();
}

uint256_t account_ledger::credits_per_token( const account_name& account )const {
   const auto* a = find_account( account );
   if( a )
      return credits_per_token( *a );
   return global_credits_per_token();
}

uint256_t account_ledger::balance_of( const account_object& account )const {
   if( account.credits == 0 )
      return 0;
   return div_precisely( account.credits, credits_per_token( account ) );
}

uint256_t account_ledger::balance_of( const account_name& account )const {
   const auto* a = find_account( account );
   if( !a )
      return 0;
   return balance_of( *a );
}

pair<uint256_t, uint256_t> account_ledger::credits_balance_of( const account_name& account )const {
   const auto* a = find_account( account );
   if( !a )
      return { uint256_t(0), global_credits_per_token() };
   return { a->credits, credits_per_token( *a ) };
}

bool account_ledger::is_non_rebasing( const account_name& account )const {
   const auto* a = find_account( account );
   return a && a->non_rebasing;
}

namespace {
   /// credits above this bound have no representable balance under div_precisely
   const uint256_t& max_account_credits() {
      static const uint256_t bound = std::numeric_limits<uint256_t>::max() / config::precision;
      return bound;
   }

   void validate_account_credits( const account_object& account, const uint256_t& credits ) {
      REBASE_ASSERT( credits <= max_account_credits(), arithmetic_overflow_exception,
                     "account ${a} cannot hold ${c} credits, the limit is ${m}",
                     ("a", account.name)("c", credits.str())("m", max_account_credits().str()) );
   }
}

void account_ledger::add_credits( const account_object& account, const uint256_t& credits ) {
   const uint256_t updated = fixed_point::safe_add( account.credits, credits );
   validate_account_credits( account, updated );
   _db.modify( account, [&]( account_object& a ) {
      a.credits = updated;
   });
}

void account_ledger::sub_credits( const account_object& account, const uint256_t& credits ) {
   REBASE_ASSERT( account.credits >= credits, insufficient_credits_exception,
                  "account ${a} holds ${have} credits, cannot remove ${need}",
                  ("a", account.name)("have", account.credits.str())("need", credits.str()) );
   _db.modify( account, [&]( account_object& a ) {
      a.credits -= credits;
   });
}

void account_ledger::lock_credits_per_token( const account_object& account, const uint256_t& credits_per_token ) {
   REBASE_ASSERT( credits_per_token > 0, ledger_state_inconsistent,
                  "cannot lock account ${a} to a zero multiplier", ("a", account.name) );
   _db.modify( account, [&]( account_object& a ) {
      a.non_rebasing = true;
      a.locked_credits_per_token = credits_per_token;
   });
}

void account_ledger::unlock_credits_per_token( const account_object& account, const uint256_t& credits ) {
   validate_account_credits( account, credits );
   _db.modify( account, [&]( account_object& a ) {
      a.credits = credits;
      a.non_rebasing = false;
      a.locked_credits_per_token = 0;
   });
}

size_t account_ledger::account_count()const {
   return _db.get_index<account_index>().indices().size();
}

} } /// rebase::ledger
