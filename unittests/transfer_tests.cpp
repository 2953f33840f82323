#include <boost/test/unit_test.hpp>
#include "ledger_tester.hpp"

using namespace rebase::ledger;
using namespace rebase::ledger::testing;

namespace {
   /**
    * alice is locked at 2 * 10^18 holding 10 credits (balance 5) and bob is rebasing at
    * 1.25 * 10^18 holding 10 credits (balance 8).
    */
   void setup_mismatched_multipliers( ledger_tester& t ) {
      t.mint( "alice"_n, 10 );
      t.mint( "bob"_n, 10 );
      t.change_supply( 10 );
      t.opt_out( "alice"_n );
      t.change_supply( 13 );

      BOOST_REQUIRE_EQUAL( t.chain().rebasing_credits_per_token(), uint256_t("1250000000000000000") );
      BOOST_REQUIRE_EQUAL( t.balance( "alice"_n ), 5 );
      BOOST_REQUIRE_EQUAL( t.balance( "bob"_n ), 8 );
   }
}

BOOST_AUTO_TEST_SUITE(transfer_tests)

BOOST_FIXTURE_TEST_CASE(transfer_between_rebasing_accounts, ledger_tester) try {
   mint( "alice"_n, 100 );
   auto trace = transfer( "alice"_n, "bob"_n, 40 );

   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 60 );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 40 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 100 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 100 );

   BOOST_REQUIRE_EQUAL( trace->account_deltas.size(), 2u );
   BOOST_REQUIRE( trace->account_deltas[0].account == "alice"_n );
   BOOST_REQUIRE_EQUAL( trace->account_deltas[0].balance_before, 100 );
   BOOST_REQUIRE_EQUAL( trace->account_deltas[0].balance_after, 60 );
   BOOST_REQUIRE( trace->account_deltas[1].account == "bob"_n );
   BOOST_REQUIRE_EQUAL( trace->account_deltas[1].balance_before, 0 );
   BOOST_REQUIRE_EQUAL( trace->account_deltas[1].balance_after, 40 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(equal_whole_multipliers_move_exact_amount, ledger_tester) try {
   mint( "alice"_n, 10 );
   mint( "bob"_n, 10 );
   change_supply( 10 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits_per_token(), uint256_t(2) * precision() );

   transfer( "alice"_n, "bob"_n, 3 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 2 );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 8 );
   BOOST_REQUIRE_EQUAL( sum_of_balances(), 10 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(derived_rounding_across_multipliers, ledger_tester) try {
   setup_mismatched_multipliers( *this );

   transfer( "alice"_n, "bob"_n, 2 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 4 );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 9 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 8 );
   BOOST_REQUIRE_EQUAL( credits( "bob"_n ), 12 );

   // the non-rebasing side moves by the balance it actually lost
   BOOST_REQUIRE_EQUAL( chain().non_rebasing_supply(), 4 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 12 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(independent_rounding_across_multipliers, independent_rounding_tester) try {
   setup_mismatched_multipliers( *this );

   auto trace = transfer( "alice"_n, "bob"_n, 2 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 3 );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 9 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 6 );
   BOOST_REQUIRE_EQUAL( credits( "bob"_n ), 12 );

   // one unit disappeared and the tracker records it
   BOOST_REQUIRE_EQUAL( trace->rounding_error_delta, int256_t(-1) );
   BOOST_REQUIRE_EQUAL( chain().non_rebasing_supply(), 3 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(derived_rounding_toward_non_rebasing, ledger_tester) try {
   setup_mismatched_multipliers( *this );

   // bob (1.25) to alice (2.0): the sender side is computed first
   transfer( "bob"_n, "alice"_n, 4 );
   BOOST_REQUIRE_EQUAL( credits( "bob"_n ), 5 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 18 );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 4 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 9 );
   BOOST_REQUIRE_EQUAL( chain().non_rebasing_supply(), 9 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 5 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(transfer_more_than_balance, ledger_tester) try {
   mint( "alice"_n, 10 );

   require_error( chain().transfer( "alice"_n, "bob"_n, 11 ), ledger_error::insufficient_balance );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 10 );

   require_error( chain().transfer( "carol"_n, "bob"_n, 1 ), ledger_error::insufficient_balance );
   BOOST_REQUIRE_EQUAL( chain().get_accounts().size(), 1u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(transfer_to_self, ledger_tester) try {
   mint( "alice"_n, 10 );
   change_supply( 15 );
   const auto before = balance( "alice"_n );

   auto trace = transfer( "alice"_n, "alice"_n, 7 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), before );
   BOOST_REQUIRE_EQUAL( trace->account_deltas.size(), 1u );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 10 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(transfer_between_non_rebasing_accounts, ledger_tester) try {
   mint( "alice"_n, 10 );
   mint( "bob"_n, 10 );
   opt_out( "alice"_n );
   opt_out( "bob"_n );

   transfer( "alice"_n, "bob"_n, 4 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 6 );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 14 );
   BOOST_REQUIRE_EQUAL( chain().non_rebasing_supply(), 20 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 0 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 20 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(zero_transfer_creates_recipient, ledger_tester) try {
   mint( "alice"_n, 1 );
   transfer( "alice"_n, "bob"_n, 0 );
   BOOST_REQUIRE_EQUAL( chain().get_accounts().size(), 2u );
   BOOST_REQUIRE_EQUAL( balance( "bob"_n ), 0 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(zero_transfer_from_unknown_sender, ledger_tester) try {
   auto trace = transfer( "carol"_n, "dave"_n, 0 );
   BOOST_REQUIRE_EQUAL( trace->account_deltas.size(), 2u );

   const auto accounts = chain().get_accounts();
   BOOST_REQUIRE_EQUAL( accounts.size(), 2u );
   BOOST_REQUIRE( accounts[0].account == "carol"_n );
   BOOST_REQUIRE( accounts[1].account == "dave"_n );
   BOOST_REQUIRE_EQUAL( accounts[0].credits, 0 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 0 );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
