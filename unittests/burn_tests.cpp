#include <boost/test/unit_test.hpp>
#include "ledger_tester.hpp"

using namespace rebase::ledger;
using namespace rebase::ledger::testing;

BOOST_AUTO_TEST_SUITE(burn_tests)

BOOST_FIXTURE_TEST_CASE(burn_rebasing_balance, ledger_tester) try {
   mint( "alice"_n, 10 );
   burn( "alice"_n, 4 );

   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 6 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 6 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 6 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 6 );

   burn( "alice"_n, 6 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 0 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 0 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(burn_zero_is_noop, ledger_tester) try {
   mint( "alice"_n, 10 );
   const auto before = chain().audit();

   auto trace = burn( "alice"_n, 0 );
   const auto after = chain().audit();
   BOOST_REQUIRE_EQUAL( after.sum_of_balances, before.sum_of_balances );
   BOOST_REQUIRE_EQUAL( after.cached_total_supply, before.cached_total_supply );
   BOOST_REQUIRE_EQUAL( trace->account_deltas[0].balance_before, trace->account_deltas[0].balance_after );

   // burning nothing from an account that does not exist does not create it
   burn( "bob"_n, 0 );
   BOOST_REQUIRE_EQUAL( chain().get_accounts().size(), 1u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(burn_more_than_balance, ledger_tester) try {
   mint( "alice"_n, 10 );

   require_error( chain().burn( "alice"_n, 11 ), ledger_error::insufficient_balance );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 10 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 10 );

   require_error( chain().burn( "bob"_n, 1 ), ledger_error::insufficient_balance );
   BOOST_REQUIRE_EQUAL( chain().get_accounts().size(), 1u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(burn_bounded_by_balance, ledger_tester) try {
   mint( "alice"_n, 2 );
   mint( "bob"_n, 148 );
   change_supply( 200 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits_per_token(), uint256_t("750000000000000000") );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 2 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 2 );

   // 3 tokens truncate to the 2 credits alice holds, but exceed her balance
   require_error( chain().burn( "alice"_n, 3 ), ledger_error::insufficient_balance );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 2 );

   burn( "alice"_n, 2 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 1 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 1 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(dust_burn_rejected, ledger_tester) try {
   mint( "alice"_n, 50 );
   change_supply( 100 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits_per_token(), precision() / 2 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 100 );

   require_error( chain().burn( "alice"_n, 1 ), ledger_error::dust_amount_burn );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 100 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 100 );

   // two tokens are one credit
   burn( "alice"_n, 2 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 98 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 98 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(dust_burn_naive, naive_burn_tester) try {
   mint( "alice"_n, 50 );
   change_supply( 100 );

   burn( "alice"_n, 1 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 100 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 50 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 99 );
   BOOST_REQUIRE_EQUAL( chain().audit().cached_gap, int256_t(-1) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(burn_non_rebasing_balance, ledger_tester) try {
   mint( "alice"_n, 10 );
   mint( "bob"_n, 10 );
   change_supply( 10 );
   opt_out( "alice"_n );
   BOOST_REQUIRE_EQUAL( chain().non_rebasing_supply(), 5 );

   burn( "alice"_n, 3 );
   BOOST_REQUIRE_EQUAL( credits( "alice"_n ), 4 );
   BOOST_REQUIRE_EQUAL( balance( "alice"_n ), 2 );
   BOOST_REQUIRE_EQUAL( chain().non_rebasing_supply(), 2 );
   BOOST_REQUIRE_EQUAL( chain().rebasing_credits(), 10 );
   BOOST_REQUIRE_EQUAL( chain().total_supply(), 7 );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(failed_burn_leaves_state_unchanged, ledger_tester) try {
   mint( "alice"_n, 50 );
   change_supply( 100 );
   const auto before = chain().audit();

   auto trace = chain().burn( "alice"_n, 1 );
   BOOST_REQUIRE( !trace->succeeded() );
   BOOST_REQUIRE( trace->except.has_value() );
   BOOST_REQUIRE_EQUAL( trace->except->code(), dust_amount_burn_exception::code_value );

   const auto after = chain().audit();
   BOOST_REQUIRE_EQUAL( after.sum_of_balances, before.sum_of_balances );
   BOOST_REQUIRE_EQUAL( after.cached_total_supply, before.cached_total_supply );
   BOOST_REQUIRE_EQUAL( after.rebasing_credits, before.rebasing_credits );
   BOOST_REQUIRE_EQUAL( trace->total_supply, 100 );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
