#include <boost/test/unit_test.hpp>
#include <rebase/ledger/fixed_point.hpp>

using namespace rebase::ledger;
using namespace rebase::ledger::fixed_point;

BOOST_AUTO_TEST_SUITE(fixed_point_tests)

static const uint256_t P = config::precision;
static const uint256_t u256max = std::numeric_limits<uint256_t>::max();

BOOST_AUTO_TEST_CASE(mul_truncate_test) try {
   BOOST_REQUIRE_EQUAL( mul_truncate( 0, P ), 0 );
   BOOST_REQUIRE_EQUAL( mul_truncate( 10, P ), 10 );
   BOOST_REQUIRE_EQUAL( mul_truncate( 10, 2 * P ), 20 );
   BOOST_REQUIRE_EQUAL( mul_truncate( 1, P / 2 ), 0 );        // 0.5 truncates to zero
   BOOST_REQUIRE_EQUAL( mul_truncate( 3, P / 2 ), 1 );        // 1.5
   BOOST_REQUIRE_EQUAL( mul_truncate( 2, uint256_t("1250000000000000000") ), 2 ); // 2.5
   BOOST_REQUIRE_EQUAL( mul_truncate( 10, uint256_t("666666666666666666") ), 6 );

   // the product may use the full 256 bits before scaling back down
   BOOST_REQUIRE_EQUAL( mul_truncate( u256max / P, P ), u256max / P );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(mul_truncate_overflow_test) try {
   BOOST_CHECK_THROW( mul_truncate( u256max, 2 ), arithmetic_overflow_exception );
   BOOST_CHECK_THROW( mul_truncate( u256max / P + 1, P ), arithmetic_overflow_exception );
   BOOST_CHECK_THROW( mul_truncate( uint256_t(1) << 200, uint256_t(1) << 60 ), arithmetic_overflow_exception );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(div_precisely_test) try {
   BOOST_REQUIRE_EQUAL( div_precisely( 0, P ), 0 );
   BOOST_REQUIRE_EQUAL( div_precisely( 10, P ), 10 );
   BOOST_REQUIRE_EQUAL( div_precisely( 10, 2 * P ), 5 );
   BOOST_REQUIRE_EQUAL( div_precisely( 5, 2 * P ), 2 );       // 2.5 truncates
   BOOST_REQUIRE_EQUAL( div_precisely( 2, uint256_t("666666666666666666") ), 3 );
   BOOST_REQUIRE_EQUAL( div_precisely( 1, uint256_t("666666666666666666") ), 1 );
   BOOST_REQUIRE_EQUAL( div_precisely( 2, 3 ), uint256_t("666666666666666666") );

   // the multiplier scenarios: rebasing credits / remaining supply
   BOOST_REQUIRE_EQUAL( div_precisely( 2, 3 * P ), 0 );
   BOOST_REQUIRE_EQUAL( div_precisely( 20, 2 * P ), 10 );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(div_precisely_failures_test) try {
   BOOST_CHECK_THROW( div_precisely( 1, 0 ), division_by_zero_exception );
   BOOST_CHECK_THROW( div_precisely( 0, 0 ), division_by_zero_exception );
   BOOST_CHECK_THROW( div_precisely( u256max, P ), arithmetic_overflow_exception );
   BOOST_CHECK_THROW( div_precisely( u256max / P + 1, 1 ), arithmetic_overflow_exception );

   // largest dividend that still scales
   BOOST_REQUIRE_EQUAL( div_precisely( u256max / P, P ), u256max / P );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(rounds_toward_zero_test) try {
   // a round trip through both operators never creates value
   for( uint64_t x : { 1ULL, 7ULL, 99ULL, 1000001ULL } ) {
      for( const uint256_t& m : { P, uint256_t(P / 3), uint256_t(2 * P), uint256_t("1250000000000000000"), uint256_t("333333333") } ) {
         BOOST_TEST( div_precisely( mul_truncate( x, m ), m ) <= x );
         if( m >= P ) {
            BOOST_TEST( mul_truncate( div_precisely( x, m ), m ) <= x );
         }
      }
   }
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(checked_aggregate_test) try {
   BOOST_REQUIRE_EQUAL( safe_add( 1, 2 ), 3 );
   BOOST_REQUIRE_EQUAL( safe_add( u256max - 1, 1 ), u256max );
   BOOST_CHECK_THROW( safe_add( u256max, 1 ), arithmetic_overflow_exception );

   BOOST_REQUIRE_EQUAL( safe_sub( 5, 5, "test" ), 0 );
   BOOST_CHECK_THROW( safe_sub( 4, 5, "test" ), ledger_state_inconsistent );

   BOOST_REQUIRE_EQUAL( apply_delta( 10, int256_t(5), "test" ), 15 );
   BOOST_REQUIRE_EQUAL( apply_delta( 10, int256_t(-10), "test" ), 0 );
   BOOST_CHECK_THROW( apply_delta( 10, int256_t(-11), "test" ), ledger_state_inconsistent );
   BOOST_CHECK_THROW( apply_delta( u256max, int256_t(1), "test" ), arithmetic_overflow_exception );

   BOOST_REQUIRE_EQUAL( signed_delta( 3, 10 ), int256_t(7) );
   BOOST_REQUIRE_EQUAL( signed_delta( 10, 3 ), int256_t(-7) );
   BOOST_REQUIRE_EQUAL( signed_delta( 0, u256max ), static_cast<int256_t>( u256max ) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
