#include <boost/test/unit_test.hpp>
#include <rebase/ledger/name.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <fc/variant.hpp>

using namespace rebase::ledger;

BOOST_AUTO_TEST_SUITE(name_test)

static constexpr uint64_t u64min = std::numeric_limits<uint64_t>::min(); // 0ULL
static constexpr uint64_t u64max = std::numeric_limits<uint64_t>::max(); // 18446744073709551615ULL

BOOST_AUTO_TEST_CASE(ctor_test) {
try {

   BOOST_TEST( name{}.to_uint64_t() == u64min );

   BOOST_TEST( name{u64min}.to_uint64_t() == u64min );
   BOOST_TEST( name{1ULL}.to_uint64_t() == 1ULL );
   BOOST_TEST( name{u64max}.to_uint64_t() == u64max );

   // exact uint64_t representations of the given strings
   BOOST_TEST( name{"1"}.to_uint64_t() == 576460752303423488ULL );
   BOOST_TEST( name{"a"}.to_uint64_t() == 3458764513820540928ULL );
   BOOST_TEST( name{"z"}.to_uint64_t() == 17870283321406128128ULL );
   BOOST_TEST( name{"abc"}.to_uint64_t() == 3589368903014285312ULL );
   BOOST_TEST( name{".abc"}.to_uint64_t() == 112167778219196416ULL );
   BOOST_TEST( name{"123."}.to_uint64_t() == 614178399182651392ULL );
   BOOST_TEST( name{"abc.123"}.to_uint64_t() == 3589369488740450304ULL );
   BOOST_TEST( name{"12345abcdefgj"}.to_uint64_t() == 614251623682315983ULL );
   BOOST_TEST( name{"zzzzzzzzzzzzj"}.to_uint64_t() == u64max );

   BOOST_CHECK_THROW( name{"-1"}, name_type_exception );
   BOOST_CHECK_THROW( name{"0"}, name_type_exception );
   BOOST_CHECK_THROW( name{"6"}, name_type_exception );
   BOOST_CHECK_THROW( name{"Alice"}, name_type_exception );
   BOOST_CHECK_THROW( name{"bob_1"}, name_type_exception );
   BOOST_CHECK_THROW( name{"111111111111k"}, name_type_exception );
   BOOST_CHECK_THROW( name{"zzzzzzzzzzzzk"}, name_type_exception );
   BOOST_CHECK_THROW( name{"12345abcdefghj"}, name_type_exception );

} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(char_to_symbol_test) {
try {
   char c{'.'};
   uint8_t expected_value{}; // increments through [0,32)
   BOOST_TEST( char_to_symbol(c) == expected_value );
   ++expected_value;

   for(c = '1'; c <= '5'; ++c) {
      BOOST_TEST( char_to_symbol(c) == expected_value );
      ++expected_value;
   }

   for(c = 'a'; c <= 'z'; ++c) {
      BOOST_TEST( char_to_symbol(c) == expected_value );
      ++expected_value;
   }

   BOOST_TEST( !is_string_valid_name( "fuzz-a" ) );
   BOOST_TEST( is_string_valid_name( "fuzz.a" ) );
   BOOST_TEST( is_string_valid_name( "" ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(to_string_test) {
try {
   BOOST_TEST( name{"1"}.to_string() == "1" );
   BOOST_TEST( name{"alice"}.to_string() == "alice" );
   BOOST_TEST( name{".abc"}.to_string() == ".abc" );
   BOOST_TEST( name{"123."}.to_string() == "123" );
   BOOST_TEST( name{"123........."}.to_string() == "123" );
   BOOST_TEST( name{".a.b.c.1.2.3."}.to_string() == ".a.b.c.1.2.3" );
   BOOST_TEST( name{"tuvwxyz.1234j"}.to_string() == "tuvwxyz.1234j" );
   BOOST_TEST( name{"zzzzzzzzzzzzj"}.to_string() == "zzzzzzzzzzzzj" );
   BOOST_TEST( name{""}.to_string() == "" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(operators_test) {
try {
   BOOST_TEST( name{0}.operator bool() == false );
   BOOST_TEST( name{0}.empty() == true );
   BOOST_TEST( name{"1"}.good() == true );

   BOOST_TEST( name{"123."} == name{"123"} );
   BOOST_TEST( name{"alice"} != name{"bob"} );
   BOOST_TEST( name{"alice"} < name{"bob"} );
   BOOST_TEST( name{"bob"} > name{"alice"} );
   BOOST_TEST( name{"alice"} <= name{"alice"} );
   BOOST_TEST( name{"zzzzzzzzzzzzj"} >= name{"111111111111j"} );

   BOOST_TEST( "alice"_n == name{"alice"} );
   BOOST_TEST( "fuzz.a"_n == name{"fuzz.a"} );
   BOOST_TEST( string_to_name("carol") == "carol"_n );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(variant_test) {
try {
   fc::variant v;
   fc::to_variant( "alice"_n, v );
   BOOST_TEST( v.get_string() == "alice" );

   name n;
   fc::from_variant( fc::variant("bob"), n );
   BOOST_TEST( n == "bob"_n );

   BOOST_CHECK_THROW( fc::from_variant( fc::variant("Bob"), n ), name_type_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
