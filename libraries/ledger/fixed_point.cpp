#include <rebase/ledger/fixed_point.hpp>

namespace rebase { namespace ledger { namespace fixed_point {

static_assert( config::precision > 0, "config::precision must be positive" );

uint256_t mul_truncate( const uint256_t& x, const uint256_t& multiplier ) {
   const uint512_t product = uint512_t(x) * uint512_t(multiplier);
   REBASE_ASSERT( product <= uint512_t( std::numeric_limits<uint256_t>::max() ), arithmetic_overflow_exception,
                  "${x} * ${m} overflows 256 bits", ("x", x.str())("m", multiplier.str()) );
   return impl::downgrade_cast( product / config::precision );
}

uint256_t div_precisely( const uint256_t& x, const uint256_t& divisor ) {
   REBASE_ASSERT( divisor > 0, division_by_zero_exception, "cannot divide ${x} by zero", ("x", x.str()) );
   const uint512_t scaled = uint512_t(x) * config::precision;
   REBASE_ASSERT( scaled <= uint512_t( std::numeric_limits<uint256_t>::max() ), arithmetic_overflow_exception,
                  "${x} scaled by precision overflows 256 bits", ("x", x.str()) );
   return impl::downgrade_cast( scaled / uint512_t(divisor) );
}

uint256_t safe_add( const uint256_t& a, const uint256_t& b ) {
   REBASE_ASSERT( a <= std::numeric_limits<uint256_t>::max() - b, arithmetic_overflow_exception,
                  "${a} + ${b} overflows 256 bits", ("a", a.str())("b", b.str()) );
   return a + b;
}

uint256_t safe_sub( const uint256_t& a, const uint256_t& b, const char* what ) {
   REBASE_ASSERT( b <= a, ledger_state_inconsistent,
                  "${what} would become negative: ${a} - ${b}", ("what", what)("a", a.str())("b", b.str()) );
   return a - b;
}

uint256_t apply_delta( const uint256_t& value, const int256_t& delta, const char* what ) {
   if( delta >= 0 )
      return safe_add( value, static_cast<uint256_t>( delta ) );
   return safe_sub( value, static_cast<uint256_t>( -delta ), what );
}

int256_t signed_delta( const uint256_t& before, const uint256_t& after ) {
   if( after >= before )
      return static_cast<int256_t>( after - before );
   return -static_cast<int256_t>( before - after );
}

} } } /// rebase::ledger::fixed_point
