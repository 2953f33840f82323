#pragma once
#include <rebase/ledger/types.hpp>
#include <rebase/ledger/config.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <limits>

namespace rebase { namespace ledger { namespace fixed_point {

   /**
    * @return floor( x * multiplier / precision )
    *
    * The product is formed in 512 bits; throws arithmetic_overflow_exception when it does not fit
    * back into 256 bits.
    */
   uint256_t mul_truncate( const uint256_t& x, const uint256_t& multiplier );

   /**
    * @return floor( x * precision / divisor )
    *
    * Throws division_by_zero_exception when divisor is zero and arithmetic_overflow_exception when
    * x * precision does not fit in 256 bits.
    */
   uint256_t div_precisely( const uint256_t& x, const uint256_t& divisor );

   /// checked a + b, arithmetic_overflow_exception on overflow
   uint256_t safe_add( const uint256_t& a, const uint256_t& b );

   /// checked a - b, ledger_state_inconsistent when b > a
   uint256_t safe_sub( const uint256_t& a, const uint256_t& b, const char* what );

   /// value + delta for a signed delta, with the checks of safe_add and safe_sub
   uint256_t apply_delta( const uint256_t& value, const int256_t& delta, const char* what );

   /// after - before as a signed quantity
   int256_t signed_delta( const uint256_t& before, const uint256_t& after );

   namespace impl {
      /**
       * Narrow a 512 bit intermediate back into 256 bits.
       */
      inline uint256_t downgrade_cast( const uint512_t& val ) {
         static const uint512_t max = uint512_t( std::numeric_limits<uint256_t>::max() );
         REBASE_ASSERT( val <= max, arithmetic_overflow_exception,
                        "Casting a 512 bit value ${v} to 256 bits which cannot contain the value",
                        ("v", val.str()) );
         return static_cast<uint256_t>( val );
      }
   }

} } } /// rebase::ledger::fixed_point
