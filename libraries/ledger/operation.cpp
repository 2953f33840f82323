#include <rebase/ledger/operation.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <limits>

namespace rebase { namespace ledger {

namespace {

   operation_kind parse_kind( string s ) {
      boost::algorithm::replace_all( s, "-", "_" );
      if( s == "mint" )          return operation_kind::mint;
      if( s == "burn" )          return operation_kind::burn;
      if( s == "transfer" )      return operation_kind::transfer;
      if( s == "opt_in" )        return operation_kind::opt_in;
      if( s == "opt_out" )       return operation_kind::opt_out;
      if( s == "change_supply" ) return operation_kind::change_supply;
      REBASE_THROW( operation_type_exception, "unknown operation '${s}'", ("s", s) );
   }

   size_t expected_arguments( operation_kind kind ) {
      switch( kind ) {
         case operation_kind::mint:
         case operation_kind::burn:          return 2;
         case operation_kind::transfer:      return 3;
         case operation_kind::opt_in:
         case operation_kind::opt_out:
         case operation_kind::change_supply: return 1;
      }
      return 0;
   }

}

uint256_t amount_from_string( const string& s ) {
   REBASE_ASSERT( !s.empty() && s.size() <= 78 && std::all_of( s.begin(), s.end(), []( char c ){ return c >= '0' && c <= '9'; } ),
                  operation_type_exception, "invalid amount '${s}'", ("s", s) );
   const uint512_t wide( s );
   REBASE_ASSERT( wide <= uint512_t( std::numeric_limits<uint256_t>::max() ), operation_type_exception,
                  "amount ${s} does not fit in 256 bits", ("s", s) );
   return static_cast<uint256_t>( wide );
}

ledger_operation ledger_operation::from_string( const string& s ) {
   vector<string> parts;
   const string trimmed = boost::algorithm::trim_copy( s );
   boost::algorithm::split( parts, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on );
   REBASE_ASSERT( !parts.empty() && !parts[0].empty(), operation_type_exception, "empty operation" );

   ledger_operation result;
   result.op = parse_kind( parts[0] );
   REBASE_ASSERT( parts.size() == expected_arguments( result.op ) + 1, operation_type_exception,
                  "operation '${s}' expects ${n} argument(s)", ("s", s)("n", expected_arguments( result.op )) );

   switch( result.op ) {
      case operation_kind::mint:
      case operation_kind::burn:
         result.account = name( parts[1] );
         result.amount = amount_from_string( parts[2] );
         break;
      case operation_kind::transfer:
         result.account = name( parts[1] );
         result.to = name( parts[2] );
         result.amount = amount_from_string( parts[3] );
         break;
      case operation_kind::opt_in:
      case operation_kind::opt_out:
         result.account = name( parts[1] );
         break;
      case operation_kind::change_supply:
         result.amount = amount_from_string( parts[1] );
         break;
   }
   return result;
}

} } /// rebase::ledger
