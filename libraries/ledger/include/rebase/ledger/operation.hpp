#pragma once
#include <rebase/ledger/trace.hpp>

namespace rebase { namespace ledger {

   /// parse a non-negative decimal amount, operation_type_exception unless it fits in 256 bits
   uint256_t amount_from_string( const string& s );

   /**
    * A serializable request for one ledger operation, as read from JSON or the command line.
    *
    * Fields not used by the kind are ignored: change_supply reads only amount, opt_in and
    * opt_out read only account, and only transfer reads to.
    */
   struct ledger_operation {
      operation_kind   op = operation_kind::mint;
      account_name     account;
      account_name     to;
      uint256_t        amount;

      /// parse "<kind> <args...>", e.g. "transfer alice bob 10" or "change_supply 500"
      static ledger_operation from_string( const string& s );
   };

} } /// rebase::ledger

FC_REFLECT( rebase::ledger::ledger_operation, (op)(account)(to)(amount) )
