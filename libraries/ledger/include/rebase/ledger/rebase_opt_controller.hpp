#pragma once
#include <rebase/ledger/supply_controller.hpp>

namespace rebase { namespace ledger {

   /**
    * Moves accounts between the rebasing and non-rebasing populations.
    *
    * opt_out freezes the balance of an account by locking the multiplier its credits are
    * expressed in. opt_in re-expresses the credits at the current global multiplier so the
    * account resumes sharing in supply changes.
    */
   class rebase_opt_controller {
      public:
         rebase_opt_controller( account_ledger& accounts, supply_controller& supply )
         :_accounts(accounts)
         ,_supply(supply)
         {
         }

         void opt_out( const account_name& account );
         void opt_in( const account_name& account );

      private:
         account_ledger&     _accounts;
         supply_controller&  _supply;
   };

} } /// rebase::ledger
