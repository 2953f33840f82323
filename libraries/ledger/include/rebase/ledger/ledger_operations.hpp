#pragma once
#include <rebase/ledger/transfer_engine.hpp>
#include <rebase/ledger/rebase_opt_controller.hpp>

namespace rebase { namespace ledger {

   /**
    * The mutating surface of the ledger. Implementations throw ledger_exception subclasses on
    * invalid input; atomicity is provided by the caller's undo session.
    */
   class ledger_operations {
      public:
         virtual ~ledger_operations() = default;

         virtual void mint( const account_name& account, const uint256_t& amount ) = 0;
         virtual void burn( const account_name& account, const uint256_t& amount ) = 0;
         virtual void transfer( const account_name& from, const account_name& to, const uint256_t& amount ) = 0;
         virtual void opt_in( const account_name& account ) = 0;
         virtual void opt_out( const account_name& account ) = 0;
         virtual void change_supply( const uint256_t& new_total_supply ) = 0;
   };

   class core_ledger_operations : public ledger_operations {
      public:
         core_ledger_operations( supply_controller& supply, transfer_engine& transfers, rebase_opt_controller& opt )
         :_supply(supply)
         ,_transfers(transfers)
         ,_opt(opt)
         {
         }

         void mint( const account_name& account, const uint256_t& amount ) override {
            _supply.mint( account, amount );
         }

         void burn( const account_name& account, const uint256_t& amount ) override {
            _supply.burn( account, amount );
         }

         void transfer( const account_name& from, const account_name& to, const uint256_t& amount ) override {
            _transfers.transfer( from, to, amount );
         }

         void opt_in( const account_name& account ) override {
            _opt.opt_in( account );
         }

         void opt_out( const account_name& account ) override {
            _opt.opt_out( account );
         }

         void change_supply( const uint256_t& new_total_supply ) override {
            _supply.change_supply( new_total_supply );
         }

      private:
         supply_controller&      _supply;
         transfer_engine&        _transfers;
         rebase_opt_controller&  _opt;
   };

} } /// rebase::ledger
