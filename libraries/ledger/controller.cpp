#include <rebase/ledger/controller.hpp>
#include <rebase/ledger/rounding_error_tracker.hpp>
#include <rebase/ledger/fixed_point.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <chainbase/chainbase.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>
#include <mutex>

namespace rebase { namespace ledger {

using chainbase::database;

void controller::config::validate()const {
   REBASE_ASSERT( !state_dir.empty(), ledger_config_exception, "state directory must be set" );
   REBASE_ASSERT( state_size >= ledger::config::_MB, ledger_config_exception,
                  "state size ${s} is below the minimum of 1 MiB", ("s", state_size) );
   REBASE_ASSERT( initial_rebasing_credits_per_token > 0, ledger_config_exception,
                  "initial rebasing credits per token must be positive" );
   REBASE_ASSERT( max_supply > 0, ledger_config_exception, "max supply must be positive" );
}

namespace {
   const controller::config& validated( const controller::config& cfg ) {
      cfg.validate();
      return cfg;
   }
}

struct controller_impl {
   const controller::config            conf;
   database                            db;
   account_ledger                      accounts;
   std::unique_ptr<supply_change_strategy>     supply_change;
   std::unique_ptr<transfer_rounding_strategy> transfer_rounding;
   std::unique_ptr<burn_policy>                burn;
   supply_controller                   supply;
   transfer_engine                     transfers;
   rebase_opt_controller               opt;
   core_ledger_operations              core;
   std::unique_ptr<rounding_error_tracker>     tracker;
   ledger_operations*                  operations = nullptr;
   uint64_t                            sequence = 0;
   mutable std::mutex                  mtx;

   controller_impl( const controller::config& cfg )
   :conf( validated( cfg ) ),
    db( cfg.state_dir, database::read_write, cfg.state_size ),
    accounts( db ),
    supply_change( make_supply_change_strategy( cfg.supply_change ) ),
    transfer_rounding( make_transfer_rounding_strategy( cfg.transfer_rounding ) ),
    burn( make_burn_policy( cfg.burn ) ),
    supply( db, accounts, *supply_change, *burn, cfg.max_supply ),
    transfers( accounts, supply, *transfer_rounding ),
    opt( accounts, supply ),
    core( supply, transfers, opt )
   {
      accounts.add_indices();
      supply.add_indices();

      operations = &core;
      if( conf.track_rounding_error ) {
         tracker = std::make_unique<rounding_error_tracker>( core, accounts, supply );
         operations = tracker.get();
      }
   }

   void startup() {
      std::lock_guard<std::mutex> g( mtx );
      if( db.find<ledger_global_object>() == nullptr ) {
         ilog( "initializing ledger state in ${d}", ("d", conf.state_dir.generic_string()) );
         supply.initialize_database( conf.initial_rebasing_credits_per_token );
      } else {
         const auto& global = supply.get_global();
         ilog( "resuming ledger state in ${d}: ${n} accounts, total supply ${s}",
               ("d", conf.state_dir.generic_string())("n", accounts.account_count())("s", global.total_supply.str()) );
      }
   }

   account_balance_delta capture( const account_name& account )const {
      account_balance_delta d;
      d.account = account;
      d.balance_before = accounts.balance_of( account );
      d.non_rebasing = accounts.is_non_rebasing( account );
      return d;
   }

   template<typename Operation>
   operation_trace_ptr push( operation_kind kind, vector<account_name> touched, Operation&& op ) {
      std::lock_guard<std::mutex> g( mtx );

      auto trace = std::make_shared<operation_trace>();
      trace->sequence = ++sequence;
      trace->kind = kind;

      for( const auto& a : touched ) {
         if( std::find_if( trace->account_deltas.begin(), trace->account_deltas.end(),
                           [&]( const auto& d ){ return d.account == a; } ) == trace->account_deltas.end() ) {
            trace->account_deltas.emplace_back( capture( a ) );
         }
      }
      const int256_t rounding_error_before = supply.get_global().rounding_error;

      try {
         auto session = db.start_undo_session( true );
         op( *operations );
         session.push();
         db.commit( db.revision() );
      } catch( const fc::exception& e ) {
         trace->error = controller::convert_exception_to_error( e );
         trace->except = e;
         dlog( "${k} failed: ${e}", ("k", kind)("e", e.to_detail_string()) );
      }

      for( auto& d : trace->account_deltas ) {
         d.balance_after = accounts.balance_of( d.account );
         d.non_rebasing = accounts.is_non_rebasing( d.account );
      }

      const auto& global = supply.get_global();
      trace->rebasing_credits_per_token = global.rebasing_credits_per_token;
      trace->total_supply = supply.reported_total_supply( conf.track_rounding_error );
      trace->rounding_error_delta = global.rounding_error - rounding_error_before;
      return trace;
   }

   supply_audit audit()const {
      supply_audit result;
      const auto& global = supply.get_global();

      accounts.walk_accounts( [&]( const account_object& a ) {
         const uint256_t balance = accounts.balance_of( a );
         ++result.accounts;
         result.sum_of_balances = fixed_point::safe_add( result.sum_of_balances, balance );
         if( a.non_rebasing ) {
            result.sum_of_non_rebasing_balances = fixed_point::safe_add( result.sum_of_non_rebasing_balances, balance );
         } else {
            result.sum_of_rebasing_credits = fixed_point::safe_add( result.sum_of_rebasing_credits, a.credits );
         }
      });

      result.cached_total_supply = global.total_supply;
      result.reported_total_supply = supply.reported_total_supply( conf.track_rounding_error );
      result.rounding_error = global.rounding_error;
      result.rebasing_credits = global.rebasing_credits;
      result.non_rebasing_supply = global.non_rebasing_supply;
      result.cached_gap = fixed_point::signed_delta( result.sum_of_balances, result.cached_total_supply );
      result.reported_gap = fixed_point::signed_delta( result.sum_of_balances, result.reported_total_supply );
      return result;
   }
};

controller::controller( const config& cfg )
:my( new controller_impl( cfg ) )
{
}

controller::~controller() = default;

void controller::startup() {
   my->startup();
}

operation_trace_ptr controller::mint( const account_name& account, const uint256_t& amount ) {
   return my->push( operation_kind::mint, { account }, [&]( ledger_operations& ops ) {
      ops.mint( account, amount );
   });
}

operation_trace_ptr controller::burn( const account_name& account, const uint256_t& amount ) {
   return my->push( operation_kind::burn, { account }, [&]( ledger_operations& ops ) {
      ops.burn( account, amount );
   });
}

operation_trace_ptr controller::transfer( const account_name& from, const account_name& to, const uint256_t& amount ) {
   return my->push( operation_kind::transfer, { from, to }, [&]( ledger_operations& ops ) {
      ops.transfer( from, to, amount );
   });
}

operation_trace_ptr controller::opt_in( const account_name& account ) {
   return my->push( operation_kind::opt_in, { account }, [&]( ledger_operations& ops ) {
      ops.opt_in( account );
   });
}

operation_trace_ptr controller::opt_out( const account_name& account ) {
   return my->push( operation_kind::opt_out, { account }, [&]( ledger_operations& ops ) {
      ops.opt_out( account );
   });
}

operation_trace_ptr controller::change_supply( const uint256_t& new_total_supply ) {
   return my->push( operation_kind::change_supply, {}, [&]( ledger_operations& ops ) {
      ops.change_supply( new_total_supply );
   });
}

operation_trace_ptr controller::push_operation( const ledger_operation& op ) {
   switch( op.op ) {
      case operation_kind::mint:          return mint( op.account, op.amount );
      case operation_kind::burn:          return burn( op.account, op.amount );
      case operation_kind::transfer:      return transfer( op.account, op.to, op.amount );
      case operation_kind::opt_in:        return opt_in( op.account );
      case operation_kind::opt_out:       return opt_out( op.account );
      case operation_kind::change_supply: return change_supply( op.amount );
   }
   REBASE_THROW( operation_type_exception, "unknown operation kind ${k}", ("k", static_cast<int>(op.op)) );
}

uint256_t controller::balance_of( const account_name& account )const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->accounts.balance_of( account );
}

pair<uint256_t, uint256_t> controller::credits_balance_of( const account_name& account )const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->accounts.credits_balance_of( account );
}

bool controller::is_non_rebasing( const account_name& account )const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->accounts.is_non_rebasing( account );
}

uint256_t controller::total_supply()const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->supply.reported_total_supply( my->conf.track_rounding_error );
}

uint256_t controller::cached_total_supply()const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->supply.get_global().total_supply;
}

uint256_t controller::rebasing_credits()const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->supply.get_global().rebasing_credits;
}

uint256_t controller::rebasing_credits_per_token()const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->supply.get_global().rebasing_credits_per_token;
}

uint256_t controller::non_rebasing_supply()const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->supply.get_global().non_rebasing_supply;
}

std::optional<int256_t> controller::rounding_error()const {
   std::lock_guard<std::mutex> g( my->mtx );
   if( !my->tracker )
      return {};
   return my->tracker->rounding_error();
}

supply_audit controller::audit()const {
   std::lock_guard<std::mutex> g( my->mtx );
   return my->audit();
}

vector<account_summary> controller::get_accounts()const {
   std::lock_guard<std::mutex> g( my->mtx );
   vector<account_summary> result;
   my->accounts.walk_accounts( [&]( const account_object& a ) {
      result.push_back( account_summary{ a.name, a.credits, my->accounts.balance_of( a ),
                                         a.non_rebasing, a.locked_credits_per_token } );
   });
   return result;
}

const controller::config& controller::get_config()const {
   return my->conf;
}

const chainbase::database& controller::db()const {
   return my->db;
}

ledger_error controller::convert_exception_to_error( const fc::exception& e ) {
   if( dynamic_cast<const arithmetic_overflow_exception*>( &e ) )   return ledger_error::arithmetic_overflow;
   if( dynamic_cast<const division_by_zero_exception*>( &e ) )      return ledger_error::division_by_zero;
   if( dynamic_cast<const insufficient_balance_exception*>( &e ) )  return ledger_error::insufficient_balance;
   if( dynamic_cast<const insufficient_credits_exception*>( &e ) )  return ledger_error::insufficient_credits;
   if( dynamic_cast<const dust_amount_burn_exception*>( &e ) )      return ledger_error::dust_amount_burn;
   if( dynamic_cast<const already_in_state_exception*>( &e ) )      return ledger_error::already_in_state;
   if( dynamic_cast<const invalid_supply_change_exception*>( &e ) ) return ledger_error::invalid_supply_change;
   if( dynamic_cast<const ledger_state_inconsistent*>( &e ) )       return ledger_error::state_inconsistent;
   return ledger_error::unknown;
}

} } /// rebase::ledger
