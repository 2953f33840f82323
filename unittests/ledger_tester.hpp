#pragma once
#include <rebase/ledger/controller.hpp>
#include <rebase/ledger/rounding_error_tracker.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <chainbase/chainbase.hpp>

#include <fc/filesystem.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/test/unit_test.hpp>

namespace rebase { namespace ledger { namespace testing {

   inline uint256_t precision() { return uint256_t( config::precision ); }

   /**
    * Opens a controller over a fresh temporary state directory.
    */
   class ledger_tester {
      public:
         explicit ledger_tester( controller::config cfg = controller::config() )
         :_cfg( std::move(cfg) )
         {
            _cfg.state_dir = boost::filesystem::path( _tempdir.path().generic_string() ) / config::default_state_dir_name;
            _cfg.state_size = 8 * config::_MB;
            open();
         }

         virtual ~ledger_tester() {}

         void open() {
            _chain = std::make_unique<controller>( _cfg );
            _chain->startup();
         }

         void close() {
            _chain.reset();
         }

         void reopen() {
            close();
            open();
         }

         controller& chain() { return *_chain; }

         static operation_trace_ptr require_success( const operation_trace_ptr& trace ) {
            BOOST_REQUIRE( trace );
            BOOST_REQUIRE_MESSAGE( trace->succeeded(),
                                   "operation failed: " << (trace->except ? trace->except->to_detail_string() : std::string()) );
            return trace;
         }

         static void require_error( const operation_trace_ptr& trace, ledger_error expected ) {
            BOOST_REQUIRE( trace );
            BOOST_REQUIRE( !trace->succeeded() );
            BOOST_REQUIRE( trace->error.has_value() );
            BOOST_REQUIRE_EQUAL( static_cast<int>( *trace->error ), static_cast<int>( expected ) );
         }

         operation_trace_ptr mint( const account_name& a, const uint256_t& amount ) {
            return require_success( _chain->mint( a, amount ) );
         }

         operation_trace_ptr burn( const account_name& a, const uint256_t& amount ) {
            return require_success( _chain->burn( a, amount ) );
         }

         operation_trace_ptr transfer( const account_name& from, const account_name& to, const uint256_t& amount ) {
            return require_success( _chain->transfer( from, to, amount ) );
         }

         operation_trace_ptr opt_in( const account_name& a ) {
            return require_success( _chain->opt_in( a ) );
         }

         operation_trace_ptr opt_out( const account_name& a ) {
            return require_success( _chain->opt_out( a ) );
         }

         operation_trace_ptr change_supply( const uint256_t& new_total_supply ) {
            return require_success( _chain->change_supply( new_total_supply ) );
         }

         uint256_t balance( const account_name& a )const {
            return _chain->balance_of( a );
         }

         uint256_t credits( const account_name& a )const {
            return _chain->credits_balance_of( a ).first;
         }

         uint256_t sum_of_balances()const {
            return _chain->audit().sum_of_balances;
         }

         /// cached total supply plus rounding error minus the sum of balances, without the zero floor
         int256_t tracked_gap()const {
            const auto audit = _chain->audit();
            return audit.cached_gap + audit.rounding_error;
         }

      protected:
         fc::temp_directory            _tempdir;
         controller::config            _cfg;
         std::unique_ptr<controller>   _chain;
   };

   inline controller::config make_config( supply_change_mode supply_change,
                                          transfer_rounding_mode transfer_rounding,
                                          burn_mode burn,
                                          bool track_rounding_error ) {
      controller::config cfg;
      cfg.supply_change = supply_change;
      cfg.transfer_rounding = transfer_rounding;
      cfg.burn = burn;
      cfg.track_rounding_error = track_rounding_error;
      return cfg;
   }

   struct naive_burn_tester : ledger_tester {
      naive_burn_tester()
      :ledger_tester( make_config( supply_change_mode::derived, transfer_rounding_mode::derived, burn_mode::naive, false ) )
      {}
   };

   struct trusted_supply_tester : ledger_tester {
      trusted_supply_tester()
      :ledger_tester( make_config( supply_change_mode::trusted, transfer_rounding_mode::derived, burn_mode::reject_dust, false ) )
      {}
   };

   struct independent_rounding_tester : ledger_tester {
      independent_rounding_tester()
      :ledger_tester( make_config( supply_change_mode::derived, transfer_rounding_mode::independent, burn_mode::reject_dust, true ) )
      {}
   };

   struct tracking_tester : ledger_tester {
      tracking_tester()
      :ledger_tester( make_config( supply_change_mode::derived, transfer_rounding_mode::derived, burn_mode::reject_dust, true ) )
      {}
   };

   struct naive_tracking_tester : ledger_tester {
      naive_tracking_tester()
      :ledger_tester( make_config( supply_change_mode::derived, transfer_rounding_mode::derived, burn_mode::naive, true ) )
      {}
   };

   /**
    * The ledger components wired over a bare chainbase database, without a controller.
    */
   template<uint64_t MAX_SIZE>
   struct ledger_components_fixture {
      ledger_components_fixture()
      :_db( boost::filesystem::path( _tempdir.path().generic_string() ), chainbase::database::read_write, MAX_SIZE )
      ,_accounts( _db )
      ,_supply( _db, _accounts, _supply_change, _burn, config::default_max_supply() )
      ,_transfers( _accounts, _supply, _rounding )
      ,_opt( _accounts, _supply )
      ,_core( _supply, _transfers, _opt )
      ,_tracker( _core, _accounts, _supply )
      {
         _accounts.add_indices();
         _supply.add_indices();
         _supply.initialize_database( precision() );
      }

      chainbase::database::session start_session() {
         return _db.start_undo_session(true);
      }

      fc::temp_directory               _tempdir;
      chainbase::database              _db;
      derived_supply_change            _supply_change;
      derived_transfer_rounding        _rounding;
      reject_dust_burn_policy          _burn;
      account_ledger                   _accounts;
      supply_controller                _supply;
      transfer_engine                  _transfers;
      rebase_opt_controller            _opt;
      core_ledger_operations           _core;
      rounding_error_tracker           _tracker;
   };

} } } /// rebase::ledger::testing
