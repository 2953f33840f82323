#include <rebase/ledger/controller.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/path.hpp>

#include <chrono>
#include <iostream>

using namespace rebase::ledger;
namespace bfs = boost::filesystem;
namespace bpo = boost::program_options;
using bpo::options_description;
using bpo::variables_map;

struct ledger_cli {
   void set_program_options(options_description& cli);
   void initialize(const variables_map& options);
   int  run();

   controller::config               cfg;
   bfs::path                        operations_file;
   std::vector<std::string>         inline_operations;
   uint64_t                         state_size_mb = config::default_state_size / config::_MB;
   bool                             print_accounts = false;
   bool                             fail_fast = false;
   bool                             verbose = false;
   bool                             help = false;
};

struct report_time {
    report_time(std::string desc)
    : _start(std::chrono::high_resolution_clock::now())
    , _desc(desc) {
    }

    void report() {
        const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::high_resolution_clock::now() - _start).count() / 1000;
        ilog("rebase-ledger - ${desc} took ${t} msec", ("desc", _desc)("t", duration));
    }

    const std::chrono::high_resolution_clock::time_point _start;
    const std::string                                    _desc;
};

void ledger_cli::set_program_options(options_description& cli)
{
   cli.add_options()
         ("state-dir", bpo::value<bfs::path>()->default_value(config::default_state_dir_name),
          "the location of the ledger state directory (absolute path or relative to the current directory)")
         ("state-size", bpo::value<uint64_t>(&state_size_mb)->default_value(state_size_mb),
          "Maximum size (in MiB) of the ledger state file")
         ("supply-change", bpo::value<supply_change_mode>(&cfg.supply_change)->default_value(supply_change_mode::derived),
          "How change_supply sets the cached total supply. \"derived\" recomputes it from the new multiplier, "
          "\"trusted\" takes the requested value.")
         ("transfer-rounding", bpo::value<transfer_rounding_mode>(&cfg.transfer_rounding)->default_value(transfer_rounding_mode::derived),
          "How transfers convert amounts to credits: \"derived\" or \"independent\"")
         ("burn-policy", bpo::value<burn_mode>(&cfg.burn)->default_value(burn_mode::reject_dust),
          "\"reject-dust\" fails burns that remove no credits, \"naive\" accepts every burn")
         ("track-rounding-error", bpo::bool_switch(&cfg.track_rounding_error)->default_value(false),
          "Accumulate the rounding error of mint, burn and transfer and include it in the reported total supply")
         ("initial-credits-per-token", bpo::value<std::string>(),
          "Multiplier a fresh ledger starts with (defaults to 10^18). Ignored when resuming an existing state directory.")
         ("max-supply", bpo::value<std::string>(),
          "Largest total supply the ledger accepts (defaults to 2^128 - 1)")
         ("operations", bpo::value<bfs::path>(),
          "JSON file holding an array of operations, e.g. [{\"op\":\"mint\",\"account\":\"alice\",\"amount\":\"100\"}]")
         ("op", bpo::value<std::vector<std::string>>()->composing(),
          "Operation to apply, e.g. \"mint alice 100\", \"transfer alice bob 5\", \"opt_out alice\", \"change_supply 150\". "
          "May be repeated; applied after the operations file.")
         ("print-accounts", bpo::bool_switch(&print_accounts)->default_value(false),
          "Print every account after the operations have been applied")
         ("fail-fast", bpo::bool_switch(&fail_fast)->default_value(false),
          "Stop at the first failed operation and exit with a non-zero status")
         ("verbose", bpo::bool_switch(&verbose)->default_value(false), "Enable debug logging")
         ("help,h", bpo::bool_switch(&help)->default_value(false), "Print this help message and exit.")
         ;
}

void ledger_cli::initialize(const variables_map& options) {
   try {
      auto sd = options.at( "state-dir" ).as<bfs::path>();
      if( sd.is_relative())
         cfg.state_dir = bfs::current_path() / sd;
      else
         cfg.state_dir = sd;

      cfg.state_size = state_size_mb * config::_MB;

      if( options.count( "initial-credits-per-token" ) )
         cfg.initial_rebasing_credits_per_token = amount_from_string( options.at( "initial-credits-per-token" ).as<std::string>() );
      if( options.count( "max-supply" ) )
         cfg.max_supply = amount_from_string( options.at( "max-supply" ).as<std::string>() );

      if( options.count( "operations" ) ) {
         auto of = options.at( "operations" ).as<bfs::path>();
         operations_file = of.is_relative() ? bfs::current_path() / of : of;
         REBASE_ASSERT( bfs::exists( operations_file ), ledger_config_exception,
                        "operations file ${f} does not exist", ("f", operations_file.generic_string()) );
      }
      if( options.count( "op" ) )
         inline_operations = options.at( "op" ).as<std::vector<std::string>>();

      cfg.validate();
   } FC_LOG_AND_RETHROW()
}

int ledger_cli::run() {
   report_time rt("applying operations");

   std::vector<ledger_operation> operations;
   if( !operations_file.empty() ) {
      try {
         operations = fc::json::from_file( operations_file.generic_string() ).as<std::vector<ledger_operation>>();
      } REBASE_RETHROW_EXCEPTIONS( operation_type_exception, "unable to read operations from ${f}",
                                   ("f", operations_file.generic_string()) )
   }
   for( const auto& s : inline_operations ) {
      try {
         operations.emplace_back( ledger_operation::from_string( s ) );
      } REBASE_RETHROW_EXCEPTIONS( operation_type_exception, "invalid --op '${s}'", ("s", s) )
   }

   controller chain( cfg );
   chain.startup();

   uint32_t failed = 0;
   for( const auto& op : operations ) {
      const auto trace = chain.push_operation( op );
      std::cout << fc::json::to_pretty_string( fc::variant( *trace ) ) << "\n";
      if( !trace->succeeded() ) {
         ++failed;
         if( fail_fast ) {
            elog( "operation ${n} failed, stopping", ("n", trace->sequence) );
            return 1;
         }
      }
   }

   if( print_accounts ) {
      std::cout << fc::json::to_pretty_string( fc::variant( chain.get_accounts() ) ) << "\n";
   }
   std::cout << fc::json::to_pretty_string( fc::variant( chain.audit() ) ) << "\n";

   ilog( "${n} operations applied, ${f} failed", ("n", operations.size())("f", failed) );
   rt.report();
   return 0;
}

int main(int argc, char** argv) {
   options_description cli ("rebase-ledger command line options");
   try {
      ledger_cli app;
      app.set_program_options(cli);
      variables_map vmap;
      bpo::store(bpo::parse_command_line(argc, argv, cli), vmap);
      bpo::notify(vmap);

      if (app.help) {
         cli.print(std::cerr);
         return 0;
      }

      fc::logger::get(DEFAULT_LOGGER).set_log_level( app.verbose ? fc::log_level::debug : fc::log_level::error );

      app.initialize(vmap);
      return app.run();
   } catch( const fc::exception& e ) {
      elog( "${e}", ("e", e.to_detail_string()));
      return -1;
   } catch( const boost::exception& e ) {
      elog("${e}", ("e",boost::diagnostic_information(e)));
      return -1;
   } catch( const std::exception& e ) {
      elog("${e}", ("e",e.what()));
      return -1;
   } catch( ... ) {
      elog("unknown exception");
      return -1;
   }
}
