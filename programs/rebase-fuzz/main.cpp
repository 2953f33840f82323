#include <rebase/ledger/controller.hpp>
#include <rebase/ledger/exceptions.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem/path.hpp>

#include <iostream>
#include <random>

using namespace rebase::ledger;
namespace bfs = boost::filesystem;
namespace bpo = boost::program_options;
using bpo::options_description;
using bpo::variables_map;

/**
 * Drives a fresh ledger with a random operation sequence and audits the supply invariants after
 * every step.
 */
struct ledger_fuzzer {
   void set_program_options(options_description& cli);
   void initialize(const variables_map& options);
   int  run();

   controller::config               cfg;
   uint64_t                         seed = 1;
   uint32_t                         iterations = 1000;
   uint32_t                         account_count = 4;
   uint64_t                         max_amount = 1000000;
   bool                             include_rebase = false;
   bool                             include_opt = false;
   bool                             verbose = false;
   bool                             help = false;

   private:
      struct step_result {
         ledger_operation   op;
         bool               resets_baseline = false;
      };

      uint256_t random_amount( const uint256_t& bound );
      account_name random_account();
      step_result next_operation( const controller& chain );
      bool whole_multipliers( const controller& chain )const;
      void violation( const char* what, const ledger_operation& op, const supply_audit& audit );

      std::mt19937_64                  rng;
      std::vector<account_name>        accounts;
      uint32_t                         violations = 0;
};

void ledger_fuzzer::set_program_options(options_description& cli)
{
   cli.add_options()
         ("seed", bpo::value<uint64_t>(&seed)->default_value(1), "seed of the random operation sequence")
         ("iterations", bpo::value<uint32_t>(&iterations)->default_value(1000), "number of operations to apply")
         ("accounts", bpo::value<uint32_t>(&account_count)->default_value(4), "number of accounts to spread operations over (1 to 26)")
         ("max-amount", bpo::value<uint64_t>(&max_amount)->default_value(1000000), "upper bound of a single minted amount")
         ("supply-change", bpo::value<supply_change_mode>(&cfg.supply_change)->default_value(supply_change_mode::derived),
          "\"derived\" or \"trusted\"")
         ("transfer-rounding", bpo::value<transfer_rounding_mode>(&cfg.transfer_rounding)->default_value(transfer_rounding_mode::derived),
          "\"derived\" or \"independent\"")
         ("burn-policy", bpo::value<burn_mode>(&cfg.burn)->default_value(burn_mode::reject_dust),
          "\"reject-dust\" or \"naive\"")
         ("track-rounding-error", bpo::bool_switch(&cfg.track_rounding_error)->default_value(false),
          "enable the rounding error accumulator and audit it")
         ("include-rebase", bpo::bool_switch(&include_rebase)->default_value(false), "also generate change_supply operations")
         ("include-opt", bpo::bool_switch(&include_opt)->default_value(false), "also generate opt_in and opt_out operations")
         ("verbose", bpo::bool_switch(&verbose)->default_value(false), "Enable debug logging")
         ("help,h", bpo::bool_switch(&help)->default_value(false), "Print this help message and exit.")
         ;
}

void ledger_fuzzer::initialize(const variables_map& options) {
   try {
      REBASE_ASSERT( account_count >= 1 && account_count <= 26, ledger_config_exception,
                     "accounts must be between 1 and 26, got ${n}", ("n", account_count) );
      REBASE_ASSERT( max_amount > 0, ledger_config_exception, "max-amount must be positive" );

      rng.seed( seed );
      accounts.clear();
      for( uint32_t i = 0; i < account_count; ++i ) {
         accounts.emplace_back( std::string("fuzz.") + char('a' + i) );
      }
   } FC_LOG_AND_RETHROW()
}

uint256_t ledger_fuzzer::random_amount( const uint256_t& bound ) {
   if( bound == 0 )
      return 0;
   const uint64_t limit = bound > max_amount * 2 ? max_amount * 2 : static_cast<uint64_t>( bound );
   return std::uniform_int_distribution<uint64_t>( 0, limit )( rng );
}

account_name ledger_fuzzer::random_account() {
   return accounts[ std::uniform_int_distribution<size_t>( 0, accounts.size() - 1 )( rng ) ];
}

ledger_fuzzer::step_result ledger_fuzzer::next_operation( const controller& chain ) {
   std::vector<operation_kind> kinds = { operation_kind::mint, operation_kind::burn, operation_kind::transfer, operation_kind::transfer };
   if( include_rebase )
      kinds.push_back( operation_kind::change_supply );
   if( include_opt ) {
      kinds.push_back( operation_kind::opt_in );
      kinds.push_back( operation_kind::opt_out );
   }

   step_result result;
   auto& op = result.op;
   op.op = kinds[ std::uniform_int_distribution<size_t>( 0, kinds.size() - 1 )( rng ) ];
   op.account = random_account();

   switch( op.op ) {
      case operation_kind::mint:
         op.amount = std::uniform_int_distribution<uint64_t>( 0, max_amount )( rng );
         break;
      case operation_kind::burn:
         op.amount = random_amount( chain.balance_of( op.account ) );
         break;
      case operation_kind::transfer:
         op.to = random_account();
         op.amount = random_amount( chain.balance_of( op.account ) );
         break;
      case operation_kind::opt_in:
      case operation_kind::opt_out:
         result.resets_baseline = true;
         break;
      case operation_kind::change_supply: {
         // move the supply by -10% .. +30%
         const uint256_t current = chain.cached_total_supply();
         const uint64_t permille = std::uniform_int_distribution<uint64_t>( 900, 1300 )( rng );
         op.amount = current * permille / 1000;
         result.resets_baseline = true;
         break;
      }
   }
   return result;
}

bool ledger_fuzzer::whole_multipliers( const controller& chain )const {
   if( chain.rebasing_credits_per_token() % config::precision != 0 )
      return false;
   for( const auto& a : chain.get_accounts() ) {
      if( a.non_rebasing && a.locked_credits_per_token % config::precision != 0 )
         return false;
   }
   return true;
}

void ledger_fuzzer::violation( const char* what, const ledger_operation& op, const supply_audit& audit ) {
   ++violations;
   elog( "invariant violated: ${w} after ${op}, audit ${a}", ("w", what)("op", op)("a", audit) );
}

int ledger_fuzzer::run() {
   fc::temp_directory tempdir;
   cfg.state_dir = bfs::path( tempdir.path().generic_string() ) / config::default_state_dir_name;

   controller chain( cfg );
   chain.startup();

   const int256_t max_deviation = static_cast<int256_t>( account_count - 1 );

   supply_audit before = chain.audit();
   int256_t baseline = static_cast<int256_t>( before.sum_of_balances );
   int256_t tracked_gap = before.cached_gap + before.rounding_error;
   uint32_t failed = 0;

   for( uint32_t i = 0; i < iterations; ++i ) {
      const auto step = next_operation( chain );
      const auto trace = chain.push_operation( step.op );
      const auto after = chain.audit();

      if( !trace->succeeded() ) {
         ++failed;
         if( after.sum_of_balances != before.sum_of_balances || after.cached_total_supply != before.cached_total_supply
             || after.rebasing_credits != before.rebasing_credits || after.non_rebasing_supply != before.non_rebasing_supply ) {
            violation( "failed operation changed the ledger", step.op, after );
         }
         continue;
      }

      if( after.rebasing_credits != after.sum_of_rebasing_credits )
         violation( "rebasing credits differ from the credits of rebasing accounts", step.op, after );

      if( cfg.burn == burn_mode::reject_dust && after.non_rebasing_supply < after.sum_of_non_rebasing_balances )
         violation( "non-rebasing supply below the non-rebasing balances", step.op, after );

      if( step.resets_baseline ) {
         baseline = static_cast<int256_t>( after.sum_of_balances );
         tracked_gap = after.cached_gap + after.rounding_error;
         before = after;
         continue;
      }

      if( step.op.op == operation_kind::mint )
         baseline += static_cast<int256_t>( step.op.amount );
      else if( step.op.op == operation_kind::burn )
         baseline -= static_cast<int256_t>( step.op.amount );

      if( whole_multipliers( chain ) ) {
         const int256_t deviation = static_cast<int256_t>( after.sum_of_balances ) - baseline;
         if( deviation > max_deviation || deviation < -max_deviation )
            violation( "sum of balances drifted from minted minus burned", step.op, after );
      }

      if( cfg.track_rounding_error && after.cached_gap + after.rounding_error != tracked_gap )
         violation( "rounding error accumulator does not follow the sum of balances", step.op, after );

      before = after;
   }

   std::cout << fc::json::to_pretty_string( fc::variant( chain.audit() ) ) << "\n";
   std::cout << "seed " << seed << ": " << iterations << " operations, " << failed << " rejected, "
             << violations << " violations\n";

   return violations == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
   options_description cli ("rebase-fuzz command line options");
   try {
      ledger_fuzzer fuzzer;
      fuzzer.set_program_options(cli);
      variables_map vmap;
      bpo::store(bpo::parse_command_line(argc, argv, cli), vmap);
      bpo::notify(vmap);

      if (fuzzer.help) {
         cli.print(std::cerr);
         return 0;
      }

      fc::logger::get(DEFAULT_LOGGER).set_log_level( fuzzer.verbose ? fc::log_level::debug : fc::log_level::error );

      fuzzer.initialize(vmap);
      return fuzzer.run();
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
