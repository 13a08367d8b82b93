/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include <vaultdist/chain/database.hpp>
#include <vaultdist/chain/vault_object.hpp>
#include <vaultdist/chain/claim_object.hpp>
#include <vaultdist/chain/collaborators.hpp>
#include <vaultdist/chain/reconciliation.hpp>
#include <vaultdist/chain/settlement_lease.hpp>
#include <vaultdist/chain/settlement_processor.hpp>
#include <vaultdist/chain/settlement_sweeper.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/interprocess/signals.hpp>
#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/thread/thread.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

#ifdef WIN32
# include <signal.h>
#else
# include <csignal>
#endif

using namespace vaultdist::chain;
using namespace std;
namespace bpo = boost::program_options;

namespace {

/// sizes transactions without talking to an external ledger, the reference is the hash of the encoding
class dry_run_transaction_builder : public transaction_builder
{
   public:
      raw_settlement_transaction build( const settlement_batch_spec& spec, time_point deadline ) override
      {
         raw_settlement_transaction trx;
         trx.bytes = fc::raw::pack( spec );
         return trx;
      }

      settlement_reference submit( const raw_settlement_transaction& trx, time_point deadline ) override
      {
         const auto digest = fc::sha256::hash( trx.bytes.data(), trx.bytes.size() );
         ilog( "Dry run: would submit ${n} bytes as ${h}", ("n",trx.size())("h",digest.str()) );
         return digest.str();
      }
};

class dry_run_backing_validator : public backing_validator
{
   public:
      backing_status check( const claim_object& claim, const source_transaction_object& backing ) override
      {
         return backing_status();
      }
};

class logging_asset_updater : public asset_status_updater
{
   public:
      void mark_distributed( const vector<vault_asset_id_type>& assets ) override
      {
         ilog( "Assets distributed: ${a}", ("a",assets) );
      }
};

fc::log_level string_to_level( const string& level )
{
   fc::log_level result;
   if( level == "info" )
      result = fc::log_level::info;
   else if( level == "debug" )
      result = fc::log_level::debug;
   else if( level == "warn" )
      result = fc::log_level::warn;
   else if( level == "error" )
      result = fc::log_level::error;
   else if( level == "all" )
      result = fc::log_level::all;
   else
      FC_THROW( "Log level not allowed. Allowed levels are info, debug, warn, error and all." );

   return result;
}

void setup_logging( const string& level, const fc::path& file )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug, fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn, fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error, fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "default", "console", fc::variant( console_appender_config, 20 ) ) );
   cfg.loggers = { fc::logger_config( "default" ) };
   cfg.loggers.front().level = string_to_level( level );
   cfg.loggers.front().appenders = { "default" };

   if( !file.string().empty() )
   {
      fc::file_appender::config ac;
      ac.filename             = file;
      ac.flush                = true;
      ac.rotate               = true;
      ac.rotation_interval    = fc::hours( 1 );
      ac.rotation_limit       = fc::days( 7 );
      cfg.appenders.push_back( fc::appender_config( "file", "file", fc::variant( ac, 5 ) ) );
      cfg.loggers.front().appenders.push_back( "file" );
   }
   fc::configure_logging( cfg );
}

/// Log to console with default color and no format, used before logging is configured
void my_log( const string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print( s );
   my_appender.print( "\n" );
}

template<typename IdType>
IdType parse_id( const bpo::variables_map& options, const char* name )
{
   FC_ASSERT( options.count( name ) > 0, "Option --${n} is required in this mode", ("n",name) );
   return fc::variant( options.at( name ).as<string>() ).as<IdType>( 1 );
}

settlement_config load_settlement_config( const bpo::variables_map& options )
{
   settlement_config config;
   if( options.count( "settlement-config" ) > 0 )
   {
      const fc::path file = options.at( "settlement-config" ).as<boost::filesystem::path>();
      config = fc::json::from_file( file ).as<settlement_config>( VAULTDIST_MAX_NESTED_OBJECTS );
      ilog( "Loaded settlement configuration from ${f}", ("f",file) );
   }
   config.validate();
   return config;
}

void print_json( const fc::variant& v, const bpo::variables_map& options )
{
   if( options.count( "report" ) > 0 )
   {
      const fc::path file = options.at( "report" ).as<boost::filesystem::path>();
      fc::json::save_to_file( v, file );
      ilog( "Report written to ${f}", ("f",file) );
   }
   else
      std::cout << fc::json::to_pretty_string( v ) << "\n";
}

/// waits for SIGINT, SIGTERM or SIGQUIT
int wait_for_exit_signal()
{
   fc::promise<int>::ptr exit_promise = fc::promise<int>::create( "UNIX Signal Handler" );

   fc::set_signal_handler( [&exit_promise]( int the_signal ) {
      wlog( "Caught SIGINT, attempting to exit cleanly" );
      exit_promise->set_value( the_signal );
   }, SIGINT );

   fc::set_signal_handler( [&exit_promise]( int the_signal ) {
      wlog( "Caught SIGTERM, attempting to exit cleanly" );
      exit_promise->set_value( the_signal );
   }, SIGTERM );

#ifdef SIGQUIT
   fc::set_signal_handler( [&exit_promise]( int the_signal ) {
      wlog( "Caught SIGQUIT, attempting to exit cleanly" );
      exit_promise->set_value( the_signal );
   }, SIGQUIT );
#endif

   return exit_promise->wait();
}

} // anonymous namespace

int main( int argc, char** argv )
{
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options( "Vault distribution node" );
      bpo::options_description cfg_options( "Vault distribution node" );
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value( "vault_node_data_dir" ),
                    "Directory containing the ledger snapshot, configuration file, etc.");
      cfg_options.add_options()
            ("snapshot", bpo::value<boost::filesystem::path>()->default_value( "ledger.json" ),
                    "Ledger snapshot, relative to data-dir")
            ("mode,m", bpo::value<string>()->default_value( "verify" ),
                    "One of distribute, cancel, verify, settle, sweep, run")
            ("vault", bpo::value<string>(), "Vault id, e.g. 1.1.0")
            ("participant", bpo::value<string>(), "Restrict a verification report to this participant id")
            ("address", bpo::value<string>(), "Restrict a verification report to addresses containing this text")
            ("claims", bpo::value<vector<string>>()->multitoken(), "Claim ids to settle manually")
            ("recompute", bpo::bool_switch()->default_value( false ),
                    "Replace available claims whose amounts no longer match (distribute)")
            ("annotate", bpo::bool_switch()->default_value( false ),
                    "Write a note on every discrepant claim (verify)")
            ("reason", bpo::value<string>()->default_value( "vault failed" ), "Failure reason of cancellation claims")
            ("report", bpo::value<boost::filesystem::path>(), "Write the report to this file instead of stdout")
            ("sweep-interval", bpo::value<uint32_t>()->default_value( VAULTDIST_DEFAULT_SWEEP_INTERVAL_SECONDS ),
                    "Seconds between two sweeps (run)")
            ("settlement-config", bpo::value<boost::filesystem::path>(), "JSON file with settlement limits")
            ("log-level", bpo::value<string>()->default_value( "info" ),
                    "Level of console logging. Allowed levels: info, debug, warn, error, all")
            ("log-file", bpo::value<boost::filesystem::path>(), "Also log to this rotating file");
      app_options.add( cfg_options );

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
      }
      catch( const boost::program_options::error& e )
      {
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count( "help" ) > 0 )
      {
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      fc::path data_dir = options.at( "data-dir" ).as<boost::filesystem::path>();
      if( data_dir.is_relative() )
         data_dir = fc::current_path() / data_dir;
      const fc::path config_ini = data_dir / "config.ini";
      if( fc::exists( config_ini ) )
         bpo::store( bpo::parse_config_file<char>( config_ini.preferred_string().c_str(), cfg_options, true ),
                     options );
      bpo::notify( options );

      fc::path log_file;
      if( options.count( "log-file" ) > 0 )
         log_file = options.at( "log-file" ).as<boost::filesystem::path>();
      setup_logging( options.at( "log-level" ).as<string>(), log_file );

      fc::path snapshot = options.at( "snapshot" ).as<boost::filesystem::path>();
      if( snapshot.is_relative() )
         snapshot = data_dir / snapshot;

      database db;
      db.set_asset_status_updater( std::make_shared<logging_asset_updater>() );
      db.load_snapshot( snapshot );

      const string mode = options.at( "mode" ).as<string>();
      ilog( "Running ${m} on ${f}", ("m",mode)("f",snapshot) );

      if( mode == "distribute" )
      {
         const auto vault = parse_id<vault_id_type>( options, "vault" );
         const auto result = db.create_claims_for_vault( vault, db.compute_vault_totals( vault ),
                                                         options.at( "recompute" ).as<bool>() );
         print_json( fc::variant( result, VAULTDIST_MAX_NESTED_OBJECTS ), options );
         db.save_snapshot( snapshot );
      }
      else if( mode == "cancel" )
      {
         const auto vault = parse_id<vault_id_type>( options, "vault" );
         const auto created = db.create_cancellation_claims( vault, options.at( "reason" ).as<string>() );
         print_json( fc::variant( created, VAULTDIST_MAX_NESTED_OBJECTS ), options );
         db.save_snapshot( snapshot );
      }
      else if( mode == "verify" )
      {
         reconciliation_filter filter;
         if( options.count( "participant" ) > 0 )
            filter.participant = parse_id<participant_id_type>( options, "participant" );
         if( options.count( "address" ) > 0 )
            filter.address = options.at( "address" ).as<string>();
         const auto report = reconciliation_engine( db ).verify( parse_id<vault_id_type>( options, "vault" ), filter );
         print_json( fc::variant( report, VAULTDIST_MAX_NESTED_OBJECTS ), options );
         if( options.at( "annotate" ).as<bool>() && reconciliation_engine::annotate_discrepancies( db, report ) > 0 )
            db.save_snapshot( snapshot );
         if( !report.passed() )
            return EXIT_FAILURE;
      }
      else if( mode == "settle" || mode == "sweep" || mode == "run" )
      {
         settlement_processor processor( db, std::make_shared<dry_run_transaction_builder>(),
                                         std::make_shared<dry_run_backing_validator>(),
                                         std::make_shared<local_settlement_lease>(),
                                         load_settlement_config( options ) );
         if( mode == "settle" )
         {
            FC_ASSERT( options.count( "claims" ) > 0, "Option --claims is required in this mode" );
            vector<claim_id_type> claims;
            for( const auto& id : options.at( "claims" ).as<vector<string>>() )
               claims.push_back( fc::variant( id ).as<claim_id_type>( 1 ) );
            manual_settlement_result result;
            try
            {
               result = processor.settle( claims, time_point_sec( fc::time_point::now() ) );
            }
            catch( const vaultdist::protocol::transport_exception& )
            {
               // the claims were failed, keep their diagnostics
               db.save_snapshot( snapshot );
               throw;
            }
            catch( const vaultdist::protocol::insufficient_backing_exception& )
            {
               // recovered claims were marked claimed before the check
               db.save_snapshot( snapshot );
               throw;
            }
            db.save_snapshot( snapshot );
            print_json( fc::variant( result, VAULTDIST_MAX_NESTED_OBJECTS ), options );
         }
         else if( mode == "sweep" )
         {
            const auto result = processor.sweep( time_point_sec( fc::time_point::now() ) );
            db.save_snapshot( snapshot );
            print_json( fc::variant( result, VAULTDIST_MAX_NESTED_OBJECTS ), options );
         }
         else
         {
            settlement_sweeper sweeper( processor, std::chrono::seconds( options.at( "sweep-interval" ).as<uint32_t>() ),
                                        [&db,&snapshot]( const sweep_result& result ) {
                                           if( !result.batches.empty() || !result.recovered.empty()
                                               || !result.completed.empty() )
                                              db.save_snapshot( snapshot );
                                        } );
            sweeper.trigger();
            ilog( "Sweeping every ${s} seconds", ("s",options.at( "sweep-interval" ).as<uint32_t>()) );
            const auto caught_signal = wait_for_exit_signal();
            ilog( "Exiting from signal ${n} after ${c} sweeps", ("n",caught_signal)("c",sweeper.cycles()) );
         }
      }
      else
         FC_THROW( "Unknown mode ${m}", ("m",mode) );

      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   } catch( const boost::program_options::error& e ) {
      my_log( string( "Error in configuration: " ) + e.what() );
      return EXIT_FAILURE;
   }

   if( unhandled_exception )
   {
      elog( "Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()) );
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
