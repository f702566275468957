#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include <quill/core/LogLevel.h>

#include <yaml-cpp/yaml.h>

#include <kvgas/gas.hpp>
#include <kvgas/log/log.hpp>
#include <kvgas/replay/pricing.hpp>
#include <kvgas/replay/script.hpp>
#include <kvgas/store/backends/map/map_backend.hpp>
#include <kvgas/store/gas_store.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto kv_profile = "kv"s;

constexpr auto help_option       = "help,h"s;
constexpr auto script_option     = "script,s"s;
constexpr auto limit_option      = "limit,l"s;
constexpr auto limit_default     = "10000000"s;
constexpr auto infinite_option   = "infinite,i"s;
constexpr auto breakdown_option  = "breakdown,b"s;
constexpr auto profile_option    = "profile,p"s;
constexpr auto profile_default   = kv_profile;
constexpr auto pricing_option    = "pricing"s;
constexpr auto log_level_option  = "log-level"s;
constexpr auto log_level_default = "info"s;

} // namespace constants

using namespace boost;
using namespace kvgas;

namespace {

void print_meter( const gas::gas_meter& meter )
{
  std::cout << meter.to_string() << '\n';
  std::cout << "  consumed to limit: " << meter.gas_consumed_to_limit() << '\n';

  if( const auto& report = meter.report(); report )
  {
    std::cout << "  report:\n";
    for( const auto& [ descriptor, amount ]: *report )
      std::cout << "    " << descriptor << ": " << amount << '\n';
  }
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level, profile;
  std::filesystem::path script_file;
  std::optional< std::filesystem::path > pricing_file;
  std::string limit_text;
  bool infinite  = false;
  bool breakdown = false;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()     , "Print this help message and exit" )
      ( constants::script_option.data()   , program_options::value< std::string >()->required()                                           , "The YAML script of store operations to replay" )
      ( constants::limit_option.data()    , program_options::value< std::string >()->default_value( constants::limit_default )          , "The gas limit of the unit of work" )
      ( constants::infinite_option.data() , program_options::bool_switch()                                                                , "Use an unbounded gas meter" )
      ( constants::breakdown_option.data(), program_options::bool_switch()                                                                , "Track a per descriptor cost breakdown" )
      ( constants::profile_option.data()  , program_options::value< std::string >()->default_value( constants::profile_default )         , "The pricing profile, 'kv' or 'transient'" )
      ( constants::pricing_option.data()  , program_options::value< std::string >()                                                        , "A YAML file overriding fields of the pricing profile" )
      ( constants::log_level_option.data(), program_options::value< std::string >()->default_value( constants::log_level_default )       , "The log filtering level" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    program_options::notify( args );

    script_file = args[ "script" ].as< std::string >();
    limit_text  = args[ "limit" ].as< std::string >();
    infinite    = args[ "infinite" ].as< bool >();
    breakdown   = args[ "breakdown" ].as< bool >();
    profile     = args[ "profile" ].as< std::string >();
    log_level   = args[ constants::log_level_option ].as< std::string >();

    if( args.count( constants::pricing_option ) )
      pricing_file = args[ constants::pricing_option ].as< std::string >();
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  kvgas::log::initialize();

  int retcode = EXIT_SUCCESS;

  try
  {
    kvgas::log::instance()->set_log_level( quill::loglevel_from_string( log_level ) );

    auto limit = replay::parse_gas( limit_text );

    auto config = gas::gas_config_by_name( profile );
    if( !config )
      throw std::runtime_error( profile + " is not a valid pricing profile" );

    if( pricing_file )
    {
      if( !std::filesystem::exists( *pricing_file ) )
        throw std::runtime_error( "unable to locate pricing file at " + pricing_file->string() );

      replay::apply_pricing( YAML::LoadFile( pricing_file->string() ), *config );
      LOG_INFO( kvgas::log::instance(), "Applied pricing overrides from {}", pricing_file->string() );
    }

    if( !std::filesystem::exists( script_file ) )
      throw std::runtime_error( "unable to locate script at " + script_file.string() );

    auto script = YAML::LoadFile( script_file.string() );
    if( !script.IsSequence() )
      throw std::runtime_error( "script must be a sequence of operations" );

    auto meter = infinite ? gas::make_infinite_gas_meter() : gas::make_gas_meter( limit, breakdown );
    if( infinite && breakdown )
      LOG_WARNING( kvgas::log::instance(), "Cost breakdown is not available with an unbounded gas meter" );

    if( infinite )
      LOG_INFO( kvgas::log::instance(), "Replaying {} operations with an unbounded gas meter", script.size() );
    else
      LOG_INFO( kvgas::log::instance(), "Replaying {} operations with a gas limit of {}", script.size(), limit );

    store::backends::map::map_backend backend;
    store::gas_store kv_store( backend, *meter, *config );

    if( !replay::run_script( script, kv_store, *meter ) )
      retcode = EXIT_FAILURE;

    if( retcode == EXIT_SUCCESS && !infinite && limit )
      LOG_INFO( kvgas::log::instance(),
                "Unit of work used {} of the gas limit",
                kvgas::log::percent{ meter->gas_consumed(), meter->limit() } );

    print_meter( *meter );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( kvgas::log::instance(), "{}", e.what() );
    retcode = EXIT_FAILURE;
  }

  kvgas::log::instance()->flush_log();

  return retcode;
}
