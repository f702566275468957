#include <kvgas/log/log.hpp>
#include <kvgas/replay/pricing.hpp>
#include <kvgas/replay/script.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace kvgas::replay {

namespace {

store::key_type to_bytes( const std::string& s )
{
  store::key_type bytes;
  bytes.reserve( s.size() );
  for( auto c: s )
    bytes.push_back( std::byte( c ) );
  return bytes;
}

} // namespace

gas::result< void > run_operation( const YAML::Node& operation, store::gas_store& kv_store, gas::gas_meter& meter )
{
  auto op = operation[ "op" ].as< std::string >();

  if( op == "set" )
    return kv_store.put( to_bytes( operation[ "key" ].as< std::string >() ),
                         to_bytes( operation[ "value" ].as< std::string >() ) );

  if( op == "get" )
  {
    auto value = kv_store.get( to_bytes( operation[ "key" ].as< std::string >() ) );
    if( !value )
      return std::unexpected( value.error() );

    LOG_DEBUG( log::instance(),
               "get {} found: {}",
               operation[ "key" ].as< std::string >(),
               value->has_value() );
    return {};
  }

  if( op == "has" )
  {
    auto found = kv_store.has( to_bytes( operation[ "key" ].as< std::string >() ) );
    if( !found )
      return std::unexpected( found.error() );

    LOG_DEBUG( log::instance(), "has {}: {}", operation[ "key" ].as< std::string >(), *found );
    return {};
  }

  if( op == "delete" )
    return kv_store.remove( to_bytes( operation[ "key" ].as< std::string >() ) );

  if( op == "iterate" )
  {
    auto itr = kv_store.iterate();
    if( !itr )
      return std::unexpected( itr.error() );

    std::uint64_t entries = 0;
    while( itr->valid() )
    {
      ++entries;
      if( auto result = itr->next(); !result )
        return result;
    }

    LOG_DEBUG( log::instance(), "iterated {} entries", entries );
    return {};
  }

  if( op == "consume" )
    return meter.consume_gas( parse_gas( operation[ "amount" ].as< std::string >() ),
                              operation[ "descriptor" ].as< std::string >() );

  if( op == "refund" )
    return meter.refund_gas( parse_gas( operation[ "amount" ].as< std::string >() ),
                             operation[ "descriptor" ].as< std::string >() );

  throw std::runtime_error( op + " is not a valid operation" );
}

gas::result< std::size_t > run_script( const YAML::Node& script, store::gas_store& kv_store, gas::gas_meter& meter )
{
  if( !script.IsSequence() )
    throw std::runtime_error( "script must be a sequence of operations" );

  std::size_t index = 0;
  for( const auto& operation: script )
  {
    if( auto result = run_operation( operation, kv_store, meter ); !result )
    {
      LOG_ERROR( log::instance(), "Aborting unit of work at operation {}: {}", index, result.error().message() );
      return std::unexpected( result.error() );
    }

    ++index;
  }

  return index;
}

} // namespace kvgas::replay
