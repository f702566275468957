#include <kvgas/replay/pricing.hpp>

#include <charconv>
#include <stdexcept>
#include <string>
#include <system_error>

namespace kvgas::replay {

gas::gas parse_gas( std::string_view text )
{
  gas::gas value = 0;

  auto [ ptr, ec ] = std::from_chars( text.data(), text.data() + text.size(), value );

  if( ec == std::errc::result_out_of_range )
    throw std::runtime_error( std::string( text ) + " does not fit in a gas amount" );

  if( text.empty() || ec != std::errc() || ptr != text.data() + text.size() )
    throw std::runtime_error( "'" + std::string( text ) + "' is not a valid gas amount" );

  return value;
}

void apply_pricing( const YAML::Node& pricing, gas::gas_config& config )
{
  if( !pricing.IsMap() )
    throw std::runtime_error( "pricing must be a map of gas config fields" );

  for( const auto& entry: pricing )
  {
    auto field = entry.first.as< std::string >();
    auto value = parse_gas( entry.second.as< std::string >() );

    if( field == "has_cost" )
      config.has_cost = value;
    else if( field == "delete_cost" )
      config.delete_cost = value;
    else if( field == "read_cost_flat" )
      config.read_cost_flat = value;
    else if( field == "read_cost_per_byte" )
      config.read_cost_per_byte = value;
    else if( field == "write_cost_flat" )
      config.write_cost_flat = value;
    else if( field == "write_cost_per_byte" )
      config.write_cost_per_byte = value;
    else if( field == "iter_next_cost_flat" )
      config.iter_next_cost_flat = value;
    else
      throw std::runtime_error( field + " is not a gas config field" );
  }
}

} // namespace kvgas::replay
