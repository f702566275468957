#pragma once

#include <kvgas/gas/gas_config.hpp>
#include <kvgas/gas/types.hpp>

#include <string_view>

#include <yaml-cpp/yaml.h>

namespace kvgas::replay {

/*
 * Parses a non-negative decimal gas amount. Signs, trailing characters and
 * values wider than 64 bits throw std::runtime_error.
 */
gas::gas parse_gas( std::string_view text );

// Overrides the fields of config named by the keys of a YAML map.
void apply_pricing( const YAML::Node& pricing, gas::gas_config& config );

} // namespace kvgas::replay
