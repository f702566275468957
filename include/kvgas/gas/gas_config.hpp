#pragma once

#include <kvgas/gas/types.hpp>

#include <optional>
#include <string_view>

namespace kvgas::gas {

// Gas cost of each key-value store operation.
struct gas_config
{
  gas has_cost            = 0;
  gas delete_cost         = 0;
  gas read_cost_flat      = 0;
  gas read_cost_per_byte  = 0;
  gas write_cost_flat     = 0;
  gas write_cost_per_byte = 0;
  gas iter_next_cost_flat = 0;

  friend bool operator==( const gas_config&, const gas_config& ) = default;
};

// Pricing for persistent stores.
constexpr gas_config kv_gas_config() noexcept
{
  return gas_config{ .has_cost            = 1'000,
                     .delete_cost         = 1'000,
                     .read_cost_flat      = 1'000,
                     .read_cost_per_byte  = 3,
                     .write_cost_flat     = 2'000,
                     .write_cost_per_byte = 30,
                     .iter_next_cost_flat = 30 };
}

// Pricing for transient stores, discarded at the end of each block.
constexpr gas_config transient_gas_config() noexcept
{
  return gas_config{ .has_cost            = 100,
                     .delete_cost         = 100,
                     .read_cost_flat      = 100,
                     .read_cost_per_byte  = 0,
                     .write_cost_flat     = 200,
                     .write_cost_per_byte = 3,
                     .iter_next_cost_flat = 3 };
}

/*
 * Resolves a named pricing profile, "kv" or "transient".
 */
std::optional< gas_config > gas_config_by_name( std::string_view name ) noexcept;

} // namespace kvgas::gas
