#pragma once

#include <kvgas/gas/error.hpp>
#include <kvgas/gas/gas_meter.hpp>
#include <kvgas/store/gas_store.hpp>

#include <cstddef>

#include <yaml-cpp/yaml.h>

namespace kvgas::replay {

/*
 * Runs one script operation: set, get, has, delete, iterate, consume or
 * refund. An unknown operation throws std::runtime_error.
 */
gas::result< void > run_operation( const YAML::Node& operation, store::gas_store& kv_store, gas::gas_meter& meter );

/*
 * Runs a script as a single unit of work and returns the number of
 * operations run. The first gas error aborts the script and is returned.
 */
gas::result< std::size_t > run_script( const YAML::Node& script, store::gas_store& kv_store, gas::gas_meter& meter );

} // namespace kvgas::replay
