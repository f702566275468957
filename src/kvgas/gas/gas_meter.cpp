#include <kvgas/gas/basic_gas_meter.hpp>
#include <kvgas/gas/gas_meter.hpp>
#include <kvgas/gas/infinite_gas_meter.hpp>

namespace kvgas::gas {

std::unique_ptr< gas_meter > make_gas_meter( gas limit, bool cost_breakdown )
{
  return std::make_unique< basic_gas_meter >( limit, cost_breakdown );
}

std::unique_ptr< gas_meter > make_infinite_gas_meter()
{
  return std::make_unique< infinite_gas_meter >();
}

} // namespace kvgas::gas
