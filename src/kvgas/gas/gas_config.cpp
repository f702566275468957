#include <kvgas/gas/gas_config.hpp>

namespace kvgas::gas {

std::optional< gas_config > gas_config_by_name( std::string_view name ) noexcept
{
  using namespace std::string_view_literals;

  if( name == "kv"sv )
    return kv_gas_config();

  if( name == "transient"sv )
    return transient_gas_config();

  return {};
}

} // namespace kvgas::gas
