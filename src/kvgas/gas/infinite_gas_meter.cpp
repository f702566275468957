#include <kvgas/gas/infinite_gas_meter.hpp>
#include <kvgas/log/log.hpp>

#include <format>
#include <limits>

namespace kvgas::gas {

infinite_gas_meter::~infinite_gas_meter() {}

gas infinite_gas_meter::gas_consumed() const noexcept
{
  return _consumed;
}

gas infinite_gas_meter::gas_consumed_to_limit() const noexcept
{
  return _consumed;
}

gas infinite_gas_meter::limit() const noexcept
{
  return 0;
}

result< void > infinite_gas_meter::consume_gas( gas amount, std::string_view descriptor )
{
  if( std::numeric_limits< gas >::max() - _consumed < amount )
  {
    _consumed = std::numeric_limits< gas >::max();
    LOG_DEBUG( log::instance(), "Gas overflow charging {} under {}", amount, descriptor );
    return std::unexpected( gas_error( gas_errc::gas_overflow, descriptor ) );
  }

  _consumed += amount;

  return {};
}

result< void > infinite_gas_meter::refund_gas( gas amount, std::string_view descriptor )
{
  if( _consumed < amount )
    return std::unexpected( gas_error( gas_errc::negative_gas_consumed, descriptor ) );

  _consumed -= amount;

  return {};
}

bool infinite_gas_meter::is_past_limit() const noexcept
{
  return false;
}

bool infinite_gas_meter::is_out_of_gas() const noexcept
{
  return false;
}

const std::optional< gas_report >& infinite_gas_meter::report() const noexcept
{
  static const std::optional< gas_report > no_report;
  return no_report;
}

std::string infinite_gas_meter::to_string() const
{
  return std::format( "InfiniteGasMeter:\n  consumed: {}", _consumed );
}

} // namespace kvgas::gas
