#include <kvgas/gas/basic_gas_meter.hpp>
#include <kvgas/log/log.hpp>

#include <format>
#include <limits>

namespace kvgas::gas {

basic_gas_meter::basic_gas_meter( gas limit, bool cost_breakdown ):
    _limit( limit )
{
  if( cost_breakdown )
    _report.emplace();
}

basic_gas_meter::~basic_gas_meter() {}

gas basic_gas_meter::gas_consumed() const noexcept
{
  return _consumed;
}

gas basic_gas_meter::gas_consumed_to_limit() const noexcept
{
  if( is_past_limit() )
    return _limit;

  return _consumed;
}

gas basic_gas_meter::limit() const noexcept
{
  return _limit;
}

result< void > basic_gas_meter::consume_gas( gas amount, std::string_view descriptor )
{
  if( std::numeric_limits< gas >::max() - _consumed < amount )
  {
    _consumed = std::numeric_limits< gas >::max();
    LOG_DEBUG( log::instance(), "Gas overflow charging {} under {}", amount, descriptor );
    return std::unexpected( gas_error( gas_errc::gas_overflow, descriptor ) );
  }

  _consumed += amount;

  if( _consumed > _limit )
  {
    LOG_DEBUG( log::instance(),
               "Out of gas charging {} under {}, consumed {} of {}",
               amount,
               descriptor,
               _consumed,
               _limit );
    return std::unexpected( gas_error( gas_errc::out_of_gas, descriptor ) );
  }

  if( _report )
  {
    if( auto itr = _report->find( descriptor ); itr != _report->end() )
      itr->second += amount;
    else
      _report->emplace( descriptor, amount );
  }

  return {};
}

result< void > basic_gas_meter::refund_gas( gas amount, std::string_view descriptor )
{
  if( _consumed < amount )
    return std::unexpected( gas_error( gas_errc::negative_gas_consumed, descriptor ) );

  _consumed -= amount;

  if( _report )
  {
    auto itr = _report->find( descriptor );
    if( itr == _report->end() )
      itr = _report->emplace( descriptor, 0 ).first;

    if( itr->second < amount )
    {
      LOG_WARNING( log::instance(),
                   "Refund of {} under {} exceeds the {} tracked for it, clamping report entry to zero",
                   amount,
                   descriptor,
                   itr->second );
      itr->second = 0;
    }
    else
      itr->second -= amount;
  }

  return {};
}

bool basic_gas_meter::is_past_limit() const noexcept
{
  return _consumed > _limit;
}

bool basic_gas_meter::is_out_of_gas() const noexcept
{
  return _consumed >= _limit;
}

const std::optional< gas_report >& basic_gas_meter::report() const noexcept
{
  return _report;
}

std::string basic_gas_meter::to_string() const
{
  return std::format( "BasicGasMeter:\n  limit: {}\n  consumed: {}", _limit, _consumed );
}

} // namespace kvgas::gas
