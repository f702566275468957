#pragma once

#include <kvgas/gas/error.hpp>
#include <kvgas/gas/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kvgas::gas {

/*
 * Tracks gas consumption for a single unit of work.
 *
 * A meter is not synchronized. Once consume_gas or refund_gas returns an
 * error the unit of work is expected to abort; the meter keeps the state it
 * had when the error was raised so the caller can still read it.
 */
class gas_meter
{
public:
  gas_meter()                              = default;
  gas_meter( const gas_meter& )            = default;
  gas_meter( gas_meter&& )                 = default;
  gas_meter& operator=( const gas_meter& ) = default;
  gas_meter& operator=( gas_meter&& )      = default;
  virtual ~gas_meter()                     = default;

  virtual gas gas_consumed() const noexcept          = 0;
  virtual gas gas_consumed_to_limit() const noexcept = 0;
  virtual gas limit() const noexcept                 = 0;

  [[nodiscard]] virtual result< void > consume_gas( gas amount, std::string_view descriptor ) = 0;
  [[nodiscard]] virtual result< void > refund_gas( gas amount, std::string_view descriptor )  = 0;

  virtual bool is_past_limit() const noexcept = 0;
  virtual bool is_out_of_gas() const noexcept = 0;

  virtual const std::optional< gas_report >& report() const noexcept = 0;

  virtual std::string to_string() const = 0;
};

std::unique_ptr< gas_meter > make_gas_meter( gas limit, bool cost_breakdown = false );
std::unique_ptr< gas_meter > make_infinite_gas_meter();

} // namespace kvgas::gas
