#pragma once

#include <kvgas/gas/gas_meter.hpp>

namespace kvgas::gas {

class infinite_gas_meter final: public gas_meter
{
public:
  infinite_gas_meter()                                       = default;
  infinite_gas_meter( const infinite_gas_meter& )            = default;
  infinite_gas_meter( infinite_gas_meter&& )                 = default;
  infinite_gas_meter& operator=( const infinite_gas_meter& ) = default;
  infinite_gas_meter& operator=( infinite_gas_meter&& )      = default;
  ~infinite_gas_meter() final;

  gas gas_consumed() const noexcept final;
  gas gas_consumed_to_limit() const noexcept final;
  gas limit() const noexcept final;

  [[nodiscard]] result< void > consume_gas( gas amount, std::string_view descriptor ) final;
  [[nodiscard]] result< void > refund_gas( gas amount, std::string_view descriptor ) final;

  bool is_past_limit() const noexcept final;
  bool is_out_of_gas() const noexcept final;

  const std::optional< gas_report >& report() const noexcept final;

  std::string to_string() const final;

private:
  gas _consumed = 0;
};

} // namespace kvgas::gas
