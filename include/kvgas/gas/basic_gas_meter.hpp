#pragma once

#include <kvgas/gas/gas_meter.hpp>

namespace kvgas::gas {

class basic_gas_meter final: public gas_meter
{
public:
  explicit basic_gas_meter( gas limit, bool cost_breakdown = false );
  basic_gas_meter( const basic_gas_meter& )            = default;
  basic_gas_meter( basic_gas_meter&& )                 = default;
  basic_gas_meter& operator=( const basic_gas_meter& ) = default;
  basic_gas_meter& operator=( basic_gas_meter&& )      = default;
  ~basic_gas_meter() final;

  gas gas_consumed() const noexcept final;
  gas gas_consumed_to_limit() const noexcept final;
  gas limit() const noexcept final;

  // The report is only updated by charges that pass both the overflow and
  // the limit checks.
  [[nodiscard]] result< void > consume_gas( gas amount, std::string_view descriptor ) final;

  // A refund larger than the amount tracked for its descriptor leaves that
  // report entry at zero.
  [[nodiscard]] result< void > refund_gas( gas amount, std::string_view descriptor ) final;

  bool is_past_limit() const noexcept final;
  bool is_out_of_gas() const noexcept final;

  const std::optional< gas_report >& report() const noexcept final;

  std::string to_string() const final;

private:
  gas _limit;
  gas _consumed = 0;
  std::optional< gas_report > _report;
};

} // namespace kvgas::gas
