#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace kvgas::gas {

enum class gas_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  out_of_gas,
  gas_overflow,
  negative_gas_consumed
};

const std::error_category& gas_category() noexcept;

std::error_code make_error_code( gas_errc e );

/*
 * A fatal metering condition together with the descriptor of the charge
 * that raised it. Any gas_error aborts the enclosing unit of work.
 */
class gas_error final
{
public:
  gas_error( gas_errc e, std::string_view descriptor );

  gas_errc value() const noexcept;
  const std::error_code& code() const noexcept;
  const std::string& descriptor() const noexcept;

  std::string message() const;

private:
  std::error_code _code;
  std::string _descriptor;
};

template< typename T >
using result = std::expected< T, gas_error >;

} // namespace kvgas::gas

template<>
struct std::is_error_code_enum< kvgas::gas::gas_errc >: public std::true_type
{};
