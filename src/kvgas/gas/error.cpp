#include <kvgas/gas/error.hpp>

#include <utility>

namespace kvgas::gas {

struct _gas_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _gas_category::name() const noexcept
{
  return "gas";
}

std::string _gas_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< gas_errc >( condition ) )
  {
    case gas_errc::ok:
      return "ok"s;
    case gas_errc::out_of_gas:
      return "out of gas"s;
    case gas_errc::gas_overflow:
      return "gas overflow"s;
    case gas_errc::negative_gas_consumed:
      return "negative gas consumed"s;
  }
  std::unreachable();
}

const std::error_category& gas_category() noexcept
{
  static _gas_category category;
  return category;
}

std::error_code make_error_code( gas_errc e )
{
  return std::error_code( static_cast< int >( e ), gas_category() );
}

gas_error::gas_error( gas_errc e, std::string_view descriptor ):
    _code( make_error_code( e ) ),
    _descriptor( descriptor )
{}

gas_errc gas_error::value() const noexcept
{
  return static_cast< gas_errc >( _code.value() );
}

const std::error_code& gas_error::code() const noexcept
{
  return _code;
}

const std::string& gas_error::descriptor() const noexcept
{
  return _descriptor;
}

std::string gas_error::message() const
{
  return _code.message() + " in location: " + _descriptor;
}

} // namespace kvgas::gas
