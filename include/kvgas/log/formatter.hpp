#pragma once

#include <stdexcept>
#include <type_traits>

#include <quill/DeferredFormatCodec.h>

namespace kvgas::log {

template< typename T1, typename T2 >
  requires std::is_integral_v< T1 > && std::is_integral_v< T2 >
struct percent
{
  T1 numerator;
  T2 denominator;
};

} // namespace kvgas::log

template< typename T1, typename T2 >
struct fmtquill::formatter< kvgas::log::percent< T1, T2 > >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const kvgas::log::percent< T1, T2 >& p, format_context& ctx ) const
  {
    static constexpr auto one_hundred_percent = 100;

    if( !p.denominator )
      throw std::runtime_error( "percent formatter divide by zero" );

    auto percent = static_cast< double >( p.numerator ) / static_cast< double >( p.denominator ) * one_hundred_percent;
    return fmtquill::format_to( ctx.out(), "{:.2f}%", percent );
  }
};

template< typename T1, typename T2 >
struct quill::Codec< kvgas::log::percent< T1, T2 > >: quill::DeferredFormatCodec< kvgas::log::percent< T1, T2 > >
{};
