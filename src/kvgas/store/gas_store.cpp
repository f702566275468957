#include <kvgas/store/gas_store.hpp>

#include <limits>
#include <stdexcept>

#include <boost/multiprecision/cpp_int.hpp>

namespace kvgas::store {

namespace {

gas::result< void >
consume_per_byte( gas::gas_meter& meter, gas::gas cost_per_byte, std::size_t bytes, std::string_view descriptor )
{
  boost::multiprecision::uint128_t cost = boost::multiprecision::uint128_t( cost_per_byte ) * bytes;

  if( cost > std::numeric_limits< gas::gas >::max() )
    return std::unexpected( gas::gas_error( gas::gas_errc::gas_overflow, descriptor ) );

  return meter.consume_gas( cost.convert_to< gas::gas >(), descriptor );
}

} // namespace

/*
 * Gas iterator
 */

gas_iterator::gas_iterator( backends::iterator itr, gas::gas_meter& meter, const gas::gas_config& config ):
    _itr( std::move( itr ) ),
    _meter( &meter ),
    _config( config )
{}

bool gas_iterator::valid() const
{
  return _itr.valid();
}

const entry_type& gas_iterator::operator*() const
{
  return *_itr;
}

const entry_type* gas_iterator::operator->() const
{
  return &*_itr;
}

gas::result< void > gas_iterator::next()
{
  if( !_itr.valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  if( auto result = consume_seek_gas(); !result )
    return result;

  ++_itr;

  return {};
}

gas::result< void > gas_iterator::consume_seek_gas()
{
  if( _itr.valid() )
  {
    if( auto result =
          consume_per_byte( *_meter, _config.read_cost_per_byte, _itr->first.size(), gas::descriptor::value_per_byte );
        !result )
      return result;

    if( auto result =
          consume_per_byte( *_meter, _config.read_cost_per_byte, _itr->second.size(), gas::descriptor::value_per_byte );
        !result )
      return result;
  }

  return _meter->consume_gas( _config.iter_next_cost_flat, gas::descriptor::iter_next_flat );
}

/*
 * Gas store
 */

gas_store::gas_store( backends::abstract_backend& parent, gas::gas_meter& meter, const gas::gas_config& config ):
    _parent( parent ),
    _meter( meter ),
    _config( config )
{}

gas::result< std::optional< value_type > > gas_store::get( const key_type& key )
{
  if( auto result = _meter.consume_gas( _config.read_cost_flat, gas::descriptor::read_flat ); !result )
    return std::unexpected( result.error() );

  std::optional< value_type > value;
  if( auto bytes = _parent.get( key ); bytes )
    value.emplace( bytes->begin(), bytes->end() );

  if( auto result = consume_per_byte( _meter, _config.read_cost_per_byte, key.size(), gas::descriptor::read_per_byte );
      !result )
    return std::unexpected( result.error() );

  if( auto result = consume_per_byte( _meter,
                                      _config.read_cost_per_byte,
                                      value ? value->size() : 0,
                                      gas::descriptor::read_per_byte );
      !result )
    return std::unexpected( result.error() );

  return value;
}

gas::result< void > gas_store::put( key_type&& key, value_type&& value )
{
  if( auto result = _meter.consume_gas( _config.write_cost_flat, gas::descriptor::write_flat ); !result )
    return result;

  if( auto result =
        consume_per_byte( _meter, _config.write_cost_per_byte, key.size(), gas::descriptor::write_per_byte );
      !result )
    return result;

  if( auto result =
        consume_per_byte( _meter, _config.write_cost_per_byte, value.size(), gas::descriptor::write_per_byte );
      !result )
    return result;

  _parent.put( std::move( key ), std::move( value ) );

  return {};
}

gas::result< bool > gas_store::has( const key_type& key )
{
  if( auto result = _meter.consume_gas( _config.has_cost, gas::descriptor::has ); !result )
    return std::unexpected( result.error() );

  return _parent.get( key ).has_value();
}

gas::result< void > gas_store::remove( const key_type& key )
{
  if( auto result = _meter.consume_gas( _config.delete_cost, gas::descriptor::remove ); !result )
    return result;

  _parent.remove( key );

  return {};
}

gas::result< gas_iterator > gas_store::iterate()
{
  gas_iterator itr( _parent.begin(), _meter, _config );

  if( auto result = itr.consume_seek_gas(); !result )
    return std::unexpected( result.error() );

  return itr;
}

const gas::gas_config& gas_store::config() const noexcept
{
  return _config;
}

const gas::gas_meter& gas_store::meter() const noexcept
{
  return _meter;
}

} // namespace kvgas::store
