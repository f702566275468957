#include <kvgas/store/backends/map/map_backend.hpp>

namespace kvgas::store::backends::map {

map_backend::map_backend():
    abstract_backend()
{}

map_backend::~map_backend() {}

iterator map_backend::begin() noexcept
{
  return iterator( std::make_unique< map_iterator >( _map.begin(), _map ) );
}

iterator map_backend::end() noexcept
{
  return iterator( std::make_unique< map_iterator >( _map.end(), _map ) );
}

void map_backend::put( key_type&& key, value_type&& value )
{
  _map.insert_or_assign( std::move( key ), std::move( value ) );
}

std::optional< std::span< const std::byte > > map_backend::get( const key_type& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void map_backend::remove( const key_type& key )
{
  _map.erase( key );
}

void map_backend::clear() noexcept
{
  _map.clear();
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

} // namespace kvgas::store::backends::map
