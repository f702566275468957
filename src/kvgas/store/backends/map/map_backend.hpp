#pragma once

#include <kvgas/store/backends/backend.hpp>
#include <kvgas/store/backends/map/map_iterator.hpp>

namespace kvgas::store::backends::map {

class map_backend final: public abstract_backend
{
public:
  map_backend();
  map_backend( const map_backend& )            = default;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = default;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() final;

  // Iterators
  iterator begin() noexcept final;
  iterator end() noexcept final;

  // Modifiers
  void put( key_type&& key, value_type&& value ) final;
  std::optional< std::span< const std::byte > > get( const key_type& key ) const final;
  void remove( const key_type& key ) final;
  void clear() noexcept final;

  std::uint64_t size() const noexcept final;

private:
  map_type _map;
};

} // namespace kvgas::store::backends::map
