#pragma once

#include <kvgas/store/backends/iterator.hpp>
#include <kvgas/store/types.hpp>

#include <cstdint>
#include <optional>
#include <span>

namespace kvgas::store::backends {

/*
 * An ordered key-value store. put overwrites an existing entry and remove of
 * a missing key does nothing.
 */
class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual iterator begin() = 0;
  virtual iterator end()   = 0;

  virtual void put( key_type&& key, value_type&& value )                                    = 0;
  virtual std::optional< std::span< const std::byte > > get( const key_type& key ) const = 0;
  virtual void remove( const key_type& key )                                               = 0;
  virtual void clear()                                                                       = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;
};

} // namespace kvgas::store::backends
