#pragma once

#include <kvgas/gas/error.hpp>
#include <kvgas/gas/gas_config.hpp>
#include <kvgas/gas/gas_meter.hpp>
#include <kvgas/store/backends/backend.hpp>
#include <kvgas/store/types.hpp>

#include <optional>

namespace kvgas::store {

class gas_store;

/*
 * Forward iterator that charges seek gas for every entry it is positioned
 * on before moving past it.
 */
class gas_iterator final
{
public:
  gas_iterator( const gas_iterator& )            = delete;
  gas_iterator( gas_iterator&& )                 = default;
  gas_iterator& operator=( const gas_iterator& ) = delete;
  gas_iterator& operator=( gas_iterator&& )      = default;
  ~gas_iterator()                                = default;

  bool valid() const;

  const entry_type& operator*() const;
  const entry_type* operator->() const;

  [[nodiscard]] gas::result< void > next();

private:
  friend class gas_store;

  gas_iterator( backends::iterator itr, gas::gas_meter& meter, const gas::gas_config& config );

  gas::result< void > consume_seek_gas();

  backends::iterator _itr;
  gas::gas_meter* _meter;
  gas::gas_config _config;
};

/*
 * Wraps a backend and charges a gas meter for every access. A failed charge
 * is returned before the backend is touched by the operation that follows it.
 */
class gas_store final
{
public:
  gas_store( backends::abstract_backend& parent, gas::gas_meter& meter, const gas::gas_config& config );
  gas_store( const gas_store& )            = delete;
  gas_store( gas_store&& )                 = delete;
  gas_store& operator=( const gas_store& ) = delete;
  gas_store& operator=( gas_store&& )      = delete;
  ~gas_store()                             = default;

  [[nodiscard]] gas::result< std::optional< value_type > > get( const key_type& key );
  [[nodiscard]] gas::result< void > put( key_type&& key, value_type&& value );
  [[nodiscard]] gas::result< bool > has( const key_type& key );
  [[nodiscard]] gas::result< void > remove( const key_type& key );

  [[nodiscard]] gas::result< gas_iterator > iterate();

  const gas::gas_config& config() const noexcept;
  const gas::gas_meter& meter() const noexcept;

private:
  backends::abstract_backend& _parent;
  gas::gas_meter& _meter;
  gas::gas_config _config;
};

} // namespace kvgas::store
