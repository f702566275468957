#pragma once

#include <kvgas/store/types.hpp>

#include <memory>

namespace kvgas::store::backends {

class iterator;

class abstract_iterator
{
public:
  abstract_iterator()                                      = default;
  abstract_iterator( const abstract_iterator& )            = default;
  abstract_iterator( abstract_iterator&& )                 = delete;
  abstract_iterator& operator=( const abstract_iterator& ) = default;
  abstract_iterator& operator=( abstract_iterator&& )      = delete;
  virtual ~abstract_iterator()                             = default;

  virtual const entry_type& operator*() const = 0;

  virtual abstract_iterator& operator++() = 0;

private:
  friend class iterator;

  virtual bool valid() const                                = 0;
  virtual std::unique_ptr< abstract_iterator > copy() const = 0;
};

class iterator final
{
public:
  iterator( std::unique_ptr< abstract_iterator > );
  iterator( const iterator& other );
  iterator( iterator&& other ) noexcept;
  ~iterator() = default;

  const entry_type& operator*() const;
  const entry_type* operator->() const;

  iterator& operator++();

  iterator& operator=( const iterator& other );
  iterator& operator=( iterator&& other ) noexcept;

  bool valid() const;

  friend bool operator==( const iterator& x, const iterator& y );
  friend bool operator!=( const iterator& x, const iterator& y );

private:
  std::unique_ptr< abstract_iterator > _itr;
};

} // namespace kvgas::store::backends
