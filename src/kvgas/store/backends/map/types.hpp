#pragma once

#include <kvgas/store/types.hpp>

#include <map>

namespace kvgas::store::backends::map {

using map_type      = std::map< key_type, value_type >;
using iterator_type = map_type::iterator;

} // namespace kvgas::store::backends::map
