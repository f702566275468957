#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace kvgas::store {

using key_type   = std::vector< std::byte >;
using value_type = std::vector< std::byte >;
using entry_type = std::pair< const key_type, value_type >;

} // namespace kvgas::store
