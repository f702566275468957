#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace kvgas::gas {

using gas        = std::uint64_t;
using gas_report = std::map< std::string, gas, std::less<> >;

namespace descriptor {

using namespace std::string_view_literals;

constexpr auto iter_next_flat = "IterNextFlat"sv;
constexpr auto value_per_byte = "ValuePerByte"sv;
constexpr auto write_per_byte = "WritePerByte"sv;
constexpr auto read_per_byte  = "ReadPerByte"sv;
constexpr auto write_flat     = "WriteFlat"sv;
constexpr auto read_flat      = "ReadFlat"sv;
constexpr auto has            = "Has"sv;
constexpr auto remove         = "Delete"sv;

} // namespace descriptor

} // namespace kvgas::gas
