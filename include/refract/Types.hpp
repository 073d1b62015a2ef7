#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

namespace refract {

using uz = std::size_t;
using u8 = std::uint8_t;

using Unit = std::monostate;

} // namespace refract
