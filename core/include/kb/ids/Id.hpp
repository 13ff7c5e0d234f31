#pragma once
#include <cstdint>

namespace kb {

// Assigned by PointerDispatcher when an element registers.
using ElementId = std::uint32_t;

inline constexpr ElementId kInvalidElement = 0;

// Host pointer identifier (mouse, pen, each touch contact).
using PointerId = std::int32_t;

} // namespace kb
