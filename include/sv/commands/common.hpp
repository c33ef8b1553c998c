#pragma once

#include <cstdint>

namespace sv::commands::common
{

inline constexpr std::uint16_t About = 2100;

} // namespace sv::commands::common
