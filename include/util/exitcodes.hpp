#pragma once

namespace exitc
{
inline constexpr int ok        = 0;
inline constexpr int bad_args  = 2;
inline constexpr int bus_error = 3;
}  // namespace exitc
