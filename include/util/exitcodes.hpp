#pragma once

namespace exitc
{
inline constexpr int ok            = 0;
inline constexpr int bad_args      = 2;
inline constexpr int bad_config    = 3;
inline constexpr int encode_failed = 4;
inline constexpr int decode_failed = 5;
inline constexpr int incomplete    = 6;  // stdin closed before every frame arrived
}  // namespace exitc
