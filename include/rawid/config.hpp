#pragma once

namespace rawid::config {

// Set by the RAWID_ALWAYS_CHECK build option. When true the unchecked
// construction path validates like the checked one.
#if defined(RAWID_ALWAYS_CHECK) && RAWID_ALWAYS_CHECK
inline constexpr bool kAlwaysCheck = true;
#else
inline constexpr bool kAlwaysCheck = false;
#endif

}  // namespace rawid::config
