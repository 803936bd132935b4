#pragma once

namespace wv::version
{

// Compile-time helpers derived from WV_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = WV_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "wvbridge " WV_BUILD_VERSION;

} // namespace wv::version
