#pragma once

namespace sw::version
{

// Compile-time helpers derived from SW_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kDisplayVersion[] = "SeedWarden " SW_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "SeedWarden/" SW_BUILD_VERSION;

} // namespace sw::version
