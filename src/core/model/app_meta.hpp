#pragma once

#include <string_view>

#ifndef OCEAN_SENTINEL_APP_VERSION
#define OCEAN_SENTINEL_APP_VERSION "0.3.0"
#endif

#ifndef OCEAN_SENTINEL_BUILD_RELEASE
#define OCEAN_SENTINEL_BUILD_RELEASE "Registry Core"
#endif

namespace sentinel {

inline constexpr std::string_view kAppDisplayName = "Ocean Sentinel::Threat & Alert Registry";
inline constexpr std::string_view kCliName = "ocean-sentinel-cli";
inline constexpr std::string_view kAppVersion = OCEAN_SENTINEL_APP_VERSION;
inline constexpr std::string_view kBuildRelease = OCEAN_SENTINEL_BUILD_RELEASE;

}  // namespace sentinel
