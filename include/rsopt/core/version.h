#pragma once

namespace rsopt::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3";

}  // namespace rsopt::core
