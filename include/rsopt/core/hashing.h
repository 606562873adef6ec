#pragma once

#include <cstdint>
#include <string_view>

namespace rsopt::core {

// FNV-1a 64-bit. Picks the deterministic stub predictor's candidates.
std::uint64_t stable_hash64(std::string_view input);

}  // namespace rsopt::core
