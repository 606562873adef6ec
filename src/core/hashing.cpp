#include "rsopt/core/hashing.h"

namespace rsopt::core {

std::uint64_t stable_hash64(const std::string_view input) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    // Cast through unsigned char to avoid sign-extension.
    const auto c = static_cast<unsigned char>(ch);
    hash ^= static_cast<std::uint64_t>(c);
    hash *= kPrime;
  }
  return hash;
}

}  // namespace rsopt::core
