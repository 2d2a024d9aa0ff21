#include "archcheck/core/hashing.h"

#include <iomanip>
#include <sstream>

namespace archcheck::core {

std::uint64_t stable_hash64(const std::string_view input) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    // ES.46: cast through unsigned char to avoid sign extension.
    const auto c = static_cast<unsigned char>(ch);
    hash ^= static_cast<std::uint64_t>(c);
    hash *= kPrime;
  }
  return hash;
}

std::string stable_hash64_hex(const std::string_view input) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << stable_hash64(input);
  return oss.str();
}

}  // namespace archcheck::core
