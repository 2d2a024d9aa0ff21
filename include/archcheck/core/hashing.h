#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace archcheck::core {

// FNV-1a 64-bit. Stable across platforms; used for the audit hash chain.
std::uint64_t stable_hash64(std::string_view input);

// 16 lowercase hex digits.
std::string stable_hash64_hex(std::string_view input);

}  // namespace archcheck::core
