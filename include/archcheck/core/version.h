#pragma once

namespace archcheck::core {

// kBuildVersion is the library version string recorded in audit payloads.
constexpr const char* kBuildVersion = "0.1";

}  // namespace archcheck::core
