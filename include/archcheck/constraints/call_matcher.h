#pragma once

#include "archcheck/semantic/semantic_model.h"

#include <string_view>

namespace archcheck::constraints {

// Matches a call against a call pattern:
//   "setTimeout"    exact callee
//   "api.*"         one member below api ("api.fetch", not "api.client.fetch")
//   "api.**"        anything below api
//   "*"             any call
//   "/^console\./"  regex over the full callee
// Other '*' globs match any run of characters within one member.
[[nodiscard]] bool callee_matches(std::string_view pattern, std::string_view callee);

[[nodiscard]] bool call_matches(std::string_view pattern, const semantic::FunctionCallInfo& call);

}  // namespace archcheck::constraints
