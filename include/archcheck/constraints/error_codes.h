#pragma once

#include <string_view>

namespace archcheck::constraints::codes {

// Stable identifiers external tooling keys on. Never renumber.

// Rule violations.
inline constexpr std::string_view kMustExtend = "E001";
inline constexpr std::string_view kImplements = "E002";
inline constexpr std::string_view kForbidImport = "E003";
inline constexpr std::string_view kRequireImport = "E004";
inline constexpr std::string_view kRequireDecorator = "E005";
inline constexpr std::string_view kForbidDecorator = "E006";
inline constexpr std::string_view kNamingPattern = "E007";
inline constexpr std::string_view kLocationPattern = "E008";
inline constexpr std::string_view kMaxPublicMethods = "E009";
inline constexpr std::string_view kMaxFileLines = "E010";
inline constexpr std::string_view kRequireTestFile = "E011";
inline constexpr std::string_view kForbidCall = "E014";
inline constexpr std::string_view kRequireTryCatch = "E015";
inline constexpr std::string_view kForbidMutation = "E016";
inline constexpr std::string_view kRequireCall = "E017";
inline constexpr std::string_view kRequirePattern = "E018";
inline constexpr std::string_view kRequireExport = "E019";
inline constexpr std::string_view kRequireCallBefore = "E020";
inline constexpr std::string_view kForbidPattern = "E021";
inline constexpr std::string_view kRequireOneOf = "E022";
inline constexpr std::string_view kRequireCoverage = "E023";
inline constexpr std::string_view kMaxSimilarity = "E024";
inline constexpr std::string_view kRequireCompanionCall = "E025";
inline constexpr std::string_view kRequireCompanionFile = "E026";

// Orchestrator findings.
inline constexpr std::string_view kMixinOrSingleton = "E027";
inline constexpr std::string_view kMissingExpectedIntent = "E028";
inline constexpr std::string_view kDeprecatedArchitecture = "W001";
inline constexpr std::string_view kMissingWhy = "C001";
inline constexpr std::string_view kUnknownIntent = "I001";
inline constexpr std::string_view kInvalidOverride = "O003";
inline constexpr std::string_view kOverrideLimit = "O005";

// Configuration and internal errors.
inline constexpr std::string_view kUntagged = "S001";
inline constexpr std::string_view kUnknownArchitecture = "S002";
inline constexpr std::string_view kCircularInheritance = "S003";
inline constexpr std::string_view kMissingMixin = "S004";
inline constexpr std::string_view kInvalidCondition = "S005";
inline constexpr std::string_view kInternalError = "S999";

}  // namespace archcheck::constraints::codes
