#pragma once

#include <optional>
#include <string>
#include <vector>

namespace archcheck::semantic {

// Language-neutral structural summary of one source file, produced by an ILanguageAdapter.
// Validators only read it.

struct SourceLocation {
  int line{1};
  int column{1};
};

struct ImportInfo {
  std::string module_specifier;
  std::vector<std::string> named_imports;
  std::optional<std::string> default_import;
  bool is_type_only{false};
  bool is_dynamic{false};
  SourceLocation location{};
};

struct DecoratorInfo {
  std::string name;  // without '@'
  std::vector<std::string> arguments;
  SourceLocation location{};
};

enum class Visibility {
  kPublic,
  kProtected,
  kPrivate,
};

struct MethodInfo {
  std::string name;
  Visibility visibility{Visibility::kPublic};
  bool is_static{false};
  bool is_abstract{false};
  std::vector<DecoratorInfo> decorators;
  std::vector<std::string> intents;
  SourceLocation location{};
  int end_line{0};
};

struct ClassInfo {
  std::string name;
  bool is_exported{false};
  bool is_abstract{false};
  std::optional<std::string> extends;
  // Ancestors beyond the direct base, nearest first, when the adapter can resolve them.
  std::vector<std::string> inheritance_chain;
  std::vector<std::string> implements;
  std::vector<DecoratorInfo> decorators;
  std::vector<MethodInfo> methods;
  SourceLocation location{};
  int end_line{0};
};

struct InterfaceInfo {
  std::string name;
  bool is_exported{false};
  std::vector<std::string> extends;
  SourceLocation location{};
};

struct FunctionInfo {
  std::string name;
  bool is_exported{false};
  bool is_async{false};
  std::vector<DecoratorInfo> decorators;
  // Function-level @intent annotations.
  std::vector<std::string> intents;
  SourceLocation location{};
  int end_line{0};
};

struct ControlFlowContext {
  bool in_try_block{false};
  bool in_catch_block{false};
  bool in_finally_block{false};
  int try_depth{0};
};

struct FunctionCallInfo {
  std::string callee;       // "a.b.c"
  std::string method_name;  // "c"
  std::optional<std::string> receiver;  // "a.b"
  std::vector<std::string> arguments;   // source text of each argument
  SourceLocation location{};
  std::string raw_text;
  ControlFlowContext control_flow{};
  bool is_constructor_call{false};
  bool is_optional_chain{false};
  std::optional<std::string> parent_function;
};

enum class MutationOperator {
  kAssign,
  kCompoundAssign,
  kIncrement,
  kDecrement,
  kDelete,
};

struct MutationInfo {
  std::string target;  // "obj.prop"
  std::string root_object;
  std::vector<std::string> property_path;
  MutationOperator op{MutationOperator::kAssign};
  SourceLocation location{};
  bool is_dynamic{false};
};

enum class ExportKind {
  kClass,
  kFunction,
  kInterface,
  kType,
  kVariable,
  kDefault,
  kReExport,
};

struct ExportInfo {
  std::string name;
  ExportKind kind{ExportKind::kVariable};
  bool is_default{false};
  SourceLocation location{};
};

struct SemanticModel {
  std::string file_path;
  std::string file_name;
  std::string extension;  // ".ts"
  std::string language;   // "typescript"
  std::string content;
  int line_count{0};
  int loc_count{0};  // non-blank, non-comment lines

  std::vector<ImportInfo> imports;
  std::vector<ClassInfo> classes;
  std::vector<InterfaceInfo> interfaces;
  std::vector<FunctionInfo> functions;
  std::vector<FunctionCallInfo> function_calls;
  std::vector<MutationInfo> mutations;
  std::vector<ExportInfo> exports;
};

}  // namespace archcheck::semantic
