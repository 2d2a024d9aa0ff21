#pragma once

#include "archcheck/core/text.h"
#include "archcheck/semantic/language_adapter.h"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace archcheck::testing {

// Line-oriented stand-in for a TypeScript adapter, enough for engine tests. One declaration
// per line:
//   import { a, b } from 'm';  import x from 'm';  import 'm';
//   [export] [default] [abstract] class A [extends B] [implements C, D] {
//   [export] [async] function f(...) {
//   [public|private|protected] [static] [async] name(...) {     (class body only)
//   @Decorator(...)                                              (line before a class or method)
//   callee(args)   x.y = 1   x.y++   delete x.y                  (any line)
//   export const name = ...
// A block ends on the line where its braces balance. Content containing
// "<<<syntax error>>>" fails to parse.
class FakeLanguageAdapter final : public semantic::ILanguageAdapter {
 public:
  [[nodiscard]] std::string_view language_id() const noexcept override { return "typescript"; }

  [[nodiscard]] core::Result<semantic::SemanticModel, semantic::AdapterError> parse_file(
      const std::string& path, const std::string& content) const override;
};

namespace detail {

enum class BlockKind {
  kClass,
  kFunction,
  kMethod,
  kTry,
};

struct OpenBlock {
  BlockKind kind{BlockKind::kFunction};
  int depth{0};
  std::size_t index{0};  // class / function index
  std::size_t method{0};
  std::string name;
};

inline std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> items;
  for (const auto& piece : core::split(text, ',')) {
    const std::string item = core::trim(piece);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

inline bool is_keyword(const std::string& word) {
  return word == "if" || word == "for" || word == "while" || word == "switch" ||
         word == "catch" || word == "function" || word == "return" || word == "typeof";
}

}  // namespace detail

inline core::Result<semantic::SemanticModel, semantic::AdapterError>
FakeLanguageAdapter::parse_file(const std::string& path, const std::string& content) const {
  using ParseResult = core::Result<semantic::SemanticModel, semantic::AdapterError>;
  using detail::BlockKind;
  using detail::OpenBlock;

  if (core::contains(content, "<<<syntax error>>>")) {
    return ParseResult::err(semantic::AdapterError{"Unexpected token"});
  }

  static const std::regex kImportNamed(
      R"re(^\s*import\s+(type\s+)?\{([^}]*)\}\s*from\s*['"]([^'"]+)['"])re");
  static const std::regex kImportDefault(R"re(^\s*import\s+(\w+)\s+from\s*['"]([^'"]+)['"])re");
  static const std::regex kImportBare(R"re(^\s*import\s*['"]([^'"]+)['"])re");
  static const std::regex kClass(
      R"(^\s*(export\s+)?(default\s+)?(abstract\s+)?class\s+(\w+)(?:\s+extends\s+([\w.]+(?:<[^>]*>)?))?(?:\s+implements\s+([^{]+?))?\s*\{)");
  static const std::regex kFunction(R"(^\s*(export\s+)?(async\s+)?function\s+(\w+)\s*\()");
  static const std::regex kMethod(
      R"(^\s*(public\s+|private\s+|protected\s+)?(static\s+)?(async\s+)?(\w+)\s*\([^)]*\)[^{;]*\{)");
  static const std::regex kDecorator(R"(^\s*@(\w+)(?:\(([^)]*)\))?\s*$)");
  static const std::regex kCall(R"(([A-Za-z_$][\w$]*(?:\.[A-Za-z_$][\w$]*)*)\s*\(([^()]*)\))");
  static const std::regex kAssign(
      R"(^\s*([A-Za-z_$][\w$]*(?:\.[A-Za-z_$][\w$]*)+)\s*(\+=|-=|=)(?!=))");
  static const std::regex kUpdate(R"(([A-Za-z_$][\w$]*(?:\.[A-Za-z_$][\w$]*)+)(\+\+|--))");
  static const std::regex kDelete(R"(\bdelete\s+([A-Za-z_$][\w$]*(?:\.[A-Za-z_$][\w$]*)+))");
  static const std::regex kExportConst(R"(^\s*export\s+(?:const|let|var)\s+(\w+))");

  semantic::SemanticModel model;
  model.file_path = path;
  model.file_name = core::path_basename(path);
  model.extension = core::path_extension(path);
  model.language = "typescript";
  model.content = content;

  const auto lines = core::split_lines(content);
  model.line_count = static_cast<int>(lines.size());

  std::vector<OpenBlock> blocks;
  std::vector<semantic::DecoratorInfo> pending_decorators;
  int depth = 0;
  bool in_block_comment = false;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const int ln = static_cast<int>(i) + 1;
    const std::string& line = lines[i];
    const std::string trimmed = core::trim(line);

    if (in_block_comment) {
      if (core::contains(trimmed, "*/")) {
        in_block_comment = false;
      }
      continue;
    }
    if (trimmed.empty() || trimmed.rfind("//", 0) == 0) {
      continue;
    }
    if (trimmed.rfind("/*", 0) == 0) {
      in_block_comment = !core::contains(trimmed, "*/");
      continue;
    }
    ++model.loc_count;

    std::smatch m;
    if (std::regex_match(line, m, kDecorator)) {
      semantic::DecoratorInfo decorator;
      decorator.name = m[1].str();
      if (m[2].matched) {
        decorator.arguments = detail::split_list(m[2].str());
      }
      decorator.location = semantic::SourceLocation{ln, static_cast<int>(line.find('@')) + 1};
      pending_decorators.push_back(std::move(decorator));
      continue;
    }

    const std::size_t indent = line.find_first_not_of(" \t");
    const semantic::SourceLocation start{ln, static_cast<int>(indent) + 1};
    bool declaration = false;

    if (std::regex_search(line, m, kImportNamed)) {
      semantic::ImportInfo imp;
      imp.is_type_only = m[1].matched;
      imp.named_imports = detail::split_list(m[2].str());
      imp.module_specifier = m[3].str();
      imp.location = start;
      model.imports.push_back(std::move(imp));
      declaration = true;
    } else if (std::regex_search(line, m, kImportDefault)) {
      semantic::ImportInfo imp;
      imp.default_import = m[1].str();
      imp.module_specifier = m[2].str();
      imp.location = start;
      model.imports.push_back(std::move(imp));
      declaration = true;
    } else if (std::regex_search(line, m, kImportBare)) {
      semantic::ImportInfo imp;
      imp.module_specifier = m[1].str();
      imp.location = start;
      model.imports.push_back(std::move(imp));
      declaration = true;
    } else if (std::regex_search(line, m, kClass)) {
      semantic::ClassInfo cls;
      cls.name = m[4].str();
      cls.is_exported = m[1].matched;
      cls.is_abstract = m[3].matched;
      if (m[5].matched) {
        cls.extends = m[5].str();
      }
      if (m[6].matched) {
        cls.implements = detail::split_list(m[6].str());
      }
      cls.decorators = std::move(pending_decorators);
      cls.location = start;
      if (cls.is_exported) {
        model.exports.push_back(semantic::ExportInfo{cls.name, semantic::ExportKind::kClass,
                                                     m[2].matched, start});
      }
      blocks.push_back(OpenBlock{BlockKind::kClass, depth, model.classes.size(), 0, cls.name});
      model.classes.push_back(std::move(cls));
      declaration = true;
    } else if (std::regex_search(line, m, kFunction)) {
      semantic::FunctionInfo fn;
      fn.name = m[3].str();
      fn.is_exported = m[1].matched;
      fn.is_async = m[2].matched;
      fn.decorators = std::move(pending_decorators);
      fn.location = start;
      if (fn.is_exported) {
        model.exports.push_back(
            semantic::ExportInfo{fn.name, semantic::ExportKind::kFunction, false, start});
      }
      blocks.push_back(OpenBlock{BlockKind::kFunction, depth, model.functions.size(), 0, fn.name});
      model.functions.push_back(std::move(fn));
      declaration = true;
    } else if (!blocks.empty() && blocks.back().kind == BlockKind::kClass &&
               depth == blocks.back().depth + 1 && std::regex_search(line, m, kMethod) &&
               !detail::is_keyword(m[4].str())) {
      auto& cls = model.classes[blocks.back().index];
      semantic::MethodInfo method;
      method.name = m[4].str();
      const std::string visibility = core::trim(m[1].str());
      if (visibility == "private") {
        method.visibility = semantic::Visibility::kPrivate;
      } else if (visibility == "protected") {
        method.visibility = semantic::Visibility::kProtected;
      }
      method.is_static = m[2].matched;
      method.decorators = std::move(pending_decorators);
      method.location = start;
      const std::size_t class_index = blocks.back().index;
      blocks.push_back(
          OpenBlock{BlockKind::kMethod, depth, class_index, cls.methods.size(), method.name});
      cls.methods.push_back(std::move(method));
      declaration = true;
    } else if (std::regex_search(line, m, kExportConst)) {
      model.exports.push_back(
          semantic::ExportInfo{m[1].str(), semantic::ExportKind::kVariable, false, start});
    }
    pending_decorators.clear();

    if (trimmed.rfind("try", 0) == 0 && core::contains(trimmed, "{")) {
      blocks.push_back(OpenBlock{BlockKind::kTry, depth, 0, 0, ""});
    }

    if (!declaration) {
      std::optional<std::string> parent;
      int try_depth = 0;
      for (const auto& block : blocks) {
        if (block.kind == BlockKind::kFunction || block.kind == BlockKind::kMethod) {
          parent = block.name;
        } else if (block.kind == BlockKind::kTry) {
          ++try_depth;
        }
      }

      for (std::sregex_iterator it(line.begin(), line.end(), kCall), end; it != end; ++it) {
        const auto& call_match = *it;
        const std::string callee = call_match[1].str();
        if (detail::is_keyword(callee)) {
          continue;
        }
        semantic::FunctionCallInfo call;
        call.callee = callee;
        const auto dot = callee.rfind('.');
        call.method_name = dot == std::string::npos ? callee : callee.substr(dot + 1);
        if (dot != std::string::npos) {
          call.receiver = callee.substr(0, dot);
        }
        call.arguments = detail::split_list(call_match[2].str());
        const auto position = static_cast<std::size_t>(call_match.position(0));
        call.location = semantic::SourceLocation{ln, static_cast<int>(position) + 1};
        call.raw_text = call_match[0].str();
        call.control_flow.in_try_block = try_depth > 0;
        call.control_flow.try_depth = try_depth;
        call.is_constructor_call =
            position >= 4 && line.compare(position - 4, 4, "new ") == 0;
        call.parent_function = parent;
        model.function_calls.push_back(std::move(call));
      }

      if (std::regex_search(line, m, kDelete)) {
        semantic::MutationInfo mutation;
        mutation.target = m[1].str();
        mutation.op = semantic::MutationOperator::kDelete;
        mutation.location = start;
        model.mutations.push_back(std::move(mutation));
      } else if (std::regex_search(line, m, kUpdate)) {
        semantic::MutationInfo mutation;
        mutation.target = m[1].str();
        mutation.op = m[2].str() == "++" ? semantic::MutationOperator::kIncrement
                                         : semantic::MutationOperator::kDecrement;
        mutation.location = start;
        model.mutations.push_back(std::move(mutation));
      } else if (std::regex_search(line, m, kAssign)) {
        semantic::MutationInfo mutation;
        mutation.target = m[1].str();
        mutation.op = m[2].str() == "=" ? semantic::MutationOperator::kAssign
                                        : semantic::MutationOperator::kCompoundAssign;
        mutation.location = start;
        model.mutations.push_back(std::move(mutation));
      }
    }

    for (const char ch : line) {
      if (ch == '{') {
        ++depth;
      } else if (ch == '}') {
        --depth;
        if (!blocks.empty() && blocks.back().depth == depth) {
          const OpenBlock closed = blocks.back();
          blocks.pop_back();
          if (closed.kind == BlockKind::kClass) {
            model.classes[closed.index].end_line = ln;
          } else if (closed.kind == BlockKind::kFunction) {
            model.functions[closed.index].end_line = ln;
          } else if (closed.kind == BlockKind::kMethod) {
            model.classes[closed.index].methods[closed.method].end_line = ln;
          }
        }
      }
    }
  }

  for (auto& mutation : model.mutations) {
    const auto parts = core::split(mutation.target, '.');
    mutation.root_object = parts.front();
    mutation.property_path.assign(parts.begin() + 1, parts.end());
  }
  return ParseResult::ok(std::move(model));
}

}  // namespace archcheck::testing
