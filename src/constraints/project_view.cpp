#include "archcheck/constraints/project_view.h"

#include "archcheck/core/glob.h"
#include "archcheck/core/text.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace archcheck::constraints {

void InMemoryProjectView::add_file(const std::string& path, std::string content) {
  files_[core::normalize_path(path)] = std::move(content);
}

void InMemoryProjectView::add_model(semantic::SemanticModel model, std::string arch_id) {
  const std::string path = core::normalize_path(model.file_path);
  if (files_.find(path) == files_.end()) {
    files_[path] = model.content;
  }
  models_[path] = StoredModel{std::move(arch_id), std::move(model)};
}

bool InMemoryProjectView::exists(const std::string& path) const {
  return files_.find(core::normalize_path(path)) != files_.end();
}

std::optional<std::string> InMemoryProjectView::read(const std::string& path) const {
  const auto it = files_.find(core::normalize_path(path));
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> InMemoryProjectView::list(const std::string& glob) const {
  std::vector<std::string> matches;
  for (const auto& [path, _] : files_) {
    if (core::glob_match(glob, path)) {
      matches.push_back(path);
    }
  }
  return matches;
}

std::vector<PeerFile> InMemoryProjectView::peers() const {
  std::vector<PeerFile> out;
  out.reserve(models_.size());
  for (const auto& [path, stored] : models_) {
    out.push_back(PeerFile{path, stored.arch_id, &stored.model});
  }
  return out;
}

FilesystemProjectView::FilesystemProjectView(std::filesystem::path root)
    : root_(std::move(root)) {}

bool FilesystemProjectView::exists(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(root_ / core::normalize_path(path), ec);
}

std::optional<std::string> FilesystemProjectView::read(const std::string& path) const {
  std::ifstream in(root_ / core::normalize_path(path), std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::vector<std::string> FilesystemProjectView::list(const std::string& glob) const {
  std::vector<std::string> matches;
  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      root_, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return matches;
  }
  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const std::string relative = it->path().lexically_relative(root_).generic_string();
    if (core::glob_match(glob, relative)) {
      matches.push_back(relative);
    }
  }
  std::sort(matches.begin(), matches.end());
  return matches;
}

}  // namespace archcheck::constraints
