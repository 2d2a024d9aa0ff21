#pragma once

#include "archcheck/semantic/semantic_model.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace archcheck::constraints {

// A parsed file other rules may compare against (max_similarity).
struct PeerFile {
  std::string path;
  std::string arch_id;
  const semantic::SemanticModel* model{nullptr};
};

// Read-only view of the rest of the project for cross-file rules. Paths are relative to the
// project root and '/'-separated. Implementations must tolerate concurrent reads.
class IProjectView {
 public:
  virtual ~IProjectView() = default;

  [[nodiscard]] virtual bool exists(const std::string& path) const = 0;
  [[nodiscard]] virtual std::optional<std::string> read(const std::string& path) const = 0;
  // Sorted paths matching a glob.
  [[nodiscard]] virtual std::vector<std::string> list(const std::string& glob) const = 0;
  [[nodiscard]] virtual std::vector<PeerFile> peers() const { return {}; }

 protected:
  IProjectView() = default;
  IProjectView(const IProjectView&) = default;
  IProjectView& operator=(const IProjectView&) = default;
  IProjectView(IProjectView&&) = default;
  IProjectView& operator=(IProjectView&&) = default;
};

class InMemoryProjectView final : public IProjectView {
 public:
  void add_file(const std::string& path, std::string content);
  void add_model(semantic::SemanticModel model, std::string arch_id);

  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] std::optional<std::string> read(const std::string& path) const override;
  [[nodiscard]] std::vector<std::string> list(const std::string& glob) const override;
  [[nodiscard]] std::vector<PeerFile> peers() const override;

 private:
  struct StoredModel {
    std::string arch_id;
    semantic::SemanticModel model;
  };

  std::map<std::string, std::string> files_;
  std::map<std::string, StoredModel> models_;
};

// Reads files under a root directory. Filesystem errors read as "absent".
class FilesystemProjectView final : public IProjectView {
 public:
  explicit FilesystemProjectView(std::filesystem::path root);

  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] std::optional<std::string> read(const std::string& path) const override;
  [[nodiscard]] std::vector<std::string> list(const std::string& glob) const override;

 private:
  std::filesystem::path root_;
};

// Adds parsed peer models to another view; used for one batch run.
class PeerOverlayView final : public IProjectView {
 public:
  PeerOverlayView(const IProjectView& base, std::vector<PeerFile> peers)
      : base_(base), peers_(std::move(peers)) {}

  [[nodiscard]] bool exists(const std::string& path) const override { return base_.exists(path); }
  [[nodiscard]] std::optional<std::string> read(const std::string& path) const override {
    return base_.read(path);
  }
  [[nodiscard]] std::vector<std::string> list(const std::string& glob) const override {
    return base_.list(glob);
  }
  [[nodiscard]] std::vector<PeerFile> peers() const override { return peers_; }

 private:
  const IProjectView& base_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
  std::vector<PeerFile> peers_;
};

}  // namespace archcheck::constraints
