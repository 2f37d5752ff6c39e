// Repository: pixelctl
// Component: Model Catalog
// Purpose: Lists model files available to the worker.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_MODELS_MODEL_CATALOG_HPP_
#define PIXELCTL_MODELS_MODEL_CATALOG_HPP_

#include <string>
#include <vector>

#include "pixelctl/protocol/Messages.hpp"

namespace pixelctl::models {

// ModelCatalog scans <root>/checkpoints, <root>/loras and <root>/vae (not
// recursive) for .safetensors, .ckpt, .pt and .pth files. Missing
// directories are logged and skipped. Every List() rescans, so files added
// while the daemon runs show up without a restart.
class ModelCatalog {
 public:
  explicit ModelCatalog(std::string root);

  // Sorted by name, case-insensitive; kind breaks ties.
  std::vector<protocol::ModelInfo> List() const;

  const std::string& root() const { return root_; }

  // True for a recognised weight file extension (case-insensitive).
  static bool IsModelFile(const std::string& filename);

 private:
  void ScanDirectory(const std::string& subdir, protocol::ModelKind kind,
                     std::vector<protocol::ModelInfo>* out) const;

  const std::string root_;
};

}  // namespace pixelctl::models

#endif  // PIXELCTL_MODELS_MODEL_CATALOG_HPP_
