// Repository: pixelctl
// Component: Model Catalog
// Purpose: Lists model files available to the worker.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/models/ModelCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::models {

using pixelctl::util::Logger;

namespace fs = std::filesystem;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

constexpr double kBytesPerMb = 1024.0 * 1024.0;

}  // namespace

ModelCatalog::ModelCatalog(std::string root) : root_(std::move(root)) {}

bool ModelCatalog::IsModelFile(const std::string& filename) {
  const std::string ext = Lower(fs::path(filename).extension().string());
  return ext == ".safetensors" || ext == ".ckpt" || ext == ".pt" ||
         ext == ".pth";
}

std::vector<protocol::ModelInfo> ModelCatalog::List() const {
  std::vector<protocol::ModelInfo> out;
  ScanDirectory("checkpoints", protocol::ModelKind::kCheckpoint, &out);
  ScanDirectory("loras", protocol::ModelKind::kLora, &out);
  ScanDirectory("vae", protocol::ModelKind::kVae, &out);

  std::sort(out.begin(), out.end(),
            [](const protocol::ModelInfo& a, const protocol::ModelInfo& b) {
              const std::string la = Lower(a.name);
              const std::string lb = Lower(b.name);
              if (la != lb) return la < lb;
              return a.kind < b.kind;
            });
  return out;
}

void ModelCatalog::ScanDirectory(const std::string& subdir,
                                 protocol::ModelKind kind,
                                 std::vector<protocol::ModelInfo>* out) const {
  const fs::path dir = fs::path(root_) / subdir;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    Logger::Warn("[ModelCatalog] DIRECTORY_MISSING path=" + dir.string());
    return;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    Logger::Warn("[ModelCatalog] DIRECTORY_UNREADABLE path=" + dir.string() +
                 " error=\"" + ec.message() + "\"");
    return;
  }

  size_t found = 0;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;
    const std::string filename = entry.path().filename().string();
    if (!IsModelFile(filename)) continue;

    const uintmax_t bytes = entry.file_size(entry_ec);
    protocol::ModelInfo info;
    info.name = filename;
    info.path = entry.path().string();
    info.kind = kind;
    info.size_mb = entry_ec ? 0.0 : static_cast<double>(bytes) / kBytesPerMb;
    out->push_back(std::move(info));
    ++found;
  }
  // increment() leaves the iterator at end on error; keep what was listed.
  if (ec) {
    Logger::Warn("[ModelCatalog] LISTING_INTERRUPTED path=" + dir.string() +
                 " error=\"" + ec.message() + "\" files=" + std::to_string(found));
  }

  std::ostringstream oss;
  oss << "[ModelCatalog] SCANNED kind=" << protocol::ToString(kind)
      << " path=" << dir.string() << " files=" << found;
  Logger::Debug(oss.str());
}

}  // namespace pixelctl::models
