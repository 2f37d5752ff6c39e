// Repository: pixelctl
// Component: Preview Types
// Purpose: Key hashing, path canonicalization and protocol names.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/preview/PreviewTypes.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <system_error>

namespace pixelctl::preview {

const char* ToString(TerminalProtocol protocol) {
  switch (protocol) {
    case TerminalProtocol::kKitty: return "kitty";
    case TerminalProtocol::kSixel: return "sixel";
    case TerminalProtocol::kHalfBlocks: return "blocks";
    case TerminalProtocol::kNone: return "none";
  }
  return "unknown";
}

bool ParseTerminalProtocol(const std::string& text, TerminalProtocol* out) {
  std::string t = text;
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (t == "kitty") { *out = TerminalProtocol::kKitty; return true; }
  if (t == "sixel") { *out = TerminalProtocol::kSixel; return true; }
  if (t == "blocks" || t == "halfblocks" || t == "ansi") {
    *out = TerminalProtocol::kHalfBlocks;
    return true;
  }
  if (t == "none" || t == "off") { *out = TerminalProtocol::kNone; return true; }
  return false;
}

size_t PreviewKeyHash::operator()(const PreviewKey& key) const {
  size_t h = std::hash<std::string>{}(key.path);
  const RenderOptions& o = key.options;
  const uint64_t packed = (static_cast<uint64_t>(o.width_cells) << 32) ^
                          (static_cast<uint64_t>(o.height_cells) << 8) ^
                          (static_cast<uint64_t>(o.protocol) << 2) ^
                          (o.preserve_aspect ? 2u : 0u) ^
                          (o.high_quality ? 1u : 0u);
  h ^= std::hash<uint64_t>{}(packed) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
  return h;
}

std::string CanonicalArtifactPath(const std::string& path) {
  if (path.empty()) return path;
  std::error_code ec;
  std::filesystem::path p = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    p = std::filesystem::absolute(path, ec);
    if (ec) return path;
    return p.lexically_normal().string();
  }
  return p.string();
}

}  // namespace pixelctl::preview
