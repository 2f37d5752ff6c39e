// Repository: pixelctl
// Component: Preview Types
// Purpose: Render options, cache key and the renderer collaborator boundary.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PREVIEW_PREVIEW_TYPES_HPP_
#define PIXELCTL_PREVIEW_PREVIEW_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pixelctl::preview {

enum class TerminalProtocol : uint8_t {
  kKitty,       // Kitty graphics protocol, base64 RGB.
  kSixel,       // DEC sixel, 216-colour palette.
  kHalfBlocks,  // U+2580 with 24-bit ANSI colours, works anywhere.
  kNone,        // No graphics; previews are unavailable.
};

const char* ToString(TerminalProtocol protocol);
bool ParseTerminalProtocol(const std::string& text, TerminalProtocol* out);

struct RenderOptions {
  uint32_t width_cells = 40;
  uint32_t height_cells = 20;
  bool preserve_aspect = true;
  // Bicubic instead of bilinear scaling.
  bool high_quality = true;
  TerminalProtocol protocol = TerminalProtocol::kHalfBlocks;

  bool operator==(const RenderOptions& o) const {
    return width_cells == o.width_cells && height_cells == o.height_cells &&
           preserve_aspect == o.preserve_aspect &&
           high_quality == o.high_quality && protocol == o.protocol;
  }
  bool operator!=(const RenderOptions& o) const { return !(*this == o); }
};

// Cache identity. path is canonicalized by PreviewService before use.
struct PreviewKey {
  std::string path;
  RenderOptions options;

  bool operator==(const PreviewKey& o) const {
    return path == o.path && options == o.options;
  }
};

struct PreviewKeyHash {
  size_t operator()(const PreviewKey& key) const;
};

// Absolute, with "." and ".." removed and symlinks resolved where the path
// exists. Returns the input unchanged when it cannot be resolved.
std::string CanonicalArtifactPath(const std::string& path);

using PreviewBytes = std::shared_ptr<const std::string>;

struct RenderResult {
  bool success = false;
  PreviewBytes bytes;
  std::string error;

  static RenderResult Success(std::string rendered) {
    RenderResult r;
    r.success = true;
    r.bytes = std::make_shared<const std::string>(std::move(rendered));
    return r;
  }

  static RenderResult Failure(std::string message) {
    RenderResult r;
    r.error = std::move(message);
    return r;
  }
};

// Terminal graphics backend. Render() runs on the preview worker thread and
// must not touch UI state.
class IPreviewRenderer {
 public:
  virtual ~IPreviewRenderer() = default;
  virtual RenderResult Render(const std::string& path,
                              const RenderOptions& options) = 0;
};

}  // namespace pixelctl::preview

#endif  // PIXELCTL_PREVIEW_PREVIEW_TYPES_HPP_
