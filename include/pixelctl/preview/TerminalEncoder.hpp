// Repository: pixelctl
// Component: Terminal Encoder
// Purpose: Encodes RGB images as kitty, sixel or ANSI half-block escape
//          sequences and picks the protocol for the current terminal.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PREVIEW_TERMINAL_ENCODER_HPP_
#define PIXELCTL_PREVIEW_TERMINAL_ENCODER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "pixelctl/preview/PreviewTypes.hpp"

namespace pixelctl::preview {

// Packed RGB24, row-major, no padding.
struct RgbImage {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> pixels;

  bool Valid() const {
    return width > 0 && height > 0 &&
           pixels.size() == static_cast<size_t>(width) * height * 3;
  }
};

struct PixelSize {
  uint32_t width = 0;
  uint32_t height = 0;
};

inline constexpr uint32_t kCellWidthPx = 8;
inline constexpr uint32_t kCellHeightPx = 16;
inline constexpr uint32_t kMaxTargetPx = 8192;

// Pixel box for the options' cell area (half-blocks: 1x2 pixels per cell,
// otherwise kCellWidthPx x kCellHeightPx). With preserve_aspect the source
// is fitted inside the box. Never upscales. Never returns a zero dimension;
// each side of the box is capped at kMaxTargetPx.
PixelSize ComputeTargetSize(uint32_t src_width, uint32_t src_height,
                            const RenderOptions& options);

using EnvLookup = std::function<const char*(const char*)>;

// PIXELCTL_IMAGE_PROTOCOL overrides. Otherwise kitty for KITTY_WINDOW_ID,
// TERM containing "kitty" or TERM_PROGRAM WezTerm/ghostty; sixel for TERM
// containing "sixel", mlterm, foot or yaft; half-blocks for anything else;
// none for TERM=dumb or unset.
TerminalProtocol DetectTerminalProtocol(const EnvLookup& env);
TerminalProtocol DetectTerminalProtocol();

std::string Base64Encode(const uint8_t* data, size_t len);

// The image must already be at its display size.
std::string EncodeKitty(const RgbImage& image, const RenderOptions& options);
std::string EncodeSixel(const RgbImage& image);
std::string EncodeHalfBlocks(const RgbImage& image);

// Dispatch on options.protocol. Empty string for kNone or invalid images.
std::string EncodeForTerminal(const RgbImage& image, const RenderOptions& options);

}  // namespace pixelctl::preview

#endif  // PIXELCTL_PREVIEW_TERMINAL_ENCODER_HPP_
