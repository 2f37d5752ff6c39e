// Repository: pixelctl
// Component: Terminal Encoder
// Purpose: kitty / sixel / half-block encoders and protocol detection.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/preview/TerminalEncoder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::preview {

using pixelctl::util::Logger;

namespace {

// Kitty limits one escape payload to 4096 bytes of base64.
constexpr size_t kKittyChunkBytes = 4096;

// Sixel colour cube levels per channel.
constexpr int kSixelLevels = 6;

// Minimum run before sixel RLE ("!<n><c>") is shorter than repeating.
constexpr int kSixelMinRun = 4;

bool Contains(const char* haystack, const char* needle) {
  return haystack != nullptr && std::strstr(haystack, needle) != nullptr;
}

int QuantizeLevel(uint8_t v) {
  return (static_cast<int>(v) * (kSixelLevels - 1) + 127) / 255;
}

void EmitSixelRun(std::ostringstream& out, char c, int run) {
  if (run <= 0) return;
  if (run >= kSixelMinRun) {
    out << '!' << run << c;
  } else {
    for (int i = 0; i < run; ++i) out << c;
  }
}

void AppendColor(std::string& out, const char* prefix, const uint8_t* px) {
  out += prefix;
  out += std::to_string(px[0]);
  out += ';';
  out += std::to_string(px[1]);
  out += ';';
  out += std::to_string(px[2]);
  out += 'm';
}

}  // namespace

PixelSize ComputeTargetSize(uint32_t src_width, uint32_t src_height,
                            const RenderOptions& options) {
  const bool half = options.protocol == TerminalProtocol::kHalfBlocks;
  const uint64_t cells_w = options.width_cells;
  const uint64_t cells_h = options.height_cells;
  const auto box_w = static_cast<uint32_t>(std::clamp<uint64_t>(
      cells_w * (half ? 1 : kCellWidthPx), 1, kMaxTargetPx));
  const auto box_h = static_cast<uint32_t>(std::clamp<uint64_t>(
      cells_h * (half ? 2 : kCellHeightPx), 1, kMaxTargetPx));

  PixelSize out;
  if (src_width == 0 || src_height == 0) {
    out.width = box_w;
    out.height = box_h;
    return out;
  }

  if (!options.preserve_aspect) {
    out.width = std::min(box_w, src_width);
    out.height = std::min(box_h, src_height);
    return out;
  }

  const double scale =
      std::min({static_cast<double>(box_w) / src_width,
                static_cast<double>(box_h) / src_height, 1.0});
  out.width = std::max<uint32_t>(
      1, static_cast<uint32_t>(std::lround(src_width * scale)));
  out.height = std::max<uint32_t>(
      1, static_cast<uint32_t>(std::lround(src_height * scale)));
  out.width = std::min(out.width, box_w);
  out.height = std::min(out.height, box_h);
  return out;
}

TerminalProtocol DetectTerminalProtocol(const EnvLookup& env) {
  if (const char* forced = env("PIXELCTL_IMAGE_PROTOCOL")) {
    TerminalProtocol p;
    if (ParseTerminalProtocol(forced, &p)) return p;
    Logger::Warn(std::string("[TerminalEncoder] UNKNOWN_PROTOCOL_OVERRIDE value=") +
                 forced);
  }

  const char* term = env("TERM");
  const char* term_program = env("TERM_PROGRAM");

  if (env("KITTY_WINDOW_ID") != nullptr || Contains(term, "kitty") ||
      Contains(term, "ghostty") || Contains(term_program, "WezTerm") ||
      Contains(term_program, "ghostty")) {
    return TerminalProtocol::kKitty;
  }
  if (Contains(term, "sixel") || Contains(term, "mlterm") ||
      Contains(term, "foot") || Contains(term, "yaft")) {
    return TerminalProtocol::kSixel;
  }
  if (term == nullptr || std::strcmp(term, "dumb") == 0 || term[0] == '\0') {
    return TerminalProtocol::kNone;
  }
  return TerminalProtocol::kHalfBlocks;
}

TerminalProtocol DetectTerminalProtocol() {
  return DetectTerminalProtocol(
      [](const char* name) -> const char* { return std::getenv(name); });
}

std::string Base64Encode(const uint8_t* data, size_t len) {
  static const char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < len; i += 3) {
    const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
    out += kAlphabet[(n >> 18) & 0x3f];
    out += kAlphabet[(n >> 12) & 0x3f];
    out += kAlphabet[(n >> 6) & 0x3f];
    out += kAlphabet[n & 0x3f];
  }
  const size_t rest = len - i;
  if (rest == 1) {
    const uint32_t n = static_cast<uint32_t>(data[i]) << 16;
    out += kAlphabet[(n >> 18) & 0x3f];
    out += kAlphabet[(n >> 12) & 0x3f];
    out += "==";
  } else if (rest == 2) {
    const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8);
    out += kAlphabet[(n >> 18) & 0x3f];
    out += kAlphabet[(n >> 12) & 0x3f];
    out += kAlphabet[(n >> 6) & 0x3f];
    out += '=';
  }
  return out;
}

// a=T transmit and display, f=24 RGB, c/r cell footprint. Payload split in
// kKittyChunkBytes pieces with m=1 on all but the last.
std::string EncodeKitty(const RgbImage& image, const RenderOptions& options) {
  if (!image.Valid()) return std::string();
  const std::string b64 = Base64Encode(image.pixels.data(), image.pixels.size());

  const uint32_t cols = std::min(options.width_cells,
                                 (image.width + kCellWidthPx - 1) / kCellWidthPx);
  const uint32_t rows = std::min(options.height_cells,
                                 (image.height + kCellHeightPx - 1) / kCellHeightPx);

  std::string out;
  out.reserve(b64.size() + 64 + (b64.size() / kKittyChunkBytes) * 16);
  size_t offset = 0;
  bool first = true;
  do {
    const size_t n = std::min(kKittyChunkBytes, b64.size() - offset);
    const bool more = offset + n < b64.size();
    out += "\033_G";
    if (first) {
      out += "a=T,f=24,s=" + std::to_string(image.width) +
             ",v=" + std::to_string(image.height) +
             ",c=" + std::to_string(std::max<uint32_t>(1, cols)) +
             ",r=" + std::to_string(std::max<uint32_t>(1, rows)) + ",q=2,";
    }
    out += more ? "m=1;" : "m=0;";
    out.append(b64, offset, n);
    out += "\033\\";
    offset += n;
    first = false;
  } while (offset < b64.size());
  return out;
}

std::string EncodeSixel(const RgbImage& image) {
  if (!image.Valid()) return std::string();
  const uint32_t w = image.width;
  const uint32_t h = image.height;

  std::vector<uint8_t> index(static_cast<size_t>(w) * h);
  std::array<bool, kSixelLevels * kSixelLevels * kSixelLevels> used{};
  for (size_t i = 0; i < index.size(); ++i) {
    const uint8_t* px = &image.pixels[i * 3];
    const int c = QuantizeLevel(px[0]) * kSixelLevels * kSixelLevels +
                  QuantizeLevel(px[1]) * kSixelLevels + QuantizeLevel(px[2]);
    index[i] = static_cast<uint8_t>(c);
    used[c] = true;
  }

  std::ostringstream out;
  out << "\033Pq\"1;1;" << w << ';' << h;
  for (int c = 0; c < static_cast<int>(used.size()); ++c) {
    if (!used[c]) continue;
    const int r = c / (kSixelLevels * kSixelLevels);
    const int g = (c / kSixelLevels) % kSixelLevels;
    const int b = c % kSixelLevels;
    out << '#' << c << ";2;" << r * 20 << ';' << g * 20 << ';' << b * 20;
  }

  std::vector<uint8_t> masks(w);
  for (uint32_t band = 0; band < h; band += 6) {
    const uint32_t band_rows = std::min<uint32_t>(6, h - band);
    std::array<bool, kSixelLevels * kSixelLevels * kSixelLevels> in_band{};
    for (uint32_t dy = 0; dy < band_rows; ++dy) {
      for (uint32_t x = 0; x < w; ++x) {
        in_band[index[static_cast<size_t>(band + dy) * w + x]] = true;
      }
    }

    bool first_color = true;
    for (int c = 0; c < static_cast<int>(in_band.size()); ++c) {
      if (!in_band[c]) continue;
      for (uint32_t x = 0; x < w; ++x) {
        uint8_t m = 0;
        for (uint32_t dy = 0; dy < band_rows; ++dy) {
          if (index[static_cast<size_t>(band + dy) * w + x] == c) m |= (1u << dy);
        }
        masks[x] = m;
      }
      if (!first_color) out << '$';
      first_color = false;
      out << '#' << c;

      char run_char = static_cast<char>(63 + masks[0]);
      int run = 0;
      for (uint32_t x = 0; x < w; ++x) {
        const char ch = static_cast<char>(63 + masks[x]);
        if (ch == run_char) {
          ++run;
        } else {
          EmitSixelRun(out, run_char, run);
          run_char = ch;
          run = 1;
        }
      }
      EmitSixelRun(out, run_char, run);
    }
    out << '-';
  }
  out << "\033\\";
  return out.str();
}

// Each cell is U+2580 (upper half block): foreground = top pixel, background =
// bottom pixel. Escapes are only emitted when a colour changes.
std::string EncodeHalfBlocks(const RgbImage& image) {
  if (!image.Valid()) return std::string();
  static const char kUpperHalf[] = "\xe2\x96\x80";
  const uint32_t w = image.width;
  const uint32_t h = image.height;

  std::string out;
  out.reserve(static_cast<size_t>(w) * ((h + 1) / 2) * 24);
  for (uint32_t y = 0; y < h; y += 2) {
    const uint8_t* prev_top = nullptr;
    const uint8_t* prev_bottom = nullptr;
    for (uint32_t x = 0; x < w; ++x) {
      const uint8_t* top = &image.pixels[(static_cast<size_t>(y) * w + x) * 3];
      const uint8_t* bottom =
          (y + 1 < h) ? &image.pixels[(static_cast<size_t>(y + 1) * w + x) * 3]
                      : nullptr;
      if (prev_top == nullptr || std::memcmp(prev_top, top, 3) != 0) {
        AppendColor(out, "\033[38;2;", top);
      }
      if (bottom == nullptr) {
        if (x == 0) out += "\033[49m";
      } else if (prev_bottom == nullptr || std::memcmp(prev_bottom, bottom, 3) != 0) {
        AppendColor(out, "\033[48;2;", bottom);
      }
      out += kUpperHalf;
      prev_top = top;
      prev_bottom = bottom;
    }
    out += "\033[0m\n";
  }
  return out;
}

std::string EncodeForTerminal(const RgbImage& image,
                              const RenderOptions& options) {
  switch (options.protocol) {
    case TerminalProtocol::kKitty: return EncodeKitty(image, options);
    case TerminalProtocol::kSixel: return EncodeSixel(image);
    case TerminalProtocol::kHalfBlocks: return EncodeHalfBlocks(image);
    case TerminalProtocol::kNone: break;
  }
  return std::string();
}

}  // namespace pixelctl::preview
