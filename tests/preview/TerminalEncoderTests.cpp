// Repository: pixelctl
// Component: Terminal Encoder Tests
// Purpose: Target sizing, protocol detection and escape-sequence framing.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "pixelctl/preview/TerminalEncoder.hpp"

namespace pixelctl::preview::testing {
namespace {

RgbImage Solid(uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b) {
  RgbImage img;
  img.width = w;
  img.height = h;
  img.pixels.reserve(static_cast<size_t>(w) * h * 3);
  for (size_t i = 0; i < static_cast<size_t>(w) * h; ++i) {
    img.pixels.push_back(r);
    img.pixels.push_back(g);
    img.pixels.push_back(b);
  }
  return img;
}

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

size_t CountOf(const std::string& haystack, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

// =============================================================================
// Sizing
// =============================================================================

TEST(TerminalEncoderTest, HalfBlocksFitTwoPixelsPerCellVertically) {
  RenderOptions o;
  o.width_cells = 40;
  o.height_cells = 20;
  o.protocol = TerminalProtocol::kHalfBlocks;
  PixelSize s = ComputeTargetSize(1024, 512, o);
  EXPECT_EQ(s.width, 40u);
  EXPECT_EQ(s.height, 20u);
}

TEST(TerminalEncoderTest, GraphicsProtocolsUseCellPixelBox) {
  RenderOptions o;
  o.width_cells = 40;
  o.height_cells = 20;
  o.protocol = TerminalProtocol::kKitty;
  PixelSize s = ComputeTargetSize(1024, 512, o);
  EXPECT_EQ(s.width, 320u);
  EXPECT_EQ(s.height, 160u);

  o.preserve_aspect = false;
  s = ComputeTargetSize(1024, 512, o);
  EXPECT_EQ(s.width, 320u);
  EXPECT_EQ(s.height, 320u);
}

TEST(TerminalEncoderTest, NeverUpscalesOrCollapses) {
  RenderOptions o;
  o.protocol = TerminalProtocol::kSixel;
  PixelSize s = ComputeTargetSize(10, 12, o);
  EXPECT_EQ(s.width, 10u);
  EXPECT_EQ(s.height, 12u);

  o.protocol = TerminalProtocol::kHalfBlocks;
  o.width_cells = 4;
  o.height_cells = 4;
  s = ComputeTargetSize(10000, 1, o);
  EXPECT_EQ(s.width, 4u);
  EXPECT_EQ(s.height, 1u);
}

TEST(TerminalEncoderTest, HugeCellCountsAreCappedNotWrapped) {
  RenderOptions o;
  o.protocol = TerminalProtocol::kKitty;
  o.preserve_aspect = false;
  // 2^29 cells * 8 px wraps to 0 in 32 bits.
  o.width_cells = 1u << 29;
  o.height_cells = 0xFFFFFFFFu;
  PixelSize s = ComputeTargetSize(100000, 100000, o);
  EXPECT_EQ(s.width, kMaxTargetPx);
  EXPECT_EQ(s.height, kMaxTargetPx);
}

// =============================================================================
// Detection
// =============================================================================

TEST(TerminalEncoderTest, OverrideWins) {
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"PIXELCTL_IMAGE_PROTOCOL", "SIXEL"},
                                            {"TERM", "xterm-kitty"}})),
            TerminalProtocol::kSixel);
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"PIXELCTL_IMAGE_PROTOCOL", "off"},
                                            {"TERM", "xterm-kitty"}})),
            TerminalProtocol::kNone);
  // Unknown override values fall back to detection.
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"PIXELCTL_IMAGE_PROTOCOL", "vt340"},
                                            {"TERM", "xterm-256color"}})),
            TerminalProtocol::kHalfBlocks);
}

TEST(TerminalEncoderTest, DetectsFromTerminalIdentity) {
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"KITTY_WINDOW_ID", "1"},
                                            {"TERM", "xterm-256color"}})),
            TerminalProtocol::kKitty);
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"TERM", "xterm-kitty"}})),
            TerminalProtocol::kKitty);
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"TERM", "xterm-256color"},
                                            {"TERM_PROGRAM", "WezTerm"}})),
            TerminalProtocol::kKitty);
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"TERM", "foot"}})),
            TerminalProtocol::kSixel);
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"TERM", "xterm-256color"}})),
            TerminalProtocol::kHalfBlocks);
}

TEST(TerminalEncoderTest, DumbOrMissingTermHasNoGraphics) {
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({})), TerminalProtocol::kNone);
  EXPECT_EQ(DetectTerminalProtocol(FakeEnv({{"TERM", "dumb"}})),
            TerminalProtocol::kNone);
}

TEST(TerminalEncoderTest, ProtocolNamesParse) {
  TerminalProtocol p;
  ASSERT_TRUE(ParseTerminalProtocol("Kitty", &p));
  EXPECT_EQ(p, TerminalProtocol::kKitty);
  ASSERT_TRUE(ParseTerminalProtocol("halfblocks", &p));
  EXPECT_EQ(p, TerminalProtocol::kHalfBlocks);
  ASSERT_TRUE(ParseTerminalProtocol(ToString(TerminalProtocol::kHalfBlocks), &p));
  EXPECT_EQ(p, TerminalProtocol::kHalfBlocks);
  EXPECT_FALSE(ParseTerminalProtocol("iterm", &p));
}

// =============================================================================
// Encoders
// =============================================================================

TEST(TerminalEncoderTest, Base64Padding) {
  auto enc = [](const std::string& s) {
    return Base64Encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  };
  EXPECT_EQ(enc(""), "");
  EXPECT_EQ(enc("f"), "Zg==");
  EXPECT_EQ(enc("fo"), "Zm8=");
  EXPECT_EQ(enc("foo"), "Zm9v");
  EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

TEST(TerminalEncoderTest, KittySingleChunk) {
  RgbImage img = Solid(2, 1, 0, 0, 0);
  RenderOptions o;
  o.protocol = TerminalProtocol::kKitty;
  const std::string out = EncodeKitty(img, o);
  EXPECT_EQ(out, "\033_Ga=T,f=24,s=2,v=1,c=1,r=1,q=2,m=0;AAAAAAAA\033\\");
}

TEST(TerminalEncoderTest, KittySplitsLargePayloads) {
  // 2048 pixels = 6144 bytes = 8192 base64 chars = two full chunks.
  RgbImage img = Solid(64, 32, 10, 20, 30);
  RenderOptions o;
  o.protocol = TerminalProtocol::kKitty;
  const std::string out = EncodeKitty(img, o);

  EXPECT_EQ(CountOf(out, "\033_G"), 2u);
  EXPECT_EQ(CountOf(out, "a=T"), 1u);
  EXPECT_EQ(CountOf(out, "m=1;"), 1u);
  EXPECT_EQ(CountOf(out, "m=0;"), 1u);
  EXPECT_EQ(out.rfind("\033\\"), out.size() - 2);
  EXPECT_NE(out.find("c=8,r=2"), std::string::npos);
}

TEST(TerminalEncoderTest, SixelFraming) {
  EXPECT_EQ(EncodeSixel(Solid(1, 1, 0, 0, 0)),
            "\033Pq\"1;1;1;1#0;2;0;0;0#0@-\033\\");
}

TEST(TerminalEncoderTest, SixelRunLengthEncodesRepeats) {
  const std::string out = EncodeSixel(Solid(8, 1, 255, 255, 255));
  EXPECT_NE(out.find("#215;2;100;100;100"), std::string::npos);
  EXPECT_NE(out.find("!8@"), std::string::npos);
}

TEST(TerminalEncoderTest, SixelBandsAreSixRowsTall) {
  const std::string out = EncodeSixel(Solid(2, 13, 0, 0, 0));
  EXPECT_EQ(CountOf(out, "-"), 3u);
}

TEST(TerminalEncoderTest, HalfBlocksPairRows) {
  RgbImage img;
  img.width = 1;
  img.height = 2;
  img.pixels = {255, 0, 0, 0, 0, 255};
  EXPECT_EQ(EncodeHalfBlocks(img),
            "\033[38;2;255;0;0m\033[48;2;0;0;255m\xe2\x96\x80\033[0m\n");
}

TEST(TerminalEncoderTest, HalfBlocksOddHeightUsesDefaultBackground) {
  RgbImage img = Solid(1, 1, 1, 2, 3);
  EXPECT_EQ(EncodeHalfBlocks(img), "\033[38;2;1;2;3m\033[49m\xe2\x96\x80\033[0m\n");
}

TEST(TerminalEncoderTest, HalfBlocksSkipRepeatedColours) {
  const std::string out = EncodeHalfBlocks(Solid(4, 2, 9, 9, 9));
  EXPECT_EQ(CountOf(out, "\033[38;2;"), 1u);
  EXPECT_EQ(CountOf(out, "\033[48;2;"), 1u);
  EXPECT_EQ(CountOf(out, "\xe2\x96\x80"), 4u);
}

TEST(TerminalEncoderTest, DispatchAndInvalidImages) {
  RgbImage img = Solid(2, 2, 0, 0, 0);
  RenderOptions o;
  o.protocol = TerminalProtocol::kNone;
  EXPECT_TRUE(EncodeForTerminal(img, o).empty());

  o.protocol = TerminalProtocol::kHalfBlocks;
  EXPECT_EQ(EncodeForTerminal(img, o), EncodeHalfBlocks(img));

  RgbImage broken;
  broken.width = 2;
  broken.height = 2;
  broken.pixels.resize(5);
  EXPECT_TRUE(EncodeForTerminal(broken, o).empty());
  EXPECT_TRUE(EncodeSixel(broken).empty());
}

}  // namespace
}  // namespace pixelctl::preview::testing
