// Repository: pixelctl
// Component: FFmpeg Image Renderer
// Purpose: Decodes an image file with libavformat/libavcodec, scales it with
//          libswscale and encodes it for the terminal.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PREVIEW_FFMPEG_IMAGE_RENDERER_HPP_
#define PIXELCTL_PREVIEW_FFMPEG_IMAGE_RENDERER_HPP_

#include <string>

#include "pixelctl/preview/PreviewTypes.hpp"
#include "pixelctl/preview/TerminalEncoder.hpp"

namespace pixelctl::preview {

// Stateless; safe to call from the preview worker. Each Render() opens,
// decodes the first video frame and closes the file.
class FfmpegImageRenderer : public IPreviewRenderer {
 public:
  RenderResult Render(const std::string& path,
                      const RenderOptions& options) override;

  // Decode + scale only. Exposed for tests and for callers that want pixels.
  // On failure returns false and sets *error.
  static bool DecodeScaled(const std::string& path, const RenderOptions& options,
                           RgbImage* out, std::string* error);
};

}  // namespace pixelctl::preview

#endif  // PIXELCTL_PREVIEW_FFMPEG_IMAGE_RENDERER_HPP_
