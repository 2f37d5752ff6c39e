// Repository: pixelctl
// Component: FFmpeg Image Renderer
// Purpose: Decodes an image file with libavformat/libavcodec, scales it with
//          libswscale and encodes it for the terminal.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/preview/FfmpegImageRenderer.hpp"

#include <memory>
#include <sstream>

#include "pixelctl/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace pixelctl::preview {

using pixelctl::util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

struct FormatCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecFreer {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameFreer {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketFreer {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct ScalerFreer {
  void operator()(SwsContext* s) const { sws_freeContext(s); }
};

using FormatPtr = std::unique_ptr<AVFormatContext, FormatCloser>;
using CodecPtr = std::unique_ptr<AVCodecContext, CodecFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;
using ScalerPtr = std::unique_ptr<SwsContext, ScalerFreer>;

// Sends packets until the decoder yields one frame. Returns 0 or an AVERROR.
int DecodeFirstFrame(AVFormatContext* fmt, AVCodecContext* codec,
                     int stream_index, AVFrame* frame) {
  PacketPtr packet(av_packet_alloc());
  if (!packet) return AVERROR(ENOMEM);

  int ret = 0;
  while ((ret = av_read_frame(fmt, packet.get())) >= 0) {
    if (packet->stream_index != stream_index) {
      av_packet_unref(packet.get());
      continue;
    }
    ret = avcodec_send_packet(codec, packet.get());
    av_packet_unref(packet.get());
    if (ret < 0) return ret;
    ret = avcodec_receive_frame(codec, frame);
    if (ret == 0) return 0;
    if (ret != AVERROR(EAGAIN)) return ret;
  }

  // Single-image demuxers may hold the frame until drained.
  avcodec_send_packet(codec, nullptr);
  ret = avcodec_receive_frame(codec, frame);
  return ret;
}

}  // namespace

bool FfmpegImageRenderer::DecodeScaled(const std::string& path,
                                       const RenderOptions& options,
                                       RgbImage* out, std::string* error) {
  AVFormatContext* raw_fmt = nullptr;
  int ret = avformat_open_input(&raw_fmt, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    *error = "open failed: " + AvError(ret);
    return false;
  }
  FormatPtr fmt(raw_fmt);

  ret = avformat_find_stream_info(fmt.get(), nullptr);
  if (ret < 0) {
    *error = "stream info failed: " + AvError(ret);
    return false;
  }

  const int stream_index =
      av_find_best_stream(fmt.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    *error = "no image stream";
    return false;
  }
  const AVCodec* decoder =
      avcodec_find_decoder(fmt->streams[stream_index]->codecpar->codec_id);
  if (decoder == nullptr) {
    *error = "no decoder for image codec";
    return false;
  }

  CodecPtr codec(avcodec_alloc_context3(decoder));
  if (!codec) {
    *error = "codec context allocation failed";
    return false;
  }
  ret = avcodec_parameters_to_context(codec.get(),
                                      fmt->streams[stream_index]->codecpar);
  if (ret < 0) {
    *error = "codec parameters failed: " + AvError(ret);
    return false;
  }
  ret = avcodec_open2(codec.get(), decoder, nullptr);
  if (ret < 0) {
    *error = "codec open failed: " + AvError(ret);
    return false;
  }

  FramePtr frame(av_frame_alloc());
  if (!frame) {
    *error = "frame allocation failed";
    return false;
  }
  ret = DecodeFirstFrame(fmt.get(), codec.get(), stream_index, frame.get());
  if (ret < 0) {
    *error = "decode failed: " + AvError(ret);
    return false;
  }
  if (frame->width <= 0 || frame->height <= 0) {
    *error = "decoded frame has no size";
    return false;
  }

  const PixelSize target = ComputeTargetSize(
      static_cast<uint32_t>(frame->width), static_cast<uint32_t>(frame->height),
      options);

  ScalerPtr scaler(sws_getContext(
      frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
      static_cast<int>(target.width), static_cast<int>(target.height),
      AV_PIX_FMT_RGB24, options.high_quality ? SWS_BICUBIC : SWS_BILINEAR,
      nullptr, nullptr, nullptr));
  if (!scaler) {
    *error = "scaler setup failed";
    return false;
  }

  out->width = target.width;
  out->height = target.height;
  out->pixels.assign(static_cast<size_t>(target.width) * target.height * 3, 0);
  uint8_t* dst_data[4] = {out->pixels.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {static_cast<int>(target.width) * 3, 0, 0, 0};

  const int rows = sws_scale(scaler.get(), frame->data, frame->linesize, 0,
                             frame->height, dst_data, dst_linesize);
  if (rows <= 0) {
    *error = "scale failed";
    return false;
  }
  return true;
}

RenderResult FfmpegImageRenderer::Render(const std::string& path,
                                         const RenderOptions& options) {
  RgbImage image;
  std::string error;
  if (!DecodeScaled(path, options, &image, &error)) {
    std::ostringstream oss;
    oss << "[FfmpegImageRenderer] DECODE_FAILED path=" << path
        << " error=\"" << error << "\"";
    Logger::Debug(oss.str());
    return RenderResult::Failure(error);
  }

  std::string encoded = EncodeForTerminal(image, options);
  if (encoded.empty()) {
    return RenderResult::Failure(std::string("no encoder for protocol ") +
                                 ToString(options.protocol));
  }

  std::ostringstream oss;
  oss << "[FfmpegImageRenderer] RENDERED path=" << path << " size="
      << image.width << "x" << image.height
      << " protocol=" << ToString(options.protocol)
      << " bytes=" << encoded.size();
  Logger::Debug(oss.str());
  return RenderResult::Success(std::move(encoded));
}

}  // namespace pixelctl::preview
