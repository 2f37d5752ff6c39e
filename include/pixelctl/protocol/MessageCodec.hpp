// Repository: pixelctl
// Component: Message Codec
// Purpose: Versioned binary envelope encode/decode for all message families.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PROTOCOL_MESSAGE_CODEC_HPP_
#define PIXELCTL_PROTOCOL_MESSAGE_CODEC_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "pixelctl/protocol/Messages.hpp"

namespace pixelctl::v1 {
class Envelope;
}  // namespace pixelctl::v1

namespace pixelctl::protocol {

inline constexpr uint32_t kProtocolMajor = 1;
inline constexpr uint32_t kProtocolMinor = 0;
inline constexpr const char* kProtocolVersion = "1.0.0";

enum class CodecError {
  kNone,
  kMalformed,       // Bytes are not a valid envelope.
  kVersionMismatch, // Peer speaks a different major version.
  kWrongFamily,     // e.g. a Response handed to DecodeRequest.
  kUnknownVariant,  // Discriminant this build does not know.
  kInvalidField,    // Known variant with an out-of-range value.
};

const char* ToString(CodecError error);

template <typename T>
struct DecodeResult {
  CodecError error = CodecError::kNone;
  std::string detail;
  T value{};
  std::string correlation_id;
  uint32_t peer_minor = 0;

  bool ok() const { return error == CodecError::kNone; }

  static DecodeResult Success(T v, std::string correlation, uint32_t minor) {
    DecodeResult r;
    r.value = std::move(v);
    r.correlation_id = std::move(correlation);
    r.peer_minor = minor;
    return r;
  }

  static DecodeResult Failure(CodecError e, std::string why) {
    DecodeResult r;
    r.error = e;
    r.detail = std::move(why);
    return r;
  }
};

// Requests carry CorrelationIdOf(request); updates carry the job id.
std::string EncodeRequest(const Request& request);
// Responses echo the correlation id of the request they answer.
std::string EncodeResponse(const Response& response,
                           const std::string& correlation_id);
std::string EncodeUpdate(const Update& update);

// Never throws. Unknown fields inside a known variant are ignored.
DecodeResult<Request> DecodeRequest(const void* data, size_t size);
DecodeResult<Response> DecodeResponse(const void* data, size_t size);
DecodeResult<Update> DecodeUpdate(const void* data, size_t size);

inline DecodeResult<Request> DecodeRequest(const std::string& bytes) {
  return DecodeRequest(bytes.data(), bytes.size());
}
inline DecodeResult<Response> DecodeResponse(const std::string& bytes) {
  return DecodeResponse(bytes.data(), bytes.size());
}
inline DecodeResult<Update> DecodeUpdate(const std::string& bytes) {
  return DecodeUpdate(bytes.data(), bytes.size());
}

// Envelope forms, for the gRPC service and stubs which hand over parsed
// messages. Same rules as the byte forms.
void EncodeRequest(const Request& request, v1::Envelope* out);
void EncodeResponse(const Response& response, const std::string& correlation_id,
                    v1::Envelope* out);
void EncodeUpdate(const Update& update, v1::Envelope* out);

DecodeResult<Request> DecodeRequest(const v1::Envelope& envelope);
DecodeResult<Response> DecodeResponse(const v1::Envelope& envelope);
DecodeResult<Update> DecodeUpdate(const v1::Envelope& envelope);

}  // namespace pixelctl::protocol

#endif  // PIXELCTL_PROTOCOL_MESSAGE_CODEC_HPP_
