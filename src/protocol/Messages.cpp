// Repository: pixelctl
// Component: Protocol Messages
// Purpose: Variant names and correlation helpers.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/protocol/Messages.hpp"

#include <type_traits>

namespace pixelctl::protocol {

const char* ToString(ModelKind kind) {
  switch (kind) {
    case ModelKind::kCheckpoint: return "checkpoint";
    case ModelKind::kLora: return "lora";
    case ModelKind::kVae: return "vae";
  }
  return "unknown";
}

const char* VariantName(const Request& request) {
  static constexpr const char* kNames[] = {"Generate", "Cancel", "ListModels",
                                           "Status", "Ping"};
  return kNames[request.index()];
}

const char* VariantName(const Response& response) {
  static constexpr const char* kNames[] = {
      "JobAccepted", "JobComplete", "JobError", "JobCancelled",
      "ModelList",   "StatusInfo",  "Pong",     "Error"};
  return kNames[response.index()];
}

const char* VariantName(const Update& update) {
  static constexpr const char* kNames[] = {"JobStarted", "Progress", "Preview",
                                           "JobFinished"};
  return kNames[update.index()];
}

std::string CorrelationIdOf(const Request& request) {
  if (const auto* g = std::get_if<Generate>(&request)) return g->id;
  if (const auto* c = std::get_if<Cancel>(&request)) return c->id;
  return std::string();
}

const std::string& JobIdOf(const Update& update) {
  return std::visit([](const auto& m) -> const std::string& { return m.id; },
                    update);
}

}  // namespace pixelctl::protocol
