// Repository: pixelctl
// Component: Message Codec
// Purpose: Maps protocol variants to and from the pixelctl.v1.Envelope wire form.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/protocol/MessageCodec.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>

#include "pixelctl/v1/control.pb.h"

namespace pixelctl::protocol {

namespace {

namespace pb = ::pixelctl::v1;

template <typename>
inline constexpr bool kAlwaysFalse = false;

// -----------------------------------------------------------------------------
// Enum mapping. Wire value 0 is "unspecified" in every enum.
// -----------------------------------------------------------------------------

pb::Priority ToProto(core::JobPriority p) {
  switch (p) {
    case core::JobPriority::kUrgent: return pb::PRIORITY_URGENT;
    case core::JobPriority::kHigh: return pb::PRIORITY_HIGH;
    case core::JobPriority::kNormal: return pb::PRIORITY_NORMAL;
    case core::JobPriority::kLow: return pb::PRIORITY_LOW;
  }
  return pb::PRIORITY_UNSPECIFIED;
}

// Unspecified maps to Normal, the documented default.
bool FromProto(int wire, core::JobPriority* out) {
  switch (wire) {
    case pb::PRIORITY_UNSPECIFIED:
    case pb::PRIORITY_NORMAL: *out = core::JobPriority::kNormal; return true;
    case pb::PRIORITY_URGENT: *out = core::JobPriority::kUrgent; return true;
    case pb::PRIORITY_HIGH: *out = core::JobPriority::kHigh; return true;
    case pb::PRIORITY_LOW: *out = core::JobPriority::kLow; return true;
    default: return false;
  }
}

pb::JobStatus ToProto(core::JobStatus s) {
  switch (s) {
    case core::JobStatus::kQueued: return pb::JOB_STATUS_QUEUED;
    case core::JobStatus::kRunning: return pb::JOB_STATUS_RUNNING;
    case core::JobStatus::kCompleted: return pb::JOB_STATUS_COMPLETED;
    case core::JobStatus::kFailed: return pb::JOB_STATUS_FAILED;
    case core::JobStatus::kCancelled: return pb::JOB_STATUS_CANCELLED;
  }
  return pb::JOB_STATUS_UNSPECIFIED;
}

bool FromProto(int wire, core::JobStatus* out) {
  switch (wire) {
    case pb::JOB_STATUS_QUEUED: *out = core::JobStatus::kQueued; return true;
    case pb::JOB_STATUS_RUNNING: *out = core::JobStatus::kRunning; return true;
    case pb::JOB_STATUS_COMPLETED: *out = core::JobStatus::kCompleted; return true;
    case pb::JOB_STATUS_FAILED: *out = core::JobStatus::kFailed; return true;
    case pb::JOB_STATUS_CANCELLED: *out = core::JobStatus::kCancelled; return true;
    default: return false;
  }
}

pb::Stage ToProto(core::Stage s) {
  switch (s) {
    case core::Stage::kQueued: return pb::STAGE_QUEUED;
    case core::Stage::kPreparing: return pb::STAGE_PREPARING;
    case core::Stage::kExecuting: return pb::STAGE_EXECUTING;
    case core::Stage::kPostprocessing: return pb::STAGE_POSTPROCESSING;
    case core::Stage::kSaving: return pb::STAGE_SAVING;
    case core::Stage::kDone: return pb::STAGE_DONE;
  }
  return pb::STAGE_UNSPECIFIED;
}

bool FromProto(int wire, core::Stage* out) {
  switch (wire) {
    case pb::STAGE_QUEUED: *out = core::Stage::kQueued; return true;
    case pb::STAGE_PREPARING: *out = core::Stage::kPreparing; return true;
    case pb::STAGE_EXECUTING: *out = core::Stage::kExecuting; return true;
    case pb::STAGE_POSTPROCESSING: *out = core::Stage::kPostprocessing; return true;
    case pb::STAGE_SAVING: *out = core::Stage::kSaving; return true;
    case pb::STAGE_DONE: *out = core::Stage::kDone; return true;
    default: return false;
  }
}

pb::ModelKind ToProto(ModelKind k) {
  switch (k) {
    case ModelKind::kCheckpoint: return pb::MODEL_KIND_CHECKPOINT;
    case ModelKind::kLora: return pb::MODEL_KIND_LORA;
    case ModelKind::kVae: return pb::MODEL_KIND_VAE;
  }
  return pb::MODEL_KIND_UNSPECIFIED;
}

bool FromProto(int wire, ModelKind* out) {
  switch (wire) {
    case pb::MODEL_KIND_CHECKPOINT: *out = ModelKind::kCheckpoint; return true;
    case pb::MODEL_KIND_LORA: *out = ModelKind::kLora; return true;
    case pb::MODEL_KIND_VAE: *out = ModelKind::kVae; return true;
    default: return false;
  }
}

std::string InvalidEnum(const char* field, int wire) {
  std::ostringstream oss;
  oss << field << "=" << wire << " is not a known value";
  return oss.str();
}

// -----------------------------------------------------------------------------
// Envelope framing
// -----------------------------------------------------------------------------

void Stamp(pb::Envelope* env, const std::string& correlation_id) {
  env->set_protocol_major(kProtocolMajor);
  env->set_protocol_minor(kProtocolMinor);
  env->set_correlation_id(correlation_id);
}

std::string Serialize(const pb::Envelope& env) {
  std::string out;
  env.SerializeToString(&out);
  return out;
}

const char* BodyName(pb::Envelope::BodyCase c) {
  switch (c) {
    case pb::Envelope::kRequest: return "request";
    case pb::Envelope::kResponse: return "response";
    case pb::Envelope::kUpdate: return "update";
    case pb::Envelope::BODY_NOT_SET: return "none";
  }
  return "unknown";
}

// Checks version and family of a parsed envelope.
CodecError CheckEnvelope(const pb::Envelope& env, pb::Envelope::BodyCase expected,
                         std::string* detail) {
  if (env.protocol_major() != kProtocolMajor) {
    std::ostringstream oss;
    oss << "peer protocol major=" << env.protocol_major()
        << " local major=" << kProtocolMajor;
    *detail = oss.str();
    return CodecError::kVersionMismatch;
  }
  if (env.body_case() == pb::Envelope::BODY_NOT_SET) {
    *detail = "envelope body not set";
    return CodecError::kUnknownVariant;
  }
  if (env.body_case() != expected) {
    *detail = std::string("expected ") + BodyName(expected) + " got " +
              BodyName(env.body_case());
    return CodecError::kWrongFamily;
  }
  return CodecError::kNone;
}

CodecError ParseEnvelope(const void* data, size_t size, pb::Envelope* env,
                         std::string* detail) {
  if (data == nullptr || size == 0) {
    *detail = "empty message";
    return CodecError::kMalformed;
  }
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    *detail = "message too large";
    return CodecError::kMalformed;
  }
  if (!env->ParseFromArray(data, static_cast<int>(size))) {
    *detail = "envelope parse failed";
    return CodecError::kMalformed;
  }
  return CodecError::kNone;
}

// -----------------------------------------------------------------------------
// Requests
// -----------------------------------------------------------------------------

void FillRequest(const Request& request, pb::Request* out) {
  std::visit(
      [out](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Generate>) {
          auto* g = out->mutable_generate();
          g->set_id(m.id);
          g->set_payload(m.payload.bytes);
          g->set_payload_schema_version(m.payload.schema_version);
          g->set_priority(ToProto(m.priority));
        } else if constexpr (std::is_same_v<T, Cancel>) {
          out->mutable_cancel()->set_id(m.id);
        } else if constexpr (std::is_same_v<T, ListModels>) {
          out->mutable_list_models();
        } else if constexpr (std::is_same_v<T, StatusRequest>) {
          out->mutable_status();
        } else if constexpr (std::is_same_v<T, Ping>) {
          out->mutable_ping();
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled request variant");
        }
      },
      request);
}

// An empty job id is legal: the scheduler assigns one to a Generate, and a
// Cancel for it answers as an unknown job.
CodecError ReadRequest(const pb::Request& in, Request* out, std::string* detail) {
  switch (in.kind_case()) {
    case pb::Request::kGenerate: {
      Generate g;
      g.id = in.generate().id();
      g.payload.bytes = in.generate().payload();
      g.payload.schema_version = in.generate().payload_schema_version();
      if (!FromProto(in.generate().priority(), &g.priority)) {
        *detail = InvalidEnum("priority", in.generate().priority());
        return CodecError::kInvalidField;
      }
      *out = std::move(g);
      return CodecError::kNone;
    }
    case pb::Request::kCancel:
      *out = Cancel{in.cancel().id()};
      return CodecError::kNone;
    case pb::Request::kListModels:
      *out = ListModels{};
      return CodecError::kNone;
    case pb::Request::kStatus:
      *out = StatusRequest{};
      return CodecError::kNone;
    case pb::Request::kPing:
      *out = Ping{};
      return CodecError::kNone;
    case pb::Request::KIND_NOT_SET:
      break;
  }
  *detail = "request kind not recognized";
  return CodecError::kUnknownVariant;
}

// -----------------------------------------------------------------------------
// Responses
// -----------------------------------------------------------------------------

void FillResponse(const Response& response, pb::Response* out) {
  std::visit(
      [out](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, JobAccepted>) {
          auto* a = out->mutable_job_accepted();
          a->set_id(m.id);
          a->set_estimated_seconds(m.estimated_seconds);
        } else if constexpr (std::is_same_v<T, JobComplete>) {
          auto* c = out->mutable_job_complete();
          c->set_id(m.id);
          for (const auto& p : m.outputs) c->add_outputs(p);
        } else if constexpr (std::is_same_v<T, JobError>) {
          auto* e = out->mutable_job_error();
          e->set_id(m.id);
          e->set_message(m.message);
        } else if constexpr (std::is_same_v<T, JobCancelled>) {
          out->mutable_job_cancelled()->set_id(m.id);
        } else if constexpr (std::is_same_v<T, ModelList>) {
          auto* list = out->mutable_model_list();
          for (const auto& item : m.items) {
            auto* i = list->add_items();
            i->set_name(item.name);
            i->set_path(item.path);
            i->set_kind(ToProto(item.kind));
            i->set_size_mb(item.size_mb);
          }
        } else if constexpr (std::is_same_v<T, StatusInfo>) {
          auto* s = out->mutable_status_info();
          s->set_queued(m.queued);
          s->set_running(m.running);
          s->set_throughput_per_min(m.throughput_per_min);
          s->set_completed(m.completed);
          s->set_failed(m.failed);
          s->set_cancelled(m.cancelled);
          s->set_version(m.version);
          s->set_uptime_seconds(m.uptime_seconds);
          for (const auto& j : m.jobs) {
            auto* js = s->add_jobs();
            js->set_id(j.id);
            js->set_status(ToProto(j.status));
            js->set_stage(ToProto(j.stage));
            js->set_progress(j.progress);
          }
          for (const auto& e : m.stage_estimates) {
            auto* es = s->add_stage_estimates();
            es->set_stage(ToProto(e.stage));
            es->set_estimate_seconds(e.estimate_seconds);
            es->set_samples(e.samples);
          }
        } else if constexpr (std::is_same_v<T, Pong>) {
          out->mutable_pong()->set_server_time_ms(m.server_time_ms);
        } else if constexpr (std::is_same_v<T, ErrorResponse>) {
          out->mutable_error()->set_message(m.message);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled response variant");
        }
      },
      response);
}

CodecError ReadStatusInfo(const pb::StatusInfo& in, StatusInfo* out,
                          std::string* detail) {
  out->queued = in.queued();
  out->running = in.running();
  out->throughput_per_min = in.throughput_per_min();
  out->completed = in.completed();
  out->failed = in.failed();
  out->cancelled = in.cancelled();
  out->version = in.version();
  out->uptime_seconds = in.uptime_seconds();
  for (const auto& js : in.jobs()) {
    JobSummary j;
    j.id = js.id();
    j.progress = js.progress();
    if (!FromProto(js.status(), &j.status)) {
      *detail = InvalidEnum("jobs.status", js.status());
      return CodecError::kInvalidField;
    }
    if (!FromProto(js.stage(), &j.stage)) {
      *detail = InvalidEnum("jobs.stage", js.stage());
      return CodecError::kInvalidField;
    }
    out->jobs.push_back(std::move(j));
  }
  for (const auto& es : in.stage_estimates()) {
    StageEstimate e;
    e.estimate_seconds = es.estimate_seconds();
    e.samples = es.samples();
    if (!FromProto(es.stage(), &e.stage)) {
      *detail = InvalidEnum("stage_estimates.stage", es.stage());
      return CodecError::kInvalidField;
    }
    out->stage_estimates.push_back(e);
  }
  return CodecError::kNone;
}

CodecError ReadResponse(const pb::Response& in, Response* out,
                        std::string* detail) {
  switch (in.kind_case()) {
    case pb::Response::kJobAccepted:
      *out = JobAccepted{in.job_accepted().id(),
                         in.job_accepted().estimated_seconds()};
      return CodecError::kNone;
    case pb::Response::kJobComplete: {
      JobComplete c;
      c.id = in.job_complete().id();
      c.outputs.assign(in.job_complete().outputs().begin(),
                       in.job_complete().outputs().end());
      *out = std::move(c);
      return CodecError::kNone;
    }
    case pb::Response::kJobError:
      *out = JobError{in.job_error().id(), in.job_error().message()};
      return CodecError::kNone;
    case pb::Response::kJobCancelled:
      *out = JobCancelled{in.job_cancelled().id()};
      return CodecError::kNone;
    case pb::Response::kModelList: {
      ModelList list;
      for (const auto& i : in.model_list().items()) {
        ModelInfo info;
        info.name = i.name();
        info.path = i.path();
        info.size_mb = i.size_mb();
        if (!FromProto(i.kind(), &info.kind)) {
          *detail = InvalidEnum("items.kind", i.kind());
          return CodecError::kInvalidField;
        }
        list.items.push_back(std::move(info));
      }
      *out = std::move(list);
      return CodecError::kNone;
    }
    case pb::Response::kStatusInfo: {
      StatusInfo s;
      CodecError err = ReadStatusInfo(in.status_info(), &s, detail);
      if (err != CodecError::kNone) return err;
      *out = std::move(s);
      return CodecError::kNone;
    }
    case pb::Response::kPong:
      *out = Pong{in.pong().server_time_ms()};
      return CodecError::kNone;
    case pb::Response::kError:
      *out = ErrorResponse{in.error().message()};
      return CodecError::kNone;
    case pb::Response::KIND_NOT_SET:
      break;
  }
  *detail = "response kind not recognized";
  return CodecError::kUnknownVariant;
}

// -----------------------------------------------------------------------------
// Updates
// -----------------------------------------------------------------------------

void FillUpdate(const Update& update, pb::Update* out) {
  std::visit(
      [out](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, JobStarted>) {
          auto* s = out->mutable_job_started();
          s->set_id(m.id);
          s->set_timestamp_ms(m.timestamp_ms);
        } else if constexpr (std::is_same_v<T, Progress>) {
          auto* p = out->mutable_progress();
          p->set_id(m.id);
          p->set_stage(ToProto(m.stage));
          p->set_fraction(m.fraction);
          p->set_eta_seconds(m.eta_seconds);
        } else if constexpr (std::is_same_v<T, Preview>) {
          auto* p = out->mutable_preview();
          p->set_id(m.id);
          p->set_path(m.path);
        } else if constexpr (std::is_same_v<T, JobFinished>) {
          auto* f = out->mutable_job_finished();
          f->set_id(m.id);
          f->set_status(ToProto(m.status));
          f->set_duration_seconds(m.duration_seconds);
          f->set_error(m.error);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled update variant");
        }
      },
      update);
}

CodecError ReadUpdate(const pb::Update& in, Update* out, std::string* detail) {
  switch (in.kind_case()) {
    case pb::Update::kJobStarted:
      *out = JobStarted{in.job_started().id(), in.job_started().timestamp_ms()};
      return CodecError::kNone;
    case pb::Update::kProgress: {
      const auto& p = in.progress();
      Progress prog;
      prog.id = p.id();
      prog.fraction = p.fraction();
      prog.eta_seconds = p.eta_seconds();
      if (!FromProto(p.stage(), &prog.stage)) {
        *detail = InvalidEnum("progress.stage", p.stage());
        return CodecError::kInvalidField;
      }
      if (!std::isfinite(prog.fraction) || prog.fraction < 0.0 ||
          prog.fraction > 1.0) {
        *detail = "progress.fraction outside [0,1]";
        return CodecError::kInvalidField;
      }
      if (!std::isfinite(prog.eta_seconds) || prog.eta_seconds < 0.0) {
        *detail = "progress.eta_seconds negative or not finite";
        return CodecError::kInvalidField;
      }
      *out = std::move(prog);
      return CodecError::kNone;
    }
    case pb::Update::kPreview:
      *out = Preview{in.preview().id(), in.preview().path()};
      return CodecError::kNone;
    case pb::Update::kJobFinished: {
      const auto& f = in.job_finished();
      JobFinished fin;
      fin.id = f.id();
      fin.duration_seconds = f.duration_seconds();
      fin.error = f.error();
      if (!FromProto(f.status(), &fin.status) || !core::IsTerminal(fin.status)) {
        *detail = InvalidEnum("job_finished.status", f.status());
        return CodecError::kInvalidField;
      }
      *out = std::move(fin);
      return CodecError::kNone;
    }
    case pb::Update::KIND_NOT_SET:
      break;
  }
  *detail = "update kind not recognized";
  return CodecError::kUnknownVariant;
}

}  // namespace

const char* ToString(CodecError error) {
  switch (error) {
    case CodecError::kNone: return "None";
    case CodecError::kMalformed: return "Malformed";
    case CodecError::kVersionMismatch: return "VersionMismatch";
    case CodecError::kWrongFamily: return "WrongFamily";
    case CodecError::kUnknownVariant: return "UnknownVariant";
    case CodecError::kInvalidField: return "InvalidField";
  }
  return "Unknown";
}

void EncodeRequest(const Request& request, pb::Envelope* out) {
  out->Clear();
  Stamp(out, CorrelationIdOf(request));
  FillRequest(request, out->mutable_request());
}

void EncodeResponse(const Response& response, const std::string& correlation_id,
                    pb::Envelope* out) {
  out->Clear();
  Stamp(out, correlation_id);
  FillResponse(response, out->mutable_response());
}

void EncodeUpdate(const Update& update, pb::Envelope* out) {
  out->Clear();
  Stamp(out, JobIdOf(update));
  FillUpdate(update, out->mutable_update());
}

std::string EncodeRequest(const Request& request) {
  pb::Envelope env;
  EncodeRequest(request, &env);
  return Serialize(env);
}

std::string EncodeResponse(const Response& response,
                           const std::string& correlation_id) {
  pb::Envelope env;
  EncodeResponse(response, correlation_id, &env);
  return Serialize(env);
}

std::string EncodeUpdate(const Update& update) {
  pb::Envelope env;
  EncodeUpdate(update, &env);
  return Serialize(env);
}

DecodeResult<Request> DecodeRequest(const pb::Envelope& env) {
  std::string detail;
  CodecError err = CheckEnvelope(env, pb::Envelope::kRequest, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Request>::Failure(err, detail);
  }
  Request request;
  err = ReadRequest(env.request(), &request, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Request>::Failure(err, detail);
  }
  return DecodeResult<Request>::Success(std::move(request),
                                        env.correlation_id(),
                                        env.protocol_minor());
}

DecodeResult<Response> DecodeResponse(const pb::Envelope& env) {
  std::string detail;
  CodecError err = CheckEnvelope(env, pb::Envelope::kResponse, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Response>::Failure(err, detail);
  }
  Response response;
  err = ReadResponse(env.response(), &response, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Response>::Failure(err, detail);
  }
  return DecodeResult<Response>::Success(std::move(response),
                                         env.correlation_id(),
                                         env.protocol_minor());
}

DecodeResult<Update> DecodeUpdate(const pb::Envelope& env) {
  std::string detail;
  CodecError err = CheckEnvelope(env, pb::Envelope::kUpdate, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Update>::Failure(err, detail);
  }
  Update update;
  err = ReadUpdate(env.update(), &update, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Update>::Failure(err, detail);
  }
  return DecodeResult<Update>::Success(std::move(update), env.correlation_id(),
                                       env.protocol_minor());
}

DecodeResult<Request> DecodeRequest(const void* data, size_t size) {
  pb::Envelope env;
  std::string detail;
  const CodecError err = ParseEnvelope(data, size, &env, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Request>::Failure(err, detail);
  }
  return DecodeRequest(env);
}

DecodeResult<Response> DecodeResponse(const void* data, size_t size) {
  pb::Envelope env;
  std::string detail;
  const CodecError err = ParseEnvelope(data, size, &env, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Response>::Failure(err, detail);
  }
  return DecodeResponse(env);
}

DecodeResult<Update> DecodeUpdate(const void* data, size_t size) {
  pb::Envelope env;
  std::string detail;
  const CodecError err = ParseEnvelope(data, size, &env, &detail);
  if (err != CodecError::kNone) {
    return DecodeResult<Update>::Failure(err, detail);
  }
  return DecodeUpdate(env);
}

}  // namespace pixelctl::protocol
