// Repository: pixelctl
// Component: Message Codec Tests
// Purpose: Envelope versioning, family checks and rejection of bad input.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/v1/control.pb.h"

namespace pixelctl::protocol::testing {
namespace {

namespace pb = ::pixelctl::v1;

std::string Serialize(const pb::Envelope& env) {
  std::string out;
  env.SerializeToString(&out);
  return out;
}

pb::Envelope CurrentEnvelope() {
  pb::Envelope env;
  env.set_protocol_major(kProtocolMajor);
  env.set_protocol_minor(kProtocolMinor);
  return env;
}

// =============================================================================
// Round trips through the public API
// =============================================================================

TEST(MessageCodecTest, GenerateRoundTripKeepsPayloadBytesOpaque) {
  Generate g;
  g.id = "job-1";
  g.payload.schema_version = 3;
  g.payload.bytes = std::string("\x00\x01\xff binary", 10);
  g.priority = core::JobPriority::kUrgent;

  const std::string wire = EncodeRequest(g);
  auto decoded = DecodeRequest(wire);
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  ASSERT_TRUE(std::holds_alternative<Generate>(decoded.value));
  EXPECT_EQ(std::get<Generate>(decoded.value), g);
  EXPECT_EQ(decoded.correlation_id, "job-1");
  EXPECT_EQ(decoded.peer_minor, kProtocolMinor);
}

TEST(MessageCodecTest, StatusInfoCarriesJobsAndEstimates) {
  StatusInfo s;
  s.queued = 2;
  s.running = 1;
  s.throughput_per_min = 1.5;
  s.completed = 7;
  s.failed = 1;
  s.cancelled = 3;
  s.version = "0.1.0";
  s.uptime_seconds = 12.25;
  s.jobs.push_back({"a", core::JobStatus::kRunning, core::Stage::kExecuting, 0.4});
  s.jobs.push_back({"b", core::JobStatus::kQueued, core::Stage::kQueued, 0.0});
  s.stage_estimates.push_back({core::Stage::kExecuting, 9.5, 4});

  auto decoded = DecodeResponse(EncodeResponse(s, "corr-9"));
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  ASSERT_TRUE(std::holds_alternative<StatusInfo>(decoded.value));
  EXPECT_EQ(std::get<StatusInfo>(decoded.value), s);
  EXPECT_EQ(decoded.correlation_id, "corr-9");
}

TEST(MessageCodecTest, UpdatesAreKeyedByJobId) {
  Update u = JobFinished{"job-7", core::JobStatus::kFailed, 3.5, "boom"};
  auto decoded = DecodeUpdate(EncodeUpdate(u));
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  EXPECT_EQ(decoded.value, u);
  EXPECT_EQ(decoded.correlation_id, "job-7");
}

TEST(MessageCodecTest, ResponseEchoesCorrelationId) {
  auto decoded = DecodeResponse(EncodeResponse(JobCancelled{"x"}, "x"));
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.correlation_id, "x");

  auto pong = DecodeResponse(EncodeResponse(Pong{42}, std::string()));
  ASSERT_TRUE(pong.ok());
  EXPECT_TRUE(pong.correlation_id.empty());
  EXPECT_EQ(std::get<Pong>(pong.value).server_time_ms, 42);
}

// =============================================================================
// Every variant through bytes and back
// =============================================================================

struct RequestCase {
  const char* name;
  Request request;
};

struct ResponseCase {
  const char* name;
  Response response;
  std::string correlation_id;
};

struct UpdateCase {
  const char* name;
  Update update;
};

template <class Case>
std::string CaseName(const ::testing::TestParamInfo<Case>& info) {
  return info.param.name;
}

Generate UrgentGenerate() {
  Generate g;
  g.id = "urgent";
  g.priority = core::JobPriority::kUrgent;
  g.payload.schema_version = std::numeric_limits<uint32_t>::max();
  g.payload.bytes = "{}";
  return g;
}

Generate LowGenerateWithoutPayload() {
  Generate g;
  g.id = "low";
  g.priority = core::JobPriority::kLow;
  return g;
}

std::vector<RequestCase> RequestCases() {
  return {
      {"GenerateUrgent", UrgentGenerate()},
      {"GenerateLowEmptyPayload", LowGenerateWithoutPayload()},
      {"GenerateEmptyId", Generate{}},
      {"Cancel", Cancel{"job-1"}},
      {"CancelEmptyId", Cancel{""}},
      {"ListModels", ListModels{}},
      {"StatusRequest", StatusRequest{}},
      {"Ping", Ping{}},
  };
}

std::vector<ResponseCase> ResponseCases() {
  StatusInfo idle;
  idle.version = "0.1.0";

  StatusInfo busy;
  busy.queued = std::numeric_limits<uint32_t>::max();
  busy.running = 1;
  busy.completed = std::numeric_limits<uint64_t>::max();
  busy.jobs.push_back({"r", core::JobStatus::kRunning, core::Stage::kSaving, 1.0});
  busy.stage_estimates.push_back({core::Stage::kPostprocessing, 0.0, 0});

  ModelList models;
  models.items.push_back({"sd.safetensors", "/m/checkpoints/sd.safetensors",
                          ModelKind::kCheckpoint, 2048.5});
  models.items.push_back({"style.pt", "/m/loras/style.pt", ModelKind::kLora, 0.0});
  models.items.push_back({"vae.ckpt", "/m/vae/vae.ckpt", ModelKind::kVae, 1.0});

  return {
      {"JobAccepted", JobAccepted{"a", 12.5}, "a"},
      {"JobAcceptedNoEstimate", JobAccepted{"a", 0.0}, "a"},
      {"JobComplete", JobComplete{"c", {"/out/1.png", "/out/2.png"}}, "c"},
      {"JobCompleteNoOutputs", JobComplete{"c", {}}, "c"},
      {"JobError", JobError{"e", "worker exited with status 1"}, "e"},
      {"JobCancelled", JobCancelled{"x"}, "x"},
      {"ModelList", models, ""},
      {"ModelListEmpty", ModelList{}, ""},
      {"StatusInfoIdle", idle, ""},
      {"StatusInfoBusy", busy, ""},
      {"Pong", Pong{std::numeric_limits<int64_t>::max()}, ""},
      {"ErrorResponse", ErrorResponse{"bad request: Malformed: empty message"}, ""},
  };
}

std::vector<UpdateCase> UpdateCases() {
  return {
      {"JobStarted", JobStarted{"s", 1700000000000}},
      {"ProgressAtZero", Progress{"p", core::Stage::kQueued, 0.0, 0.0}},
      {"ProgressAtOne", Progress{"p", core::Stage::kDone, 1.0, 0.0}},
      {"ProgressMidway", Progress{"p", core::Stage::kExecuting, 0.5, 30.25}},
      {"Preview", Preview{"v", "/tmp/step-03.png"}},
      {"PreviewEmptyPath", Preview{"v", ""}},
      {"JobFinishedCompleted", JobFinished{"f", core::JobStatus::kCompleted, 4.5, ""}},
      {"JobFinishedFailed", JobFinished{"f", core::JobStatus::kFailed, 0.0, "oom"}},
      {"JobFinishedCancelled", JobFinished{"f", core::JobStatus::kCancelled, 1.0, ""}},
  };
}

class RequestRoundTripTest : public ::testing::TestWithParam<RequestCase> {};

TEST_P(RequestRoundTripTest, DecodesToTheSameRequest) {
  const Request& request = GetParam().request;
  auto decoded = DecodeRequest(EncodeRequest(request));
  ASSERT_TRUE(decoded.ok()) << ToString(decoded.error) << ": " << decoded.detail;
  EXPECT_EQ(decoded.value, request);
  EXPECT_EQ(decoded.correlation_id, CorrelationIdOf(request));
  EXPECT_EQ(decoded.value.index(), request.index());
}

INSTANTIATE_TEST_SUITE_P(AllRequests, RequestRoundTripTest,
                         ::testing::ValuesIn(RequestCases()),
                         CaseName<RequestCase>);

class ResponseRoundTripTest : public ::testing::TestWithParam<ResponseCase> {};

TEST_P(ResponseRoundTripTest, DecodesToTheSameResponse) {
  const ResponseCase& c = GetParam();
  auto decoded = DecodeResponse(EncodeResponse(c.response, c.correlation_id));
  ASSERT_TRUE(decoded.ok()) << ToString(decoded.error) << ": " << decoded.detail;
  EXPECT_EQ(decoded.value, c.response);
  EXPECT_EQ(decoded.correlation_id, c.correlation_id);
}

INSTANTIATE_TEST_SUITE_P(AllResponses, ResponseRoundTripTest,
                         ::testing::ValuesIn(ResponseCases()),
                         CaseName<ResponseCase>);

class UpdateRoundTripTest : public ::testing::TestWithParam<UpdateCase> {};

TEST_P(UpdateRoundTripTest, DecodesToTheSameUpdate) {
  const Update& update = GetParam().update;
  auto decoded = DecodeUpdate(EncodeUpdate(update));
  ASSERT_TRUE(decoded.ok()) << ToString(decoded.error) << ": " << decoded.detail;
  EXPECT_EQ(decoded.value, update);
  EXPECT_EQ(decoded.correlation_id, JobIdOf(update));
}

INSTANTIATE_TEST_SUITE_P(AllUpdates, UpdateRoundTripTest,
                         ::testing::ValuesIn(UpdateCases()),
                         CaseName<UpdateCase>);

// Every alternative of each family appears in its table.
TEST(MessageCodecTest, TablesCoverEveryVariant) {
  std::vector<bool> requests(std::variant_size_v<Request>, false);
  for (const auto& c : RequestCases()) requests[c.request.index()] = true;
  std::vector<bool> responses(std::variant_size_v<Response>, false);
  for (const auto& c : ResponseCases()) responses[c.response.index()] = true;
  std::vector<bool> updates(std::variant_size_v<Update>, false);
  for (const auto& c : UpdateCases()) updates[c.update.index()] = true;

  EXPECT_EQ(requests, std::vector<bool>(5, true));
  EXPECT_EQ(responses, std::vector<bool>(8, true));
  EXPECT_EQ(updates, std::vector<bool>(4, true));
}

TEST(MessageCodecTest, EnvelopeOverloadsMatchByteOverloads) {
  pb::Envelope env;
  EncodeUpdate(Progress{"p", core::Stage::kExecuting, 0.25, 1.0}, &env);
  EXPECT_EQ(Serialize(env), EncodeUpdate(Progress{"p", core::Stage::kExecuting, 0.25, 1.0}));

  // Encoding into a used envelope replaces its contents.
  EncodeRequest(Ping{}, &env);
  auto decoded = DecodeRequest(env);
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  EXPECT_TRUE(std::holds_alternative<Ping>(decoded.value));
  EXPECT_FALSE(env.has_update());
}

// =============================================================================
// Malformed input
// =============================================================================

TEST(MessageCodecTest, EmptyInputIsMalformed) {
  auto decoded = DecodeRequest(std::string());
  EXPECT_EQ(decoded.error, CodecError::kMalformed);
  EXPECT_FALSE(decoded.detail.empty());
}

TEST(MessageCodecTest, GarbageIsMalformed) {
  auto decoded = DecodeRequest(std::string("\xff\xff\xff\xff", 4));
  EXPECT_EQ(decoded.error, CodecError::kMalformed);

  auto update = DecodeUpdate(std::string("\xff\xff\xff\xff", 4));
  EXPECT_EQ(update.error, CodecError::kMalformed);
}

TEST(MessageCodecTest, NullPointerIsMalformed) {
  auto decoded = DecodeResponse(nullptr, 0);
  EXPECT_EQ(decoded.error, CodecError::kMalformed);
}

// =============================================================================
// Versioning
// =============================================================================

TEST(MessageCodecTest, DifferentMajorIsRejected) {
  pb::Envelope env = CurrentEnvelope();
  env.set_protocol_major(kProtocolMajor + 1);
  env.mutable_request()->mutable_ping();

  auto decoded = DecodeRequest(Serialize(env));
  EXPECT_EQ(decoded.error, CodecError::kVersionMismatch);
  EXPECT_NE(decoded.detail.find("major"), std::string::npos);
}

TEST(MessageCodecTest, MissingMajorIsRejected) {
  pb::Envelope env;
  env.mutable_request()->mutable_ping();
  EXPECT_EQ(DecodeRequest(Serialize(env)).error, CodecError::kVersionMismatch);
}

TEST(MessageCodecTest, NewerMinorIsAcceptedAndReported) {
  pb::Envelope env = CurrentEnvelope();
  env.set_protocol_minor(kProtocolMinor + 5);
  env.mutable_request()->mutable_status();

  auto decoded = DecodeRequest(Serialize(env));
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  EXPECT_TRUE(std::holds_alternative<StatusRequest>(decoded.value));
  EXPECT_EQ(decoded.peer_minor, kProtocolMinor + 5);
}

// =============================================================================
// Family and variant checks
// =============================================================================

TEST(MessageCodecTest, ResponseHandedToRequestDecoderIsWrongFamily) {
  auto decoded = DecodeRequest(EncodeResponse(Pong{1}, std::string()));
  EXPECT_EQ(decoded.error, CodecError::kWrongFamily);

  auto update = DecodeUpdate(EncodeRequest(Ping{}));
  EXPECT_EQ(update.error, CodecError::kWrongFamily);
}

TEST(MessageCodecTest, EnvelopeWithoutBodyIsUnknownVariant) {
  pb::Envelope env = CurrentEnvelope();
  EXPECT_EQ(DecodeRequest(Serialize(env)).error, CodecError::kUnknownVariant);
}

TEST(MessageCodecTest, EmptyRequestIsUnknownVariant) {
  pb::Envelope env = CurrentEnvelope();
  env.mutable_request();
  EXPECT_EQ(DecodeRequest(Serialize(env)).error, CodecError::kUnknownVariant);
}

TEST(MessageCodecTest, FutureRequestKindIsUnknownVariant) {
  // Envelope{protocol_major=1, request{field 42 = varint 1}}.
  const std::string wire("\x08\x01\x52\x03\xd0\x02\x01", 7);
  auto decoded = DecodeRequest(wire);
  EXPECT_EQ(decoded.error, CodecError::kUnknownVariant);
}

TEST(MessageCodecTest, UnknownFieldsInsideKnownVariantAreIgnored) {
  pb::Envelope env = CurrentEnvelope();
  env.mutable_request()->mutable_cancel()->set_id("job-3");
  std::string wire = Serialize(env);
  // Append Envelope field 15 (varint 7), unknown to this build.
  wire.append("\x78\x07", 2);

  auto decoded = DecodeRequest(wire);
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  EXPECT_EQ(std::get<Cancel>(decoded.value).id, "job-3");
}

// =============================================================================
// Field validation
// =============================================================================

TEST(MessageCodecTest, EmptyJobIdsDecodeForEveryJobRequest) {
  pb::Envelope env = CurrentEnvelope();
  env.mutable_request()->mutable_generate()->set_payload("p");
  auto generate = DecodeRequest(Serialize(env));
  ASSERT_TRUE(generate.ok()) << generate.detail;
  EXPECT_TRUE(std::get<Generate>(generate.value).id.empty());

  env = CurrentEnvelope();
  env.mutable_request()->mutable_cancel();
  auto cancel = DecodeRequest(Serialize(env));
  ASSERT_TRUE(cancel.ok()) << cancel.detail;
  EXPECT_TRUE(std::get<Cancel>(cancel.value).id.empty());
}

TEST(MessageCodecTest, UnspecifiedPriorityDefaultsToNormal) {
  pb::Envelope env = CurrentEnvelope();
  env.mutable_request()->mutable_generate()->set_id("g");
  auto decoded = DecodeRequest(Serialize(env));
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  EXPECT_EQ(std::get<Generate>(decoded.value).priority, core::JobPriority::kNormal);
}

TEST(MessageCodecTest, OutOfRangePriorityIsInvalid) {
  pb::Envelope env = CurrentEnvelope();
  auto* g = env.mutable_request()->mutable_generate();
  g->set_id("g");
  g->set_priority(static_cast<pb::Priority>(42));
  auto decoded = DecodeRequest(Serialize(env));
  EXPECT_EQ(decoded.error, CodecError::kInvalidField);
  EXPECT_NE(decoded.detail.find("priority"), std::string::npos);
}

TEST(MessageCodecTest, ProgressFractionOutsideUnitRangeIsInvalid) {
  pb::Envelope env = CurrentEnvelope();
  auto* p = env.mutable_update()->mutable_progress();
  p->set_id("j");
  p->set_stage(pb::STAGE_EXECUTING);
  p->set_fraction(1.5);
  EXPECT_EQ(DecodeUpdate(Serialize(env)).error, CodecError::kInvalidField);

  p->set_fraction(std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(DecodeUpdate(Serialize(env)).error, CodecError::kInvalidField);

  p->set_fraction(0.5);
  p->set_eta_seconds(-1.0);
  EXPECT_EQ(DecodeUpdate(Serialize(env)).error, CodecError::kInvalidField);
}

TEST(MessageCodecTest, JobFinishedMustCarryTerminalStatus) {
  pb::Envelope env = CurrentEnvelope();
  auto* f = env.mutable_update()->mutable_job_finished();
  f->set_id("j");
  f->set_status(pb::JOB_STATUS_RUNNING);
  EXPECT_EQ(DecodeUpdate(Serialize(env)).error, CodecError::kInvalidField);

  f->set_status(pb::JOB_STATUS_CANCELLED);
  auto decoded = DecodeUpdate(Serialize(env));
  ASSERT_TRUE(decoded.ok()) << decoded.detail;
  EXPECT_EQ(std::get<JobFinished>(decoded.value).status,
            core::JobStatus::kCancelled);
}

TEST(MessageCodecTest, UnknownModelKindIsInvalid) {
  pb::Envelope env = CurrentEnvelope();
  auto* item = env.mutable_response()->mutable_model_list()->add_items();
  item->set_name("m");
  item->set_kind(static_cast<pb::ModelKind>(9));
  EXPECT_EQ(DecodeResponse(Serialize(env)).error, CodecError::kInvalidField);
}

TEST(MessageCodecTest, ErrorNamesAreStable) {
  EXPECT_STREQ(ToString(CodecError::kMalformed), "Malformed");
  EXPECT_STREQ(ToString(CodecError::kVersionMismatch), "VersionMismatch");
  EXPECT_STREQ(ToString(CodecError::kInvalidField), "InvalidField");
}

}  // namespace
}  // namespace pixelctl::protocol::testing
