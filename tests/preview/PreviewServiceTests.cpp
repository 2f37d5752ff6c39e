// Repository: pixelctl
// Component: Preview Service Tests
// Purpose: Async rendering, in-flight deduplication and cache interaction.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "fixtures/StubPreviewRenderer.hpp"
#include "pixelctl/preview/PreviewService.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/WaitFor.hpp"

namespace pixelctl::preview::testing {
namespace {

using pixelctl::testing::DeterministicTimeSource;
using pixelctl::testing::WaitFor;
using pixelctl::tests::fixtures::StubPreviewRenderer;

class PreviewServiceTest : public ::testing::Test {
 protected:
  PreviewServiceTest() : time_(1'000) {}

  void SetUp() override { Build(1024 * 1024); }

  void TearDown() override {
    renderer_.OpenGate();
    service_.reset();
  }

  void Build(size_t budget) {
    service_.reset();
    PreviewServiceConfig config;
    config.cache_budget_bytes = budget;
    service_ = std::make_unique<PreviewService>(renderer_, time_, config);
  }

  // Drains results until count have arrived.
  std::vector<PreviewResult> Collect(size_t count) {
    std::vector<PreviewResult> out;
    WaitFor([&] {
      while (auto r = service_->TryRecv()) out.push_back(std::move(*r));
      return out.size() >= count;
    });
    return out;
  }

  RenderOptions Options() const {
    RenderOptions o;
    o.width_cells = 40;
    o.height_cells = 20;
    o.protocol = TerminalProtocol::kHalfBlocks;
    return o;
  }

  StubPreviewRenderer renderer_;
  DeterministicTimeSource time_;
  std::unique_ptr<PreviewService> service_;
};

TEST_F(PreviewServiceTest, MissRendersInBackgroundThenHits) {
  PreviewTicket first = service_->Request("/tmp/pixelctl-a.png", Options());
  ASSERT_EQ(first.status, PreviewStatus::kPending);
  EXPECT_NE(first.ticket_id, 0u);

  auto results = Collect(1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].ticket_id, first.ticket_id);
  EXPECT_TRUE(results[0].success);
  EXPECT_TRUE(results[0].cached);
  ASSERT_NE(results[0].bytes, nullptr);
  EXPECT_EQ(*results[0].bytes,
            "render:" + CanonicalArtifactPath("/tmp/pixelctl-a.png") + ":40x20");

  PreviewTicket second = service_->Request("/tmp/pixelctl-a.png", Options());
  ASSERT_EQ(second.status, PreviewStatus::kHit);
  EXPECT_EQ(second.bytes.get(), results[0].bytes.get());
  EXPECT_EQ(renderer_.render_count(), 1);
}

TEST_F(PreviewServiceTest, ConcurrentRequestsShareOneRender) {
  renderer_.CloseGate();
  PreviewTicket a = service_->Request("/tmp/pixelctl-dup.png", Options());
  ASSERT_TRUE(renderer_.WaitStarted(1));
  PreviewTicket b = service_->Request("/tmp/pixelctl-dup.png", Options());
  PreviewTicket c = service_->Request("/tmp/pixelctl-dup.png", Options());
  ASSERT_EQ(b.status, PreviewStatus::kPending);
  ASSERT_EQ(c.status, PreviewStatus::kPending);
  EXPECT_EQ(service_->Stats().in_flight, 1u);
  renderer_.OpenGate();

  auto results = Collect(3);
  ASSERT_EQ(results.size(), 3u);
  std::set<uint64_t> tickets;
  for (const auto& r : results) {
    tickets.insert(r.ticket_id);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.bytes.get(), results[0].bytes.get());
  }
  EXPECT_EQ(tickets, (std::set<uint64_t>{a.ticket_id, b.ticket_id, c.ticket_id}));
  EXPECT_EQ(renderer_.render_count(), 1);
  EXPECT_EQ(service_->Stats().deduplicated, 2u);
}

TEST_F(PreviewServiceTest, DifferentOptionsRenderSeparately) {
  RenderOptions wide = Options();
  wide.width_cells = 80;
  service_->Request("/tmp/pixelctl-b.png", Options());
  service_->Request("/tmp/pixelctl-b.png", wide);
  auto results = Collect(2);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(renderer_.render_count(), 2);
  EXPECT_EQ(service_->cache().Size(), 2u);
}

TEST_F(PreviewServiceTest, FailuresAreNotCached) {
  const std::string path = "/tmp/pixelctl-broken.png";
  renderer_.FailPath(CanonicalArtifactPath(path));

  service_->Request(path, Options());
  auto results = Collect(1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].success);
  EXPECT_FALSE(results[0].cached);
  EXPECT_NE(results[0].error.find("cannot decode"), std::string::npos);

  // A later request renders again rather than serving the failure.
  PreviewTicket again = service_->Request(path, Options());
  EXPECT_EQ(again.status, PreviewStatus::kPending);
  Collect(1);
  EXPECT_EQ(renderer_.render_count(), 2);
  EXPECT_EQ(service_->Stats().render_failures, 2u);
}

TEST_F(PreviewServiceTest, NonStandardThrowFailsTicketAndWorkerSurvives) {
  const std::string bad = "/tmp/pixelctl-throws.png";
  renderer_.ThrowPath(CanonicalArtifactPath(bad));

  PreviewTicket ticket = service_->Request(bad, Options());
  auto results = Collect(1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].ticket_id, ticket.ticket_id);
  EXPECT_FALSE(results[0].success);
  EXPECT_EQ(results[0].error, "renderer error: unknown exception");

  // The worker thread keeps serving later requests.
  service_->Request("/tmp/pixelctl-after.png", Options());
  auto after = Collect(1);
  ASSERT_EQ(after.size(), 1u);
  EXPECT_TRUE(after[0].success);
}

TEST_F(PreviewServiceTest, HitRefreshesLastAccess) {
  const std::string path = "/tmp/pixelctl-c.png";
  service_->Request(path, Options());
  Collect(1);

  PreviewKey key{CanonicalArtifactPath(path), Options()};
  const int64_t inserted_at = service_->cache().LastAccessMs(key).value();
  time_.AdvanceMs(2'000);
  ASSERT_EQ(service_->Request(path, Options()).status, PreviewStatus::kHit);
  EXPECT_EQ(service_->cache().LastAccessMs(key).value(), inserted_at + 2'000);
}

TEST_F(PreviewServiceTest, ClearDuringRenderSkipsCaching) {
  renderer_.CloseGate();
  service_->Request("/tmp/pixelctl-d.png", Options());
  ASSERT_TRUE(renderer_.WaitStarted(1));
  service_->Clear();
  renderer_.OpenGate();

  auto results = Collect(1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_FALSE(results[0].cached);
  EXPECT_EQ(service_->cache().Size(), 0u);

  EXPECT_EQ(service_->Request("/tmp/pixelctl-d.png", Options()).status,
            PreviewStatus::kPending);
}

TEST_F(PreviewServiceTest, OversizedRenderIsDeliveredButNotCached) {
  Build(16);
  renderer_.SetOutputSize(64);
  service_->Request("/tmp/pixelctl-e.png", Options());
  auto results = Collect(1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_FALSE(results[0].cached);
  EXPECT_EQ(results[0].bytes->size(), 64u);
  EXPECT_EQ(service_->cache().Stats().rejected_too_large, 1u);
}

TEST_F(PreviewServiceTest, RefusedRequests) {
  RenderOptions none = Options();
  none.protocol = TerminalProtocol::kNone;
  EXPECT_EQ(service_->Request("/tmp/x.png", none).status, PreviewStatus::kUnavailable);

  RenderOptions zero = Options();
  zero.height_cells = 0;
  EXPECT_EQ(service_->Request("/tmp/x.png", zero).status, PreviewStatus::kUnavailable);

  PreviewTicket empty = service_->Request("", Options());
  EXPECT_EQ(empty.status, PreviewStatus::kUnavailable);
  EXPECT_FALSE(empty.error.empty());

  service_->Shutdown();
  EXPECT_EQ(service_->Request("/tmp/x.png", Options()).status,
            PreviewStatus::kUnavailable);
  EXPECT_EQ(renderer_.render_count(), 0);
}

TEST_F(PreviewServiceTest, EquivalentPathsShareCacheEntry) {
  service_->Request("/tmp/pixelctl-f.png", Options());
  Collect(1);
  EXPECT_EQ(service_->Request("/tmp/./pixelctl-f.png", Options()).status,
            PreviewStatus::kHit);
  EXPECT_EQ(service_->Request("/tmp/sub/../pixelctl-f.png", Options()).status,
            PreviewStatus::kHit);
}

}  // namespace
}  // namespace pixelctl::preview::testing
