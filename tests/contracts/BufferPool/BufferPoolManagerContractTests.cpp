// Repository: streamcore
// Component: BufferPoolManager Contract Tests
// Purpose: Pool lifecycle, capacity sizing, network adaptation and
//          aggregate statistics.
// Copyright (c) 2025 StreamCore

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <memory>
#include <stdexcept>

#include "streamcore/buffer/BufferPoolManager.hpp"
#include "../../fixtures/FakeMasterClock.h"

using namespace streamcore;
using namespace streamcore::buffer;
using namespace streamcore::tests;
using streamcore::tests::fixtures::FakeMasterClock;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "BufferPool", {"BUF-011", "BUF-012", "BUF-013", "BUF-014", "BUF-015"});
  return true;
}();

Chunk MakeChunk(const std::string& stream, uint64_t sequence, int64_t timestamp_ms) {
  Chunk chunk;
  chunk.stream_id = stream;
  chunk.sequence = sequence;
  chunk.timestamp_ms = timestamp_ms;
  chunk.kind = MediaKind::kAudio;
  chunk.payload.assign(32, 0x5A);
  return chunk;
}

class BufferPoolManagerContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "BufferPool"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"BUF-011", "BUF-012", "BUF-013", "BUF-014", "BUF-015"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    clock_ = std::make_shared<FakeMasterClock>(0);
    manager_ = std::make_unique<BufferPoolManager>(clock_, BufferConfig{});
  }

  std::shared_ptr<FakeMasterClock> clock_;
  std::unique_ptr<BufferPoolManager> manager_;
};

// Rule: BUF-011 One pool per stream; unknown streams are reported, not thrown.
TEST_F(BufferPoolManagerContractTest, BUF_011_PoolLifecycle) {
  ASSERT_NE(manager_->CreatePool("a1", MediaKind::kAudio, CapacityStrategy::kFixed), nullptr);
  EXPECT_EQ(manager_->CreatePool("a1", MediaKind::kAudio, CapacityStrategy::kFixed), nullptr);
  EXPECT_TRUE(manager_->HasPool("a1"));

  EXPECT_EQ(manager_->AddChunk("missing", MakeChunk("missing", 1, 0)).result,
            AdmissionResult::kUnknownStream);
  EXPECT_EQ(manager_->NextChunk("missing", 0).status, NextChunkStatus::kUnknownStream);
  EXPECT_EQ(manager_->Flush("missing"), 0u);
  EXPECT_FALSE(manager_->PinChunk("missing", 1));

  auto held = manager_->GetPool("a1");
  EXPECT_TRUE(manager_->DestroyPool("a1"));
  EXPECT_FALSE(manager_->DestroyPool("a1"));
  EXPECT_TRUE(held->IsClosed());
  EXPECT_EQ(manager_->AddChunk("a1", MakeChunk("a1", 1, 0)).result,
            AdmissionResult::kUnknownStream);
}

// Rule: BUF-011 Bad construction input is a programming error.
TEST_F(BufferPoolManagerContractTest, BUF_011_ConstructionMisuseThrows) {
  EXPECT_THROW({ BufferPoolManager m(nullptr, BufferConfig{}); }, std::invalid_argument);
  BufferConfig bad;
  bad.watermark_fractions = WatermarkFractions{0.9, 0.5, 0.95};
  EXPECT_THROW({ BufferPoolManager m(clock_, bad); }, std::invalid_argument);
  EXPECT_THROW(manager_->CreatePool("x", MediaKind::kAudio, CapacityStrategy::kFixed, 10,
                                    Watermarks{5, 5, 9}),
               std::invalid_argument);
}

// Rule: BUF-012 Capacity scales with kind, strategy and target latency.
TEST_F(BufferPoolManagerContractTest, BUF_012_ComputeCapacity) {
  EXPECT_EQ(manager_->ComputeCapacity(MediaKind::kAudio, CapacityStrategy::kFixed, 0), 64u);
  EXPECT_EQ(manager_->ComputeCapacity(MediaKind::kVideo, CapacityStrategy::kAdaptive, 0), 384u);
  EXPECT_EQ(manager_->ComputeCapacity(MediaKind::kData, CapacityStrategy::kPredictive, 0), 64u);
  EXPECT_EQ(manager_->ComputeCapacity(MediaKind::kAudio, CapacityStrategy::kFixed, 50), 32u);
  EXPECT_EQ(manager_->ComputeCapacity(MediaKind::kAudio, CapacityStrategy::kFixed, 300), 64u);
  EXPECT_EQ(manager_->ComputeCapacity(MediaKind::kAudio, CapacityStrategy::kFixed, 600), 128u);

  BufferConfig tiny;
  tiny.base_capacity_chunks = 3;
  BufferPoolManager small(clock_, tiny);
  EXPECT_EQ(small.ComputeCapacity(MediaKind::kData, CapacityStrategy::kFixed, 50), 3u);

  auto pool = manager_->CreatePool("v1", MediaKind::kVideo, CapacityStrategy::kAdaptive, 0);
  ASSERT_NE(pool, nullptr);
  EXPECT_EQ(pool->Capacity(), 384u);
  const Watermarks wm = pool->GetWatermarks();
  EXPECT_LT(wm.low, wm.high);
  EXPECT_LT(wm.high, wm.critical);
  EXPECT_LE(wm.critical, pool->Capacity());
}

// Rule: BUF-013 Optimal size follows bandwidth and quality and never drops below 3.
TEST_F(BufferPoolManagerContractTest, BUF_013_PredictOptimalSize) {
  EXPECT_EQ(manager_->PredictOptimalSize(MediaKind::kAudio, 5'000'000, "medium"), 64u);
  EXPECT_EQ(manager_->PredictOptimalSize(MediaKind::kAudio, 500'000, "medium"), 32u);
  EXPECT_EQ(manager_->PredictOptimalSize(MediaKind::kAudio, 20'000'000, "high"), 144u);
  EXPECT_EQ(manager_->PredictOptimalSize(MediaKind::kAudio, 500'000, "low"), 22u);

  BufferConfig tiny;
  tiny.base_capacity_chunks = 3;
  BufferPoolManager small(clock_, tiny);
  EXPECT_EQ(small.PredictOptimalSize(MediaKind::kData, 100'000, "low"), 3u);
}

// Rule: BUF-014 Lossy or slow networks grow the pool and its target latency.
TEST_F(BufferPoolManagerContractTest, BUF_014_AdaptToConditions) {
  auto pool = manager_->CreatePool("a1", MediaKind::kAudio, CapacityStrategy::kFixed, 0);
  ASSERT_NE(pool, nullptr);
  ASSERT_EQ(pool->Capacity(), 64u);

  NetworkConditions lossy;
  lossy.bandwidth_bps = 2'000'000;
  lossy.packet_loss = 0.10;
  lossy.rtt_ms = 300;
  PoolAdaptation first = manager_->AdaptToConditions("a1", lossy);
  EXPECT_TRUE(first.resized);
  EXPECT_EQ(first.previous_capacity, 64u);
  EXPECT_EQ(first.new_capacity, 96u);
  EXPECT_EQ(first.new_target_latency_ms, 500);
  EXPECT_EQ(pool->Capacity(), 96u);
  EXPECT_EQ(pool->TargetLatencyMs(), 500);

  // Small changes do not trigger a resize.
  NetworkConditions calm;
  calm.bandwidth_bps = 2'000'000;
  calm.packet_loss = 0.01;
  calm.rtt_ms = 40;
  PoolAdaptation second = manager_->AdaptToConditions("a1", calm);
  EXPECT_FALSE(second.resized);
  EXPECT_EQ(second.new_capacity, 96u);
  EXPECT_EQ(pool->TargetLatencyMs(), 500);

  EXPECT_FALSE(manager_->AdaptToConditions("missing", lossy).resized);
}

// Rule: BUF-015 Statistics aggregate per-pool metrics and health.
TEST_F(BufferPoolManagerContractTest, BUF_015_Statistics) {
  manager_->CreatePool("a1", MediaKind::kAudio, CapacityStrategy::kFixed, 10,
                       Watermarks{2, 7, 9});
  manager_->CreatePool("a2", MediaKind::kAudio, CapacityStrategy::kFixed, 10,
                       Watermarks{2, 7, 9});
  for (uint64_t i = 1; i <= 5; ++i) {
    ASSERT_TRUE(manager_->AddChunk("a1", MakeChunk("a1", i, static_cast<int64_t>(i) * 10))
                    .admitted());
  }

  EXPECT_TRUE(manager_->CapacityCheck("a1", 5));
  EXPECT_FALSE(manager_->CapacityCheck("a1", 6));

  const BufferStatistics stats = manager_->Statistics();
  EXPECT_EQ(stats.total_pools, 2u);
  EXPECT_EQ(stats.total_chunks, 5u);
  EXPECT_EQ(stats.total_bytes, 5u * 32u);
  EXPECT_DOUBLE_EQ(stats.average_level, 0.25);
  ASSERT_EQ(stats.pools.count("a1"), 1u);
  EXPECT_DOUBLE_EQ(stats.pools.at("a1").efficiency, 1.0);
  EXPECT_DOUBLE_EQ(stats.pools.at("a2").efficiency, 0.5);
  EXPECT_GT(stats.pools.at("a1").performance_score, stats.pools.at("a2").performance_score);
  EXPECT_GE(stats.performance_score, 0.0);
  EXPECT_LE(stats.performance_score, 1.0);
}

}  // namespace
