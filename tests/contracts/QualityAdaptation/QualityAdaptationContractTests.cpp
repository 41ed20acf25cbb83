// Repository: streamcore
// Component: QualityAdaptationEngine Contract Tests
// Purpose: Emergency path, hysteresis and dwell gating, constraint clamping
//          and forced quality changes.
// Copyright (c) 2025 StreamCore

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <memory>
#include <stdexcept>

#include "streamcore/adaptation/QualityAdaptationEngine.hpp"
#include "../../fixtures/FakeMasterClock.h"

using namespace streamcore;
using namespace streamcore::adaptation;
using namespace streamcore::tests;
using streamcore::tests::fixtures::FakeMasterClock;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "QualityAdaptation",
      {"ADAPT-001", "ADAPT-002", "ADAPT-003", "ADAPT-004", "ADAPT-005", "ADAPT-006",
       "ADAPT-007", "ADAPT-008"});
  return true;
}();

codec::QualityLadder VideoLadder() {
  codec::QualityLadder ladder;
  auto rung = [&ladder](const char* name, int64_t bitrate, Resolution resolution) {
    codec::QualityLevel level;
    level.index = ladder.size();
    level.name = name;
    level.codec = "H264";
    level.bitrate_bps = bitrate;
    level.resolution = resolution;
    level.framerate = 30;
    ladder.push_back(level);
  };
  rung("low", 500'000, {426, 240});
  rung("medium", 1'000'000, {640, 360});
  rung("high", 2'500'000, {1280, 720});
  rung("ultra", 5'000'000, {1920, 1080});
  return ladder;
}

NetworkConditions Network(int64_t bandwidth_bps, double packet_loss = 0.0, int64_t rtt_ms = 40) {
  NetworkConditions conditions;
  conditions.bandwidth_bps = bandwidth_bps;
  conditions.packet_loss = packet_loss;
  conditions.rtt_ms = rtt_ms;
  return conditions;
}

// Always proposes the lowest rung.
class FloorScorer : public IQualityScorer {
 public:
  ScoredCandidate Propose(const AdaptationContext&, int64_t) const override {
    ScoredCandidate out;
    out.rung = 0;
    out.reason = "floor";
    out.confidence = 0.7;
    return out;
  }
  const char* Name() const override { return "floor"; }
};

class QualityAdaptationContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "QualityAdaptation"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"ADAPT-001", "ADAPT-002", "ADAPT-003", "ADAPT-004",
            "ADAPT-005", "ADAPT-006", "ADAPT-007", "ADAPT-008"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    clock_ = std::make_shared<FakeMasterClock>(1'000'000);
    engine_ = std::make_unique<QualityAdaptationEngine>(clock_, AdaptationConfig{});
  }

  void Start(const QualityConstraints& constraints = QualityConstraints{},
             const UserPreferences& preferences = UserPreferences{}) {
    ASSERT_EQ(engine_->AddStream("v1", MediaKind::kVideo, VideoLadder(), preferences,
                                 constraints),
              StartStreamResult::kStarted);
  }

  size_t CurrentRung() { return engine_->Context("v1")->current_rung; }

  std::shared_ptr<FakeMasterClock> clock_;
  std::unique_ptr<QualityAdaptationEngine> engine_;
};

// Rule: ADAPT-001 Streams start in the lower half of the ladder; bad ladders are refused.
TEST_F(QualityAdaptationContractTest, ADAPT_001_StreamStart) {
  Start();
  EXPECT_EQ(CurrentRung(), 1u);
  EXPECT_EQ(engine_->AddStream("v1", MediaKind::kVideo, VideoLadder(), {}, {}),
            StartStreamResult::kAlreadyExists);
  EXPECT_EQ(engine_->AddStream("v2", MediaKind::kVideo, {}, {}, {}),
            StartStreamResult::kEmptyLadder);

  QualityConstraints impossible;
  impossible.min_bitrate_bps = 10'000'000;
  EXPECT_EQ(engine_->AddStream("v3", MediaKind::kVideo, VideoLadder(), {}, impossible),
            StartStreamResult::kNoValidRung);

  UserPreferences thrifty;
  thrifty.max_bitrate_bps = 600'000;
  EXPECT_EQ(engine_->AddStream("v4", MediaKind::kVideo, VideoLadder(), thrifty, {}),
            StartStreamResult::kStarted);
  EXPECT_EQ(engine_->Context("v4")->current_rung, 0u);

  EXPECT_FALSE(engine_->Evaluate("missing").has_value());
  EXPECT_TRUE(engine_->RemoveStream("v4"));
  EXPECT_FALSE(engine_->HasStream("v4"));
}

// Rule: ADAPT-002 Bandwidth below the lowest rung forces an immediate emergency.
TEST_F(QualityAdaptationContractTest, ADAPT_002_BandwidthBelowLadderIsEmergency) {
  Start();
  ASSERT_TRUE(engine_->UpdateNetworkConditions("v1", Network(300'000)));

  auto decision = engine_->Evaluate("v1");
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(decision->action, AdaptationAction::kEmergency);
  EXPECT_EQ(decision->reason, "bandwidth-below-ladder");
  EXPECT_EQ(decision->new_quality.name, "low");
  EXPECT_EQ(decision->previous_quality.name, "medium");
  EXPECT_DOUBLE_EQ(decision->confidence, 1.0);
  EXPECT_TRUE(decision->timeline.immediate);
  EXPECT_EQ(decision->timeline.transition_ms, 0);
  ASSERT_TRUE(decision->rollback_plan.has_value());
  EXPECT_EQ(decision->rollback_plan->name, "medium");
  EXPECT_EQ(CurrentRung(), 0u);

  // Already at the floor: nothing further to shed.
  EXPECT_NE(engine_->Evaluate("v1")->action, AdaptationAction::kEmergency);
  EXPECT_EQ(engine_->Statistics().emergencies, 1u);
}

// Rule: ADAPT-002 Underrun and desync signals bypass dwell and hysteresis.
TEST_F(QualityAdaptationContractTest, ADAPT_002_SignalsAreEmergencies) {
  Start();
  ASSERT_TRUE(engine_->ForceQualityChange("v1", "ultra", "operator").decision.has_value());

  ASSERT_TRUE(engine_->SignalUnderrun("v1"));
  auto underrun = engine_->Evaluate("v1");
  EXPECT_EQ(underrun->action, AdaptationAction::kEmergency);
  EXPECT_EQ(underrun->reason, "buffer-underrun");
  EXPECT_EQ(underrun->new_quality.index, 0u);

  ASSERT_TRUE(engine_->SignalDesync("v1"));
  EXPECT_EQ(engine_->Evaluate("v1")->reason, "sync-desync");

  ASSERT_TRUE(engine_->SignalEmergency("v1", "eviction-blocked"));
  EXPECT_EQ(engine_->Evaluate("v1")->reason, "eviction-blocked");
  EXPECT_FALSE(engine_->SignalUnderrun("missing"));
}

// Rule: ADAPT-003 Candidates within the hysteresis band are ignored.
TEST_F(QualityAdaptationContractTest, ADAPT_003_HysteresisBand) {
  Start();
  // 4 Mbps affords "high", one rung above "medium".
  engine_->UpdateNetworkConditions("v1", Network(4'000'000));
  auto decision = engine_->Evaluate("v1");
  EXPECT_EQ(decision->action, AdaptationAction::kMaintain);
  EXPECT_EQ(decision->reason, "hysteresis");
  EXPECT_EQ(CurrentRung(), 1u);
  EXPECT_TRUE(engine_->History("v1").empty());
}

// Rule: ADAPT-004 At most one non-emergency action per dwell window.
TEST_F(QualityAdaptationContractTest, ADAPT_004_DwellAllowsOneActionPerWindow) {
  Start();
  engine_->UpdateNetworkConditions("v1", Network(20'000'000));
  auto up = engine_->Evaluate("v1");
  ASSERT_EQ(up->action, AdaptationAction::kUpgrade);
  EXPECT_EQ(up->new_quality.name, "ultra");
  EXPECT_EQ(up->reason, "upgrade-opportunity");
  EXPECT_FALSE(up->timeline.immediate);
  EXPECT_EQ(up->timeline.transition_ms, 1'000);

  // Bandwidth collapses to something "medium" fits but "ultra" does not.
  int actions = 0;
  for (int i = 0; i < 4; ++i) {
    clock_->AdvanceMs(1'000);
    engine_->UpdateNetworkConditions("v1", Network(1'500'000));
    auto d = engine_->Evaluate("v1");
    if (d->action != AdaptationAction::kMaintain) {
      ++actions;
    } else {
      EXPECT_EQ(d->reason, "dwell");
    }
  }
  EXPECT_EQ(actions, 0);
  EXPECT_EQ(CurrentRung(), 3u);

  clock_->AdvanceMs(1'000);
  engine_->UpdateNetworkConditions("v1", Network(1'500'000));
  auto down = engine_->Evaluate("v1");
  EXPECT_EQ(down->action, AdaptationAction::kDowngrade);
  EXPECT_EQ(down->reason, "bandwidth-drop");
  EXPECT_EQ(down->new_quality.name, "medium");
  EXPECT_EQ(engine_->History("v1").size(), 2u);
  EXPECT_EQ(engine_->Context("v1")->metrics.quality_changes, 2u);
}

// Rule: ADAPT-005 Every decision lands on a rung that satisfies the constraints.
TEST_F(QualityAdaptationContractTest, ADAPT_005_ConstraintsBoundDecisions) {
  QualityConstraints constraints;
  constraints.min_bitrate_bps = 1'000'000;
  constraints.max_bitrate_bps = 2'500'000;
  Start(constraints);
  EXPECT_EQ(CurrentRung(), 1u);

  engine_->UpdateNetworkConditions("v1", Network(50'000'000));
  auto up = engine_->Evaluate("v1");
  ASSERT_EQ(up->action, AdaptationAction::kUpgrade);
  EXPECT_EQ(up->new_quality.name, "high");

  ASSERT_TRUE(engine_->SignalUnderrun("v1"));
  auto emergency = engine_->Evaluate("v1");
  EXPECT_EQ(emergency->action, AdaptationAction::kEmergency);
  EXPECT_EQ(emergency->new_quality.name, "medium");

  for (const auto& decision : engine_->History("v1")) {
    EXPECT_TRUE(SatisfiesConstraints(decision.new_quality, MediaKind::kVideo, constraints));
  }
}

// Rule: ADAPT-006 Forced changes are validated, not clamped, and lose to emergencies.
TEST_F(QualityAdaptationContractTest, ADAPT_006_ForceQualityChange) {
  QualityConstraints constraints;
  constraints.max_bitrate_bps = 2'500'000;
  Start(constraints);

  EXPECT_EQ(engine_->ForceQualityChange("missing", "low", "").result,
            ForceResult::kUnknownStream);
  EXPECT_EQ(engine_->ForceQualityChange("v1", "nope", "").result, ForceResult::kUnknownQuality);
  EXPECT_EQ(engine_->ForceQualityChange("v1", "ultra", "").result,
            ForceResult::kConstraintViolation);

  ForceOutcome applied = engine_->ForceQualityChange("v1", "high", "operator");
  ASSERT_EQ(applied.result, ForceResult::kApplied);
  ASSERT_TRUE(applied.decision.has_value());
  EXPECT_TRUE(applied.decision->forced);
  EXPECT_EQ(applied.decision->reason, "operator");
  EXPECT_EQ(applied.decision->action, AdaptationAction::kUpgrade);
  EXPECT_EQ(CurrentRung(), 2u);

  EXPECT_EQ(engine_->ForceQualityChange("v1", "0", "").result, ForceResult::kApplied);
  EXPECT_EQ(CurrentRung(), 0u);

  // A pending emergency wins over the forced target.
  engine_->SignalUnderrun("v1");
  EXPECT_EQ(engine_->ForceQualityChange("v1", "high", "").result,
            ForceResult::kPreemptedByEmergency);
  ASSERT_EQ(engine_->Evaluate("v1")->action, AdaptationAction::kEmergency);

  // So does one applied within the dwell window.
  clock_->AdvanceMs(engine_->config().dwell_time_ms - 1);
  EXPECT_EQ(engine_->ForceQualityChange("v1", "high", "").result,
            ForceResult::kPreemptedByEmergency);
  clock_->AdvanceMs(1);
  EXPECT_EQ(engine_->ForceQualityChange("v1", "high", "").result, ForceResult::kApplied);
  EXPECT_EQ(engine_->Statistics().forced, 3u);
}

// Rule: ADAPT-007 Without a trigger the engine maintains quality and records nothing.
TEST_F(QualityAdaptationContractTest, ADAPT_007_NoTriggerMaintains) {
  Start();
  auto decision = engine_->Evaluate("v1");
  EXPECT_EQ(decision->action, AdaptationAction::kMaintain);
  EXPECT_EQ(decision->reason, "no-trigger");
  EXPECT_FALSE(decision->rollback_plan.has_value());
  EXPECT_TRUE(engine_->History("v1").empty());

  AdaptationContext context = *engine_->Context("v1");
  EXPECT_FALSE(QualityAdaptationEngine::ShouldConsiderAdaptation(context, RuleConfig{}));
  context.has_network_sample = true;
  context.network = Network(1'000'000, 0.08);
  EXPECT_TRUE(QualityAdaptationEngine::ShouldConsiderAdaptation(context, RuleConfig{}));
  context.network = Network(1'000'000);
  context.metrics.buffer_health = 0.1;
  EXPECT_TRUE(QualityAdaptationEngine::ShouldConsiderAdaptation(context, RuleConfig{}));

  const AdaptationStatistics stats = engine_->Statistics();
  EXPECT_EQ(stats.total_decisions, 1u);
  EXPECT_EQ(stats.by_action.at("maintain"), 1u);
  EXPECT_EQ(stats.active_streams, 1u);
}

// Rule: ADAPT-008 The scorer is pluggable; history is bounded.
TEST_F(QualityAdaptationContractTest, ADAPT_008_CustomScorerAndHistoryLimit) {
  AdaptationConfig config;
  config.dwell_time_ms = 0;
  config.history_limit = 2;
  QualityAdaptationEngine engine(clock_, config, std::make_unique<FloorScorer>());
  EXPECT_STREQ(engine.scorer().Name(), "floor");

  UserPreferences prefs;
  ASSERT_EQ(engine.AddStream("v1", MediaKind::kVideo, VideoLadder(), prefs, {}),
            StartStreamResult::kStarted);
  engine.ForceQualityChange("v1", "ultra", "");
  engine.UpdateNetworkConditions("v1", Network(1'000'000, 0.2));
  auto decision = engine.Evaluate("v1");
  EXPECT_EQ(decision->action, AdaptationAction::kDowngrade);
  EXPECT_EQ(decision->reason, "floor");
  EXPECT_LT(decision->estimated_impact.ux, 0.0);
  EXPECT_LT(decision->estimated_impact.bandwidth_bps, 0.0);

  engine.ForceQualityChange("v1", "high", "");
  EXPECT_EQ(engine.History("v1").size(), 2u);
  EXPECT_EQ(engine.History("v1").back().new_quality.name, "high");

  EXPECT_THROW({ QualityAdaptationEngine e(nullptr, AdaptationConfig{}); },
               std::invalid_argument);
}

// Rule: ADAPT-008 The default scorer caps by device and user priority.
TEST_F(QualityAdaptationContractTest, ADAPT_008_RuleBasedScorerCaps) {
  RuleBasedQualityScorer scorer;
  AdaptationContext context;
  context.stream_id = "v1";
  context.kind = MediaKind::kVideo;
  context.ladder = VideoLadder();
  context.current_rung = 3;
  context.has_network_sample = true;
  context.network = Network(20'000'000);

  EXPECT_EQ(scorer.Propose(context, 0).rung, 3u);

  context.has_device_sample = true;
  context.device.cpu_usage = 0.95;
  ScoredCandidate cpu = scorer.Propose(context, 0);
  EXPECT_EQ(cpu.rung, 1u);
  EXPECT_EQ(cpu.reason, "device-cpu");

  context.device.cpu_usage = 0.1;
  context.preferences.priority = QualityPriority::kData;
  EXPECT_EQ(scorer.Propose(context, 0).reason, "data-saver");

  context.preferences.priority = QualityPriority::kBalanced;
  context.network = Network(20'000'000, 0.2);
  ScoredCandidate loss = scorer.Propose(context, 0);
  EXPECT_EQ(loss.rung, 1u);
  ASSERT_FALSE(loss.fired_rules.empty());
  EXPECT_EQ(loss.fired_rules.front(), kRulePacketLoss);

  // Cooldown suppresses the same rule.
  context.rule_last_fired[kRulePacketLoss] = 0;
  EXPECT_EQ(scorer.Propose(context, 1'000).rung, 3u);
}

}  // namespace
