// Repository: streamcore
// Component: CoreConfig Contract Tests
// Purpose: YAML loading, defaults and validation of the aggregated tuning.
// Copyright (c) 2025 StreamCore

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "streamcore/runtime/CoreConfig.hpp"

using namespace streamcore;
using namespace streamcore::runtime;
using namespace streamcore::tests;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Runtime", {"RT-008", "RT-009"});
  return true;
}();

class CoreConfigContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Runtime"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"RT-008", "RT-009"};
  }
};

// Rule: RT-008 An empty document yields the built-in defaults.
TEST_F(CoreConfigContractTest, RT_008_EmptyDocumentIsDefaults) {
  const CoreConfig config = CoreConfig::FromYaml("");
  EXPECT_EQ(config.buffer.capacity_strategy, buffer::CapacityStrategy::kAdaptive);
  EXPECT_DOUBLE_EQ(config.buffer.watermark_fractions.low, 0.25);
  EXPECT_DOUBLE_EQ(config.buffer.watermark_fractions.high, 0.75);
  EXPECT_DOUBLE_EQ(config.buffer.watermark_fractions.critical, 0.95);
  EXPECT_EQ(config.sync.sync_tolerance_ms, 20);
  EXPECT_DOUBLE_EQ(config.sync.correction_rate_limit, 0.05);
  EXPECT_EQ(config.adaptation.dwell_time_ms, 5'000);
  EXPECT_EQ(config.codec.ladder_rung_count, 4u);
  EXPECT_EQ(config.channels.capacity, 1024u);
  EXPECT_NO_THROW(CoreConfig{}.Validate());
}

// Rule: RT-008 Flat option names and grouped sections both load.
TEST_F(CoreConfigContractTest, RT_008_FlatAndGroupedKeys) {
  const CoreConfig flat = CoreConfig::FromYaml(
      "capacity_strategy: predictive\n"
      "watermark_fractions: {low: 0.2, high: 0.6, critical: 0.9}\n"
      "sync_tolerance_ms: 30\n"
      "correction_rate_limit: 0.1\n"
      "dwell_time_ms: 3000\n"
      "ladder_rung_count: 5\n"
      "unknown_option: ignored\n");
  EXPECT_EQ(flat.buffer.capacity_strategy, buffer::CapacityStrategy::kPredictive);
  EXPECT_DOUBLE_EQ(flat.buffer.watermark_fractions.low, 0.2);
  EXPECT_DOUBLE_EQ(flat.buffer.watermark_fractions.critical, 0.9);
  EXPECT_EQ(flat.sync.sync_tolerance_ms, 30);
  EXPECT_DOUBLE_EQ(flat.sync.correction_rate_limit, 0.1);
  EXPECT_EQ(flat.adaptation.dwell_time_ms, 3'000);
  EXPECT_EQ(flat.codec.ladder_rung_count, 5u);

  const CoreConfig grouped = CoreConfig::FromYaml(
      "buffer:\n"
      "  base_capacity_chunks: 32\n"
      "  capacity_strategy: fixed\n"
      "  eviction_weights: {priority: 0.5}\n"
      "sync:\n"
      "  correction_window_ms: 800\n"
      "  reconcile_interval_ms: 100\n"
      "adaptation:\n"
      "  hysteresis_rungs: 2\n"
      "  degrade_step: 1\n"
      "channels:\n"
      "  capacity: 16\n");
  EXPECT_EQ(grouped.buffer.base_capacity_chunks, 32u);
  EXPECT_EQ(grouped.buffer.capacity_strategy, buffer::CapacityStrategy::kFixed);
  EXPECT_DOUBLE_EQ(grouped.buffer.eviction_weights.priority_weight, 0.5);
  EXPECT_DOUBLE_EQ(grouped.buffer.eviction_weights.age_weight, 1.0);
  EXPECT_EQ(grouped.sync.correction_window_ms, 800);
  EXPECT_EQ(grouped.sync.reconcile_interval_ms, 100);
  EXPECT_EQ(grouped.adaptation.hysteresis_rungs, 2u);
  EXPECT_EQ(grouped.adaptation.rules.degrade_step, 1u);
  EXPECT_EQ(grouped.channels.capacity, 16u);
}

// Rule: RT-008 Configuration files load through the same path.
TEST_F(CoreConfigContractTest, RT_008_LoadsFromFile) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "streamcore_core_config_test.yaml";
  {
    std::ofstream out(path);
    out << "sync_tolerance_ms: 40\nchannels:\n  capacity: 8\n";
  }
  const CoreConfig config = CoreConfig::FromYamlFile(path.string());
  EXPECT_EQ(config.sync.sync_tolerance_ms, 40);
  EXPECT_EQ(config.channels.capacity, 8u);
  std::filesystem::remove(path);

  EXPECT_THROW(CoreConfig::FromYamlFile(path.string()), std::invalid_argument);
}

// Rule: RT-009 Malformed or inconsistent values are rejected with std::invalid_argument.
TEST_F(CoreConfigContractTest, RT_009_MalformedInputThrows) {
  EXPECT_THROW(CoreConfig::FromYaml("sync_tolerance_ms: fast\n"), std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml("capacity_strategy: turbo\n"), std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml("watermark_fractions: 3\n"), std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml("- a\n- b\n"), std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml("key: [unclosed\n"), std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml("ladder_rung_count: 9\n"), std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml("buffer:\n  base_capacity_chunks: -4\n"),
               std::invalid_argument);
  EXPECT_THROW(CoreConfig::FromYaml(
                   "watermark_fractions: {low: 0.8, high: 0.6, critical: 0.9}\n"),
               std::invalid_argument);
}

// Rule: RT-009 Validate checks cross-field consistency.
TEST_F(CoreConfigContractTest, RT_009_ValidateCrossFieldRules) {
  CoreConfig window;
  window.sync.correction_window_ms = window.sync.sync_tolerance_ms;
  EXPECT_THROW(window.Validate(), std::invalid_argument);

  CoreConfig margin;
  margin.adaptation.rules.bandwidth_safety_margin = 1.5;
  EXPECT_THROW(margin.Validate(), std::invalid_argument);

  CoreConfig channels;
  channels.channels.capacity = 0;
  EXPECT_THROW(channels.Validate(), std::invalid_argument);

  CoreConfig small;
  small.buffer.base_capacity_chunks = 2;
  EXPECT_THROW(small.Validate(), std::invalid_argument);
}

}  // namespace
