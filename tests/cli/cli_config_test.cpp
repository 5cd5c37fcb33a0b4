// File: tests/cli/cli_config_test.cpp
//
// Tests for YAML configuration system

#include "cli/cli_config.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>

using namespace lrec;

class CliConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/lrec_test_config.yaml";

    void TearDown() override {
        // Clean up temp file
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(CliConfigTest, DefaultConfig) {
    auto config = CliConfig::Default();

    EXPECT_EQ(config.interface.prompt, "lrec> ");
    EXPECT_TRUE(config.interface.colors_enabled);
    EXPECT_FALSE(config.interface.verbose);
    EXPECT_EQ(config.interface.snapshot_file, "lrec_snapshot.db");

    EXPECT_EQ(config.capacity.active_capacity, 4u);
    EXPECT_EQ(config.capacity.warm_capacity, 12u);

    EXPECT_EQ(config.backpressure.base_backoff_ms, 1000u);
    EXPECT_EQ(config.backpressure.max_backoff_ms, 30000u);
    EXPECT_EQ(config.backpressure.max_retry_count, 5u);

    EXPECT_EQ(config.reconciler.creation_timeout_ms, 8000u);
    EXPECT_FLOAT_EQ(config.reconciler.warning_trim_fraction, 0.10f);
    EXPECT_FLOAT_EQ(config.reconciler.critical_trim_fraction, 0.50f);

    EXPECT_EQ(config.simulator.frame_interval_ms, 100u);
    EXPECT_TRUE(config.Validate());
}

TEST_F(CliConfigTest, LoadFromString) {
    std::string yaml = R"(
interface:
  prompt: "test> "
  colors_enabled: false
  verbose: true
  snapshot_file: "test.db"

capacity:
  active_capacity: 2
  warm_capacity: 6

backpressure:
  base_backoff_ms: 500
  max_backoff_ms: 4000
  max_retry_count: 3

reconciler:
  creation_timeout_ms: 2000
  warning_trim_fraction: 0.25
  critical_trim_fraction: 0.75

simulator:
  create_latency_frames: 3
  destroy_latency_frames: 0
  frame_interval_ms: 16
)";

    auto config_opt = CliConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_EQ(config.interface.prompt, "test> ");
    EXPECT_FALSE(config.interface.colors_enabled);
    EXPECT_TRUE(config.interface.verbose);
    EXPECT_EQ(config.interface.snapshot_file, "test.db");

    EXPECT_EQ(config.capacity.active_capacity, 2u);
    EXPECT_EQ(config.capacity.warm_capacity, 6u);

    EXPECT_EQ(config.backpressure.base_backoff_ms, 500u);
    EXPECT_EQ(config.backpressure.max_backoff_ms, 4000u);
    EXPECT_EQ(config.backpressure.max_retry_count, 3u);

    EXPECT_EQ(config.reconciler.creation_timeout_ms, 2000u);
    EXPECT_FLOAT_EQ(config.reconciler.warning_trim_fraction, 0.25f);
    EXPECT_FLOAT_EQ(config.reconciler.critical_trim_fraction, 0.75f);

    EXPECT_EQ(config.simulator.create_latency_frames, 3u);
    EXPECT_EQ(config.simulator.destroy_latency_frames, 0u);
    EXPECT_EQ(config.simulator.frame_interval_ms, 16u);
}

TEST_F(CliConfigTest, PartialConfig) {
    std::string yaml = R"(
capacity:
  active_capacity: 8
)";

    auto config_opt = CliConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_EQ(config.capacity.active_capacity, 8u);

    // Other values should be defaults
    EXPECT_EQ(config.capacity.warm_capacity, 12u);
    EXPECT_EQ(config.interface.prompt, "lrec> ");
}

TEST_F(CliConfigTest, SaveAndLoad) {
    auto config = CliConfig::Default();
    config.interface.prompt = "custom> ";
    config.capacity.warm_capacity = 20;
    config.backpressure.max_retry_count = 7;
    config.memory_sampler.warning_available_mib = 2048;

    ASSERT_TRUE(config.SaveToFile(temp_config_path));
    ASSERT_TRUE(std::filesystem::exists(temp_config_path));

    auto loaded_opt = CliConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded_opt.has_value());

    auto loaded = loaded_opt.value();
    EXPECT_EQ(loaded.interface.prompt, "custom> ");
    EXPECT_EQ(loaded.capacity.warm_capacity, 20u);
    EXPECT_EQ(loaded.backpressure.max_retry_count, 7u);
    EXPECT_EQ(loaded.memory_sampler.warning_available_mib, 2048u);
}

TEST_F(CliConfigTest, ValidationBackoffOrder) {
    auto config = CliConfig::Default();
    config.backpressure.base_backoff_ms = 5000;
    config.backpressure.max_backoff_ms = 1000;

    EXPECT_FALSE(config.Validate());
    auto errors = config.GetValidationErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("max_backoff_ms"), std::string::npos);
}

TEST_F(CliConfigTest, ValidationZeroValues) {
    auto config = CliConfig::Default();
    config.backpressure.max_retry_count = 0;
    config.reconciler.creation_timeout_ms = 0;
    config.simulator.frame_interval_ms = 0;

    EXPECT_FALSE(config.Validate());
    EXPECT_EQ(config.GetValidationErrors().size(), 3u);
}

TEST_F(CliConfigTest, ValidationTrimFractions) {
    auto config = CliConfig::Default();
    config.reconciler.warning_trim_fraction = 0.6f;
    config.reconciler.critical_trim_fraction = 0.5f;
    EXPECT_FALSE(config.Validate());

    config.reconciler.warning_trim_fraction = -0.1f;
    EXPECT_FALSE(config.Validate());

    config.reconciler.warning_trim_fraction = 0.1f;
    config.reconciler.critical_trim_fraction = 1.5f;
    EXPECT_FALSE(config.Validate());
}

TEST_F(CliConfigTest, ValidationSamplerThresholds) {
    auto config = CliConfig::Default();
    config.memory_sampler.critical_available_mib = 4096;

    EXPECT_FALSE(config.Validate());
}

TEST_F(CliConfigTest, InvalidYAML) {
    std::string yaml = R"(
interface:
  prompt: "test
  invalid yaml here
)";

    auto config_opt = CliConfig::LoadFromString(yaml);
    EXPECT_FALSE(config_opt.has_value());
}

TEST_F(CliConfigTest, InvalidNumberRejected) {
    std::string yaml = R"(
capacity:
  active_capacity: lots
)";

    EXPECT_FALSE(CliConfig::LoadFromString(yaml).has_value());
}

TEST_F(CliConfigTest, ValidationFailsOnLoad) {
    std::string yaml = R"(
backpressure:
  base_backoff_ms: 0
)";

    EXPECT_FALSE(CliConfig::LoadFromString(yaml).has_value());
}

TEST_F(CliConfigTest, NonExistentFile) {
    auto config_opt = CliConfig::LoadFromFile("/nonexistent/path/config.yaml");
    EXPECT_FALSE(config_opt.has_value());
}

TEST_F(CliConfigTest, EmptyYAML) {
    auto config_opt = CliConfig::LoadFromString("");
    ASSERT_TRUE(config_opt.has_value());

    // Should use all defaults
    auto config = config_opt.value();
    EXPECT_EQ(config.interface.prompt, "lrec> ");
}

TEST_F(CliConfigTest, ToEngineConfig) {
    auto config = CliConfig::Default();
    config.capacity.active_capacity = 3;
    config.backpressure.base_backoff_ms = 250;
    config.reconciler.creation_timeout_ms = 1500;

    LifecycleEngine::Config engine_config = config.ToEngineConfig();

    EXPECT_TRUE(engine_config.IsValid());
    EXPECT_EQ(engine_config.store.capacity.active_capacity, 3u);
    EXPECT_EQ(engine_config.backpressure.base_backoff, std::chrono::milliseconds(250));
    EXPECT_EQ(engine_config.reconciler.creation_timeout, std::chrono::milliseconds(1500));
}

TEST_F(CliConfigTest, ToYamlString) {
    auto config = CliConfig::Default();
    std::string yaml = config.ToYamlString();

    EXPECT_NE(yaml.find("interface:"), std::string::npos);
    EXPECT_NE(yaml.find("capacity:"), std::string::npos);
    EXPECT_NE(yaml.find("backpressure:"), std::string::npos);
    EXPECT_NE(yaml.find("reconciler:"), std::string::npos);
    EXPECT_NE(yaml.find("memory_sampler:"), std::string::npos);
    EXPECT_NE(yaml.find("simulator:"), std::string::npos);
    EXPECT_NE(yaml.find("lrec> "), std::string::npos);
}
