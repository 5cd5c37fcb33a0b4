// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the LREC CLI
// Allows loading engine and simulator settings from YAML configuration files

#ifndef LREC_CLI_CONFIG_HPP
#define LREC_CLI_CONFIG_HPP

#include "engine/lifecycle_engine.hpp"
#include "platform/memory_pressure_sampler.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace lrec {

/// Configuration structure for the LREC CLI
struct CliConfig {
    // === Interface Settings ===
    struct Interface {
        std::string prompt = "lrec> ";
        bool colors_enabled = true;
        bool verbose = false;
        std::string snapshot_file = "lrec_snapshot.db";
    } interface;

    // === Tier Capacity ===
    struct Capacity {
        size_t active_capacity = 4;
        size_t warm_capacity = 12;
    } capacity;

    // === Creation Backpressure ===
    struct Backpressure {
        uint64_t base_backoff_ms = 1000;
        uint64_t max_backoff_ms = 30000;
        uint32_t max_retry_count = 5;
    } backpressure;

    // === Reconciler ===
    struct ReconcilerSettings {
        uint64_t creation_timeout_ms = 8000;
        float warning_trim_fraction = 0.10f;
        float critical_trim_fraction = 0.50f;
    } reconciler;

    // === Memory Pressure Sampler ===
    struct MemorySampler {
        uint64_t critical_available_mib = 512;
        double critical_available_ratio = 0.08;
        uint64_t warning_available_mib = 1024;
        double warning_available_ratio = 0.15;
    } memory_sampler;

    // === Simulated Backend ===
    struct Simulator {
        size_t create_latency_frames = 1;
        size_t destroy_latency_frames = 1;
        uint64_t frame_interval_ms = 100;   // Simulated time per frame
    } simulator;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Engine configuration described by this file
    LifecycleEngine::Config ToEngineConfig() const;

    /// Sampler thresholds described by this file
    MemoryPressureSampler::Thresholds ToSamplerThresholds() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace lrec

#endif // LREC_CLI_CONFIG_HPP
