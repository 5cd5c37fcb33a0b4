// File: src/cli/cli_config.cpp
//
// YAML Configuration Implementation for the LREC CLI

#include "cli/cli_config.hpp"
#include <yaml.h>
#include <chrono>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace lrec {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Apply one key/value pair; throws std::invalid_argument/out_of_range on bad numbers
static void ApplySetting(CliConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
    if (section == "interface") {
        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.interface.verbose = ParseBool(value);
        else if (key == "snapshot_file") config.interface.snapshot_file = value;
    }
    else if (section == "capacity") {
        if (key == "active_capacity") config.capacity.active_capacity = std::stoul(value);
        else if (key == "warm_capacity") config.capacity.warm_capacity = std::stoul(value);
    }
    else if (section == "backpressure") {
        if (key == "base_backoff_ms") config.backpressure.base_backoff_ms = std::stoull(value);
        else if (key == "max_backoff_ms") config.backpressure.max_backoff_ms = std::stoull(value);
        else if (key == "max_retry_count") config.backpressure.max_retry_count = static_cast<uint32_t>(std::stoul(value));
    }
    else if (section == "reconciler") {
        if (key == "creation_timeout_ms") config.reconciler.creation_timeout_ms = std::stoull(value);
        else if (key == "warning_trim_fraction") config.reconciler.warning_trim_fraction = std::stof(value);
        else if (key == "critical_trim_fraction") config.reconciler.critical_trim_fraction = std::stof(value);
    }
    else if (section == "memory_sampler") {
        if (key == "critical_available_mib") config.memory_sampler.critical_available_mib = std::stoull(value);
        else if (key == "critical_available_ratio") config.memory_sampler.critical_available_ratio = std::stod(value);
        else if (key == "warning_available_mib") config.memory_sampler.warning_available_mib = std::stoull(value);
        else if (key == "warning_available_ratio") config.memory_sampler.warning_available_ratio = std::stod(value);
    }
    else if (section == "simulator") {
        if (key == "create_latency_frames") config.simulator.create_latency_frames = std::stoul(value);
        else if (key == "destroy_latency_frames") config.simulator.destroy_latency_frames = std::stoul(value);
        else if (key == "frame_interval_ms") config.simulator.frame_interval_ms = std::stoull(value);
    }
}

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CliConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " (line " << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::exception&) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": " << value << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# LREC CLI Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "interface:\n";
    ss << "  prompt: \"" << interface.prompt << "\"\n";
    ss << "  colors_enabled: " << (interface.colors_enabled ? "true" : "false") << "\n";
    ss << "  verbose: " << (interface.verbose ? "true" : "false") << "\n";
    ss << "  snapshot_file: \"" << interface.snapshot_file << "\"\n\n";

    ss << "capacity:\n";
    ss << "  active_capacity: " << capacity.active_capacity << "\n";
    ss << "  warm_capacity: " << capacity.warm_capacity << "\n\n";

    ss << "backpressure:\n";
    ss << "  base_backoff_ms: " << backpressure.base_backoff_ms << "\n";
    ss << "  max_backoff_ms: " << backpressure.max_backoff_ms << "\n";
    ss << "  max_retry_count: " << backpressure.max_retry_count << "\n\n";

    ss << "reconciler:\n";
    ss << "  creation_timeout_ms: " << reconciler.creation_timeout_ms << "\n";
    ss << "  warning_trim_fraction: " << reconciler.warning_trim_fraction << "\n";
    ss << "  critical_trim_fraction: " << reconciler.critical_trim_fraction << "\n\n";

    ss << "memory_sampler:\n";
    ss << "  critical_available_mib: " << memory_sampler.critical_available_mib << "\n";
    ss << "  critical_available_ratio: " << memory_sampler.critical_available_ratio << "\n";
    ss << "  warning_available_mib: " << memory_sampler.warning_available_mib << "\n";
    ss << "  warning_available_ratio: " << memory_sampler.warning_available_ratio << "\n\n";

    ss << "simulator:\n";
    ss << "  create_latency_frames: " << simulator.create_latency_frames << "\n";
    ss << "  destroy_latency_frames: " << simulator.destroy_latency_frames << "\n";
    ss << "  frame_interval_ms: " << simulator.frame_interval_ms << "\n";

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate capacities
    if (capacity.active_capacity > CapacityPolicy::kMaxTierCapacity ||
        capacity.warm_capacity > CapacityPolicy::kMaxTierCapacity) {
        errors.push_back("tier capacities must not exceed " +
                         std::to_string(CapacityPolicy::kMaxTierCapacity));
    }

    // Validate backoff
    if (backpressure.base_backoff_ms == 0) {
        errors.push_back("base_backoff_ms must be greater than 0");
    }
    if (backpressure.max_backoff_ms < backpressure.base_backoff_ms) {
        errors.push_back("max_backoff_ms must be >= base_backoff_ms");
    }
    if (backpressure.max_retry_count == 0) {
        errors.push_back("max_retry_count must be greater than 0");
    }

    // Validate reconciler
    if (reconciler.creation_timeout_ms == 0) {
        errors.push_back("creation_timeout_ms must be greater than 0");
    }
    if (reconciler.warning_trim_fraction < 0.0f || reconciler.warning_trim_fraction > 1.0f) {
        errors.push_back("warning_trim_fraction must be between 0.0 and 1.0");
    }
    if (reconciler.critical_trim_fraction < 0.0f || reconciler.critical_trim_fraction > 1.0f) {
        errors.push_back("critical_trim_fraction must be between 0.0 and 1.0");
    }
    if (reconciler.critical_trim_fraction < reconciler.warning_trim_fraction) {
        errors.push_back("critical_trim_fraction must be >= warning_trim_fraction");
    }

    // Validate sampler thresholds
    if (!ToSamplerThresholds().IsValid()) {
        errors.push_back("memory_sampler ratios must be between 0.0 and 1.0 and warning thresholds must be >= critical thresholds");
    }

    // Validate simulator
    if (simulator.frame_interval_ms == 0) {
        errors.push_back("frame_interval_ms must be greater than 0");
    }

    return errors;
}

LifecycleEngine::Config CliConfig::ToEngineConfig() const {
    LifecycleEngine::Config config;

    config.store.capacity.active_capacity = capacity.active_capacity;
    config.store.capacity.warm_capacity = capacity.warm_capacity;

    config.backpressure.base_backoff = std::chrono::milliseconds(backpressure.base_backoff_ms);
    config.backpressure.max_backoff = std::chrono::milliseconds(backpressure.max_backoff_ms);
    config.backpressure.max_retry_count = backpressure.max_retry_count;

    config.reconciler.creation_timeout = std::chrono::milliseconds(reconciler.creation_timeout_ms);
    config.reconciler.warning_trim_fraction = reconciler.warning_trim_fraction;
    config.reconciler.critical_trim_fraction = reconciler.critical_trim_fraction;

    return config;
}

MemoryPressureSampler::Thresholds CliConfig::ToSamplerThresholds() const {
    MemoryPressureSampler::Thresholds thresholds;
    thresholds.critical_available_mib = memory_sampler.critical_available_mib;
    thresholds.critical_available_ratio = memory_sampler.critical_available_ratio;
    thresholds.warning_available_mib = memory_sampler.warning_available_mib;
    thresholds.warning_available_ratio = memory_sampler.warning_available_ratio;
    return thresholds;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace lrec
