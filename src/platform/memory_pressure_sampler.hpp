// File: src/platform/memory_pressure_sampler.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace lrec {

/// Host memory figures in bytes
struct MemorySnapshot {
    uint64_t total_bytes{0};
    uint64_t available_bytes{0};
};

/// Classifies host memory into MemoryPressureLevel
///
/// The host feeds the result into the intent stream as a
/// MemoryPressureSignal; the engine never samples on its own.
class MemoryPressureSampler {
public:
    struct Thresholds {
        uint64_t critical_available_mib{512};
        double critical_available_ratio{0.08};
        uint64_t warning_available_mib{1024};
        double warning_available_ratio{0.15};

        bool IsValid() const;
    };

    MemoryPressureSampler();

    explicit MemoryPressureSampler(const Thresholds& thresholds,
                                   std::string meminfo_path = "/proc/meminfo");

    /// Read the meminfo file and classify it
    ///
    /// @return UNKNOWN if the file is unreadable or reports no total
    MemoryPressureLevel Sample() const;

    /// Current figures from the meminfo file
    std::optional<MemorySnapshot> ReadSnapshot() const;

    /// Pure classification of a snapshot
    static MemoryPressureLevel Classify(const MemorySnapshot& snapshot,
                                        const Thresholds& thresholds);

    /// Parse MemTotal and MemAvailable out of /proc/meminfo text
    static std::optional<MemorySnapshot> ParseMeminfo(const std::string& text);

    const Thresholds& GetThresholds() const { return thresholds_; }

private:
    Thresholds thresholds_;
    std::string meminfo_path_;
};

} // namespace lrec
