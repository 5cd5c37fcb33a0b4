// File: src/platform/memory_pressure_sampler.cpp
#include "platform/memory_pressure_sampler.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lrec {

namespace {

constexpr uint64_t kBytesPerKiB = 1024;
constexpr uint64_t kBytesPerMiB = 1024 * 1024;

} // namespace

bool MemoryPressureSampler::Thresholds::IsValid() const {
    if (critical_available_ratio < 0.0 || critical_available_ratio > 1.0) return false;
    if (warning_available_ratio < 0.0 || warning_available_ratio > 1.0) return false;

    // Warning band must contain the critical band
    return warning_available_mib >= critical_available_mib &&
           warning_available_ratio >= critical_available_ratio;
}

MemoryPressureSampler::MemoryPressureSampler()
    : thresholds_(Thresholds{}), meminfo_path_("/proc/meminfo") {
}

MemoryPressureSampler::MemoryPressureSampler(const Thresholds& thresholds,
                                             std::string meminfo_path)
    : thresholds_(thresholds), meminfo_path_(std::move(meminfo_path)) {

    if (!thresholds_.IsValid()) {
        throw std::invalid_argument("Invalid MemoryPressureSampler thresholds");
    }
}

MemoryPressureLevel MemoryPressureSampler::Sample() const {
    auto snapshot = ReadSnapshot();
    if (!snapshot) {
        return MemoryPressureLevel::UNKNOWN;
    }
    return Classify(*snapshot, thresholds_);
}

std::optional<MemorySnapshot> MemoryPressureSampler::ReadSnapshot() const {
    std::ifstream file(meminfo_path_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseMeminfo(buffer.str());
}

MemoryPressureLevel MemoryPressureSampler::Classify(const MemorySnapshot& snapshot,
                                                    const Thresholds& thresholds) {
    if (snapshot.total_bytes == 0) {
        return MemoryPressureLevel::UNKNOWN;
    }

    uint64_t available = snapshot.available_bytes;
    double ratio = static_cast<double>(available) / static_cast<double>(snapshot.total_bytes);

    if (available <= thresholds.critical_available_mib * kBytesPerMiB ||
        ratio <= thresholds.critical_available_ratio) {
        return MemoryPressureLevel::CRITICAL;
    }
    if (available <= thresholds.warning_available_mib * kBytesPerMiB ||
        ratio <= thresholds.warning_available_ratio) {
        return MemoryPressureLevel::WARNING;
    }
    return MemoryPressureLevel::NORMAL;
}

std::optional<MemorySnapshot> MemoryPressureSampler::ParseMeminfo(const std::string& text) {
    std::istringstream lines(text);
    std::string line;

    std::optional<uint64_t> total_kib;
    std::optional<uint64_t> available_kib;

    // Lines look like "MemAvailable:   12345678 kB"
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t value = 0;
        if (!(fields >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") {
            total_kib = value;
        } else if (key == "MemAvailable:") {
            available_kib = value;
        }
    }

    if (!total_kib || !available_kib) {
        return std::nullopt;
    }

    MemorySnapshot snapshot;
    snapshot.total_bytes = *total_kib * kBytesPerKiB;
    snapshot.available_bytes = *available_kib * kBytesPerKiB;
    return snapshot;
}

} // namespace lrec
