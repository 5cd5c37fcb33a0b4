// File: tests/platform/memory_pressure_sampler_test.cpp
#include "platform/memory_pressure_sampler.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace lrec {
namespace {

constexpr uint64_t kMiB = 1024 * 1024;

MemorySnapshot SnapshotMiB(uint64_t total, uint64_t available) {
    return MemorySnapshot{total * kMiB, available * kMiB};
}

TEST(MemoryPressureSamplerTest, ParseMeminfo) {
    std::string text =
        "MemTotal:       16384000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    4096000 kB\n"
        "Buffers:          200000 kB\n";

    auto snapshot = MemoryPressureSampler::ParseMeminfo(text);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(16384000ull * 1024, snapshot->total_bytes);
    EXPECT_EQ(4096000ull * 1024, snapshot->available_bytes);
}

TEST(MemoryPressureSamplerTest, ParseMeminfoRequiresBothFields) {
    EXPECT_FALSE(MemoryPressureSampler::ParseMeminfo("MemTotal: 100 kB\n").has_value());
    EXPECT_FALSE(MemoryPressureSampler::ParseMeminfo("").has_value());
}

TEST(MemoryPressureSamplerTest, ClassifyByAbsoluteAvailable) {
    MemoryPressureSampler::Thresholds thresholds;
    thresholds.critical_available_mib = 512;
    thresholds.critical_available_ratio = 0.0;
    thresholds.warning_available_mib = 1024;
    thresholds.warning_available_ratio = 0.0;

    EXPECT_EQ(MemoryPressureLevel::CRITICAL,
              MemoryPressureSampler::Classify(SnapshotMiB(16384, 256), thresholds));
    EXPECT_EQ(MemoryPressureLevel::WARNING,
              MemoryPressureSampler::Classify(SnapshotMiB(16384, 800), thresholds));
    EXPECT_EQ(MemoryPressureLevel::NORMAL,
              MemoryPressureSampler::Classify(SnapshotMiB(16384, 2048), thresholds));
}

TEST(MemoryPressureSamplerTest, ClassifyByRatio) {
    MemoryPressureSampler::Thresholds thresholds;
    thresholds.critical_available_mib = 0;
    thresholds.critical_available_ratio = 0.10;
    thresholds.warning_available_mib = 0;
    thresholds.warning_available_ratio = 0.20;

    EXPECT_EQ(MemoryPressureLevel::CRITICAL,
              MemoryPressureSampler::Classify(SnapshotMiB(1000, 50), thresholds));
    EXPECT_EQ(MemoryPressureLevel::WARNING,
              MemoryPressureSampler::Classify(SnapshotMiB(1000, 150), thresholds));
    EXPECT_EQ(MemoryPressureLevel::NORMAL,
              MemoryPressureSampler::Classify(SnapshotMiB(1000, 500), thresholds));
}

TEST(MemoryPressureSamplerTest, ZeroTotalIsUnknown) {
    EXPECT_EQ(MemoryPressureLevel::UNKNOWN,
              MemoryPressureSampler::Classify(MemorySnapshot{}, MemoryPressureSampler::Thresholds{}));
}

TEST(MemoryPressureSamplerTest, InvalidThresholdsThrow) {
    MemoryPressureSampler::Thresholds thresholds;
    thresholds.warning_available_mib = 100;
    thresholds.critical_available_mib = 200;
    EXPECT_FALSE(thresholds.IsValid());
    EXPECT_THROW(MemoryPressureSampler{thresholds}, std::invalid_argument);

    thresholds = MemoryPressureSampler::Thresholds{};
    thresholds.warning_available_ratio = 1.5;
    EXPECT_FALSE(thresholds.IsValid());
}

TEST(MemoryPressureSamplerTest, SampleReadsFile) {
    std::string path = "/tmp/lrec_test_meminfo";
    {
        std::ofstream file(path);
        file << "MemTotal:  8388608 kB\n"
             << "MemAvailable:  262144 kB\n";
    }

    MemoryPressureSampler sampler(MemoryPressureSampler::Thresholds{}, path);
    auto snapshot = sampler.ReadSnapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(256u * kMiB, snapshot->available_bytes);
    EXPECT_EQ(MemoryPressureLevel::CRITICAL, sampler.Sample());

    std::filesystem::remove(path);
}

TEST(MemoryPressureSamplerTest, MissingFileIsUnknown) {
    MemoryPressureSampler sampler(MemoryPressureSampler::Thresholds{}, "/nonexistent/lrec_meminfo");
    EXPECT_FALSE(sampler.ReadSnapshot().has_value());
    EXPECT_EQ(MemoryPressureLevel::UNKNOWN, sampler.Sample());
}

} // namespace
} // namespace lrec
