// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <optional>

namespace lrec {

// NodeID: Stable identifier of a graph node
// Owned by the graph store; the engine only references it
class NodeID {
public:
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    NodeID() : value_(kInvalidID) {}

    explicit NodeID(ValueType value) : value_(value) {}

    bool IsValid() const { return value_ != kInvalidID; }

    ValueType value() const { return value_; }

    bool operator==(const NodeID& other) const { return value_ == other.value_; }
    bool operator!=(const NodeID& other) const { return value_ != other.value_; }
    bool operator<(const NodeID& other) const { return value_ < other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    struct Hash {
        size_t operator()(const NodeID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;

    ValueType value_;
};

// ResourceHandle: Opaque identifier of a live rendering resource
// Issued by the resource backend, never dereferenced by the engine
class ResourceHandle {
public:
    using ValueType = uint64_t;

    ResourceHandle() : value_(kInvalidHandle) {}

    explicit ResourceHandle(ValueType value) : value_(value) {}

    bool IsValid() const { return value_ != kInvalidHandle; }

    ValueType value() const { return value_; }

    bool operator==(const ResourceHandle& other) const { return value_ == other.value_; }
    bool operator!=(const ResourceHandle& other) const { return value_ != other.value_; }
    bool operator<(const ResourceHandle& other) const { return value_ < other.value_; }

    std::string ToString() const;

    struct Hash {
        size_t operator()(const ResourceHandle& handle) const {
            return std::hash<ValueType>()(handle.value_);
        }
    };

private:
    static constexpr ValueType kInvalidHandle = 0;

    ValueType value_;
};

// Timestamp: Microsecond-precision time point
class Timestamp {
public:
    using ClockType = std::chrono::steady_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since clock epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    int64_t ToMicros() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    Timestamp operator+(Duration offset) const {
        return Timestamp(time_point_ + offset);
    }

    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// LifecycleTier: Declared liveness of a node's resource
// Liveness cost: ACTIVE > WARM > COLD
enum class LifecycleTier : uint8_t {
    ACTIVE = 0,   // Resource live and in use
    WARM = 1,     // Resource kept alive in cache
    COLD = 2,     // No resource
};

const char* ToString(LifecycleTier tier);

// Parse LifecycleTier from string (case-insensitive)
std::optional<LifecycleTier> ParseLifecycleTier(const std::string& str);

// True if `a` costs more liveness than `b`
inline bool IsLivelier(LifecycleTier a, LifecycleTier b) {
    return static_cast<uint8_t>(a) < static_cast<uint8_t>(b);
}

// TransitionCause: Why a node's desired tier changed
enum class TransitionCause : uint8_t {
    USER_FOCUS = 0,
    TILE_VISIBLE = 1,
    SELECTED_PREWARM = 2,
    WORKSPACE_RETENTION = 3,
    ACTIVE_CAPACITY_OVERFLOW = 4,
    WARM_CAPACITY_OVERFLOW = 5,
    MEMORY_PRESSURE_WARNING = 6,
    MEMORY_PRESSURE_CRITICAL = 7,
    RESOURCE_CRASH = 8,
    EXPLICIT_CLOSE = 9,
    NODE_REMOVAL = 10,
    RESTORE = 11,
};

inline constexpr size_t kTransitionCauseCount = 12;

const char* ToString(TransitionCause cause);

std::optional<TransitionCause> ParseTransitionCause(const std::string& str);

// Tier a node is created in when no tier is given explicitly
LifecycleTier DefaultTierForCause(TransitionCause cause);

// True for demotions the engine forces on its own
bool IsForcedDemotionCause(TransitionCause cause);

// MappingState: Observed runtime state of a node's resource
enum class MappingState : uint8_t {
    UNMAPPED = 0,
    CREATE_PENDING = 1,
    MAPPED = 2,
    DESTROY_PENDING = 3,
};

const char* ToString(MappingState state);

// MemoryPressureLevel: Host memory pressure severity
enum class MemoryPressureLevel : uint8_t {
    UNKNOWN = 0,
    NORMAL = 1,
    WARNING = 2,
    CRITICAL = 3,
};

const char* ToString(MemoryPressureLevel level);

std::optional<MemoryPressureLevel> ParseMemoryPressureLevel(const std::string& str);

// CreationError: Backend-reported resource creation failure
enum class CreationError : uint8_t {
    BACKEND_REJECTED = 0,   // Backend refused or failed to build the resource
    TIMEOUT = 1,            // No outcome within the creation timeout
    CRASHED = 2,            // Resource was created and later crashed
};

const char* ToString(CreationError error);

} // namespace lrec

namespace std {
    template<>
    struct hash<lrec::NodeID> {
        size_t operator()(const lrec::NodeID& id) const {
            return lrec::NodeID::Hash()(id);
        }
    };

    template<>
    struct hash<lrec::ResourceHandle> {
        size_t operator()(const lrec::ResourceHandle& handle) const {
            return lrec::ResourceHandle::Hash()(handle);
        }
    };
}
