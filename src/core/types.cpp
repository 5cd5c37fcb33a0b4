// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace lrec {

namespace {

std::string ToUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

// NodeID / ResourceHandle

std::string NodeID::ToString() const {
    if (!IsValid()) {
        return "NodeID(INVALID)";
    }
    std::ostringstream oss;
    oss << "NodeID(" << value_ << ")";
    return oss.str();
}

std::string ResourceHandle::ToString() const {
    if (!IsValid()) {
        return "ResourceHandle(INVALID)";
    }
    std::ostringstream oss;
    oss << "ResourceHandle(" << std::hex << std::setw(8) << std::setfill('0') << value_ << ")";
    return oss.str();
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{Duration(micros)};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

// Enum implementations

const char* ToString(LifecycleTier tier) {
    switch (tier) {
        case LifecycleTier::ACTIVE: return "ACTIVE";
        case LifecycleTier::WARM: return "WARM";
        case LifecycleTier::COLD: return "COLD";
        default: return "UNKNOWN";
    }
}

std::optional<LifecycleTier> ParseLifecycleTier(const std::string& str) {
    std::string upper = ToUpper(str);
    if (upper == "ACTIVE") return LifecycleTier::ACTIVE;
    if (upper == "WARM") return LifecycleTier::WARM;
    if (upper == "COLD") return LifecycleTier::COLD;
    return std::nullopt;
}

const char* ToString(TransitionCause cause) {
    switch (cause) {
        case TransitionCause::USER_FOCUS: return "USER_FOCUS";
        case TransitionCause::TILE_VISIBLE: return "TILE_VISIBLE";
        case TransitionCause::SELECTED_PREWARM: return "SELECTED_PREWARM";
        case TransitionCause::WORKSPACE_RETENTION: return "WORKSPACE_RETENTION";
        case TransitionCause::ACTIVE_CAPACITY_OVERFLOW: return "ACTIVE_CAPACITY_OVERFLOW";
        case TransitionCause::WARM_CAPACITY_OVERFLOW: return "WARM_CAPACITY_OVERFLOW";
        case TransitionCause::MEMORY_PRESSURE_WARNING: return "MEMORY_PRESSURE_WARNING";
        case TransitionCause::MEMORY_PRESSURE_CRITICAL: return "MEMORY_PRESSURE_CRITICAL";
        case TransitionCause::RESOURCE_CRASH: return "RESOURCE_CRASH";
        case TransitionCause::EXPLICIT_CLOSE: return "EXPLICIT_CLOSE";
        case TransitionCause::NODE_REMOVAL: return "NODE_REMOVAL";
        case TransitionCause::RESTORE: return "RESTORE";
        default: return "UNKNOWN";
    }
}

std::optional<TransitionCause> ParseTransitionCause(const std::string& str) {
    std::string upper = ToUpper(str);
    for (size_t i = 0; i < kTransitionCauseCount; ++i) {
        auto cause = static_cast<TransitionCause>(i);
        if (upper == ToString(cause)) {
            return cause;
        }
    }
    return std::nullopt;
}

LifecycleTier DefaultTierForCause(TransitionCause cause) {
    switch (cause) {
        case TransitionCause::USER_FOCUS:
        case TransitionCause::TILE_VISIBLE:
        case TransitionCause::SELECTED_PREWARM:
            return LifecycleTier::ACTIVE;
        default:
            return LifecycleTier::WARM;
    }
}

bool IsForcedDemotionCause(TransitionCause cause) {
    switch (cause) {
        case TransitionCause::ACTIVE_CAPACITY_OVERFLOW:
        case TransitionCause::WARM_CAPACITY_OVERFLOW:
        case TransitionCause::MEMORY_PRESSURE_WARNING:
        case TransitionCause::MEMORY_PRESSURE_CRITICAL:
            return true;
        default:
            return false;
    }
}

const char* ToString(MappingState state) {
    switch (state) {
        case MappingState::UNMAPPED: return "UNMAPPED";
        case MappingState::CREATE_PENDING: return "CREATE_PENDING";
        case MappingState::MAPPED: return "MAPPED";
        case MappingState::DESTROY_PENDING: return "DESTROY_PENDING";
        default: return "UNKNOWN";
    }
}

const char* ToString(MemoryPressureLevel level) {
    switch (level) {
        case MemoryPressureLevel::UNKNOWN: return "UNKNOWN";
        case MemoryPressureLevel::NORMAL: return "NORMAL";
        case MemoryPressureLevel::WARNING: return "WARNING";
        case MemoryPressureLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::optional<MemoryPressureLevel> ParseMemoryPressureLevel(const std::string& str) {
    std::string upper = ToUpper(str);
    if (upper == "UNKNOWN") return MemoryPressureLevel::UNKNOWN;
    if (upper == "NORMAL") return MemoryPressureLevel::NORMAL;
    if (upper == "WARNING") return MemoryPressureLevel::WARNING;
    if (upper == "CRITICAL") return MemoryPressureLevel::CRITICAL;
    return std::nullopt;
}

const char* ToString(CreationError error) {
    switch (error) {
        case CreationError::BACKEND_REJECTED: return "BACKEND_REJECTED";
        case CreationError::TIMEOUT: return "TIMEOUT";
        case CreationError::CRASHED: return "CRASHED";
        default: return "UNKNOWN";
    }
}

} // namespace lrec
