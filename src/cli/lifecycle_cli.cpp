// File: src/cli/lifecycle_cli.cpp
//
// Interactive simulator for the lifecycle engine
//
// Features:
// - Node lifecycle intents (add, tier, remove, retry)
// - Host controls (pin, memory pressure, /proc/meminfo sampling)
// - Backend fault injection (creation failures, crashes)
// - Frame stepping with per-frame diagnostics
// - SQLite snapshots of the desired lifecycle

#include "cli/lifecycle_cli.hpp"
#include "storage/lifecycle_snapshot_store.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <stdexcept>

namespace lrec {

namespace {

SimulatedBackend::Config BackendConfig(const CliConfig& config) {
    SimulatedBackend::Config backend_config;
    backend_config.create_latency_frames = config.simulator.create_latency_frames;
    backend_config.destroy_latency_frames = config.simulator.destroy_latency_frames;
    return backend_config;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

LifecycleCli::LifecycleCli()
    : LifecycleCli(CliConfig::Default()) {
}

LifecycleCli::LifecycleCli(const CliConfig& config)
    : config_(config),
      backend_(BackendConfig(config)),
      engine_(std::make_unique<LifecycleEngine>(backend_, config.ToEngineConfig())),
      sampler_(config.ToSamplerThresholds()),
      verbose_(config.interface.verbose),
      colors_enabled_(config.interface.colors_enabled),
      prompt_(config.interface.prompt),
      snapshot_file_(config.interface.snapshot_file),
      clock_(Timestamp::Now()) {

    AttachEngine();
}

void LifecycleCli::AttachEngine() {
    backend_.SetOutcomeQueue(&engine_->GetOutcomeQueue());
    engine_->SetDiagnosticsListener([this](const FollowUpIntent& report) {
        diagnostics_log_.push_back(report);
        std::cout << C(report.terminal ? Color::BOLD_RED : Color::YELLOW)
                  << "  [diag] " << report.ToString() << C(Color::RESET) << "\n";
    });
}

// ============================================================================
// Main Loop
// ============================================================================

void LifecycleCli::Run() {
    PrintWelcome();

    std::string line;
    while (running_) {
        std::cout << C(Color::BOLD_CYAN) << prompt_ << C(Color::RESET);
        std::getline(std::cin, line);

        if (std::cin.eof()) {
            break;
        }

        ProcessCommand(line);
    }

    std::cout << "\nFrames run: " << engine_->FrameCount()
              << ", creates: " << backend_.TotalCreates()
              << ", destroys: " << backend_.TotalDestroys() << "\n";
}

void LifecycleCli::PrintWelcome() {
    std::cout << C(Color::BOLD) << "LREC lifecycle simulator" << C(Color::RESET) << "\n"
              << "Active capacity " << config_.capacity.active_capacity
              << ", warm capacity " << config_.capacity.warm_capacity
              << ", " << config_.simulator.frame_interval_ms << " ms per frame\n"
              << "Type 'help' for available commands.\n\n";
}

void LifecycleCli::ProcessCommand(const std::string& input) {
    if (input.empty()) return;

    // Accept "/command" as well as "command"
    std::string line = input[0] == '/' ? input.substr(1) : input;

    std::istringstream iss(line);
    std::string command;
    iss >> command;
    if (command.empty()) return;

    ++commands_processed_;

    if (command == "help") {
        ShowHelp();
    } else if (command == "add") {
        AddNodeCommand(iss);
    } else if (command == "tier") {
        TierCommand(iss);
    } else if (command == "remove") {
        RemoveCommand(iss);
    } else if (command == "pin") {
        PinCommand(iss, true);
    } else if (command == "unpin") {
        PinCommand(iss, false);
    } else if (command == "pressure") {
        PressureCommand(iss);
    } else if (command == "sample") {
        SampleCommand();
    } else if (command == "fail") {
        FailCommand(iss);
    } else if (command == "crash") {
        CrashCommand(iss);
    } else if (command == "retry") {
        RetryCommand(iss);
    } else if (command == "frame") {
        FrameCommand(iss);
    } else if (command == "status") {
        ShowStatus(iss);
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "save") {
        SaveSnapshot(iss);
    } else if (command == "load") {
        LoadSnapshot(iss);
    } else if (command == "verbose") {
        verbose_ = !verbose_;
        std::cout << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
    } else if (command == "quit" || command == "exit") {
        running_ = false;
    } else {
        std::cout << "Unknown command: " << command << "\n";
        std::cout << "Type 'help' for available commands.\n";
    }
}

void LifecycleCli::ShowHelp() {
    std::cout << R"(
Available Commands:
===================

Intents (applied on the next frame):
  add <id> [tier] [cause]    Add a node (tier defaults from cause)
  tier <id> <tier> [cause]   Set desired tier (active|warm|cold)
  remove <id>                Remove a node
  retry <id>                 Clear backoff and terminal failure
  pressure <level>           Signal memory pressure (normal|warning|critical)
  sample                     Signal pressure sampled from /proc/meminfo

Host controls (immediate):
  pin <id>                   Exempt a node from forced demotion
  unpin <id>                 Remove the exemption

Backend faults:
  fail <id> [on|off]         Make creates for a node fail
  crash <id>                 Crash a node's live resource

Simulation:
  frame [n]                  Run n frames (default 1)
  status [id]                Show node tiers, mappings and status
  stats                      Show engine statistics
  verbose                    Toggle per-frame diagnostics

Snapshots:
  save [file]                Save desired lifecycle to SQLite
  load [file]                Restart the simulation from a snapshot

Utility:
  help                       Show this help
  quit, exit                 Exit the program

Causes: user_focus tile_visible selected_prewarm workspace_retention
        explicit_close restore

)";
}

// ============================================================================
// Intent Commands
// ============================================================================

void LifecycleCli::AddNodeCommand(std::istringstream& args) {
    auto id = ReadNodeID(args);
    if (!id) return;

    AddNode intent;
    intent.node_id = *id;

    std::string tier_text;
    std::string cause_text;
    args >> tier_text >> cause_text;

    if (!tier_text.empty()) {
        auto tier = ParseLifecycleTier(tier_text);
        if (!tier) {
            Error("Unknown tier: " + tier_text);
            return;
        }
        intent.tier = *tier;
    }
    if (!cause_text.empty()) {
        auto cause = ParseTransitionCause(cause_text);
        if (!cause) {
            Error("Unknown cause: " + cause_text);
            return;
        }
        intent.cause = *cause;
    }

    engine_->Submit(intent);
    if (verbose_) {
        std::cout << "Queued " << Describe(intent) << "\n";
    }
}

void LifecycleCli::TierCommand(std::istringstream& args) {
    auto id = ReadNodeID(args);
    if (!id) return;

    std::string tier_text;
    std::string cause_text;
    args >> tier_text >> cause_text;

    auto tier = ParseLifecycleTier(tier_text);
    if (!tier) {
        Error("Usage: tier <id> <active|warm|cold> [cause]");
        return;
    }

    SetDesiredTier intent;
    intent.node_id = *id;
    intent.tier = *tier;
    if (!cause_text.empty()) {
        auto cause = ParseTransitionCause(cause_text);
        if (!cause) {
            Error("Unknown cause: " + cause_text);
            return;
        }
        intent.cause = *cause;
    }

    engine_->Submit(intent);
    if (verbose_) {
        std::cout << "Queued " << Describe(intent) << "\n";
    }
}

void LifecycleCli::RemoveCommand(std::istringstream& args) {
    auto id = ReadNodeID(args);
    if (!id) return;
    engine_->Submit(RemoveNode{*id});
}

void LifecycleCli::RetryCommand(std::istringstream& args) {
    auto id = ReadNodeID(args);
    if (!id) return;
    engine_->Submit(RetryNode{*id});
}

void LifecycleCli::PressureCommand(std::istringstream& args) {
    std::string level_text;
    args >> level_text;

    auto level = ParseMemoryPressureLevel(level_text);
    if (!level) {
        Error("Usage: pressure <normal|warning|critical>");
        return;
    }
    engine_->Submit(MemoryPressureSignal{*level});
}

void LifecycleCli::SampleCommand() {
    auto snapshot = sampler_.ReadSnapshot();
    MemoryPressureLevel level = snapshot
        ? MemoryPressureSampler::Classify(*snapshot, sampler_.GetThresholds())
        : MemoryPressureLevel::UNKNOWN;

    if (snapshot) {
        std::cout << "Available " << snapshot->available_bytes / (1024 * 1024) << " MiB of "
                  << snapshot->total_bytes / (1024 * 1024) << " MiB: ";
    }
    std::cout << ToString(level) << "\n";

    engine_->Submit(MemoryPressureSignal{level});
}

// ============================================================================
// Host Controls and Faults
// ============================================================================

void LifecycleCli::PinCommand(std::istringstream& args, bool pinned) {
    auto id = ReadNodeID(args);
    if (!id) return;

    if (!engine_->SetPinned(*id, pinned, clock_)) {
        Error("Unknown node: " + id->ToString());
        return;
    }
    std::cout << (pinned ? "Pinned " : "Unpinned ") << id->ToString() << "\n";
}

void LifecycleCli::FailCommand(std::istringstream& args) {
    auto id = ReadNodeID(args);
    if (!id) return;

    std::string mode;
    args >> mode;
    bool failing = mode.empty() ? !backend_.IsFailing(*id) : (mode == "on");

    backend_.SetFailing(*id, failing);
    std::cout << "Creates for " << id->ToString() << (failing ? " will fail" : " will succeed") << "\n";
}

void LifecycleCli::CrashCommand(std::istringstream& args) {
    auto id = ReadNodeID(args);
    if (!id) return;

    if (!backend_.Crash(*id)) {
        Error(id->ToString() + " has no live resource");
        return;
    }
    std::cout << "Crashed resource of " << id->ToString() << "\n";
}

// ============================================================================
// Frames
// ============================================================================

void LifecycleCli::FrameCommand(std::istringstream& args) {
    size_t count = 1;
    std::string count_text;
    args >> count_text;

    if (!count_text.empty()) {
        try {
            count = std::stoul(count_text);
        } catch (const std::exception&) {
            Error("Usage: frame [n]");
            return;
        }
    }

    StepFrames(count);
}

void LifecycleCli::StepFrames(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        backend_.Tick();
        clock_ = clock_ + std::chrono::milliseconds(config_.simulator.frame_interval_ms);

        FrameReport report = engine_->RunFrame(clock_);
        PrintFrameReport(report);
    }
}

void LifecycleCli::PrintFrameReport(const FrameReport& report) {
    for (const auto& error : report.apply.errors) {
        std::cout << C(Color::RED) << "  " << error.ToString() << C(Color::RESET) << "\n";
    }

    if (verbose_ || report.diagnostics.creates_issued > 0 ||
        report.diagnostics.destroys_issued > 0 || report.diagnostics.TotalDemotions() > 0) {
        std::cout << C(Color::DIM) << "frame " << report.frame << ": "
                  << report.diagnostics.ToString() << C(Color::RESET) << "\n";
    }
}

// ============================================================================
// Information
// ============================================================================

void LifecycleCli::ShowStatus(std::istringstream& args) {
    std::string id_text;
    args >> id_text;

    if (!id_text.empty()) {
        std::istringstream single(id_text);
        auto id = ReadNodeID(single);
        if (!id) return;
        if (!engine_->GetStateStore().Contains(*id)) {
            Error("Unknown node: " + id->ToString());
            return;
        }
        PrintNodeLine(*id);
        return;
    }

    const LifecycleStateStore& store = engine_->GetStateStore();
    if (store.Size() == 0) {
        std::cout << "No nodes.\n";
        return;
    }

    std::cout << std::left << std::setw(10) << "node" << std::setw(8) << "tier"
              << std::setw(8) << "pinned" << std::setw(17) << "mapping"
              << std::setw(13) << "status" << "retries\n";

    for (NodeID id : store.IterActive()) PrintNodeLine(id);
    for (NodeID id : store.IterWarm()) PrintNodeLine(id);
    for (NodeID id : store.IterCold()) PrintNodeLine(id);
}

void LifecycleCli::PrintNodeLine(NodeID id) {
    const DesiredLifecycleRecord* record = engine_->GetStateStore().Find(id);
    auto status = engine_->GetNodeStatus(id, clock_);
    if (!record || !status) {
        return;
    }

    std::cout << std::left << std::setw(10) << id.value()
              << std::setw(8) << ToString(record->tier)
              << std::setw(8) << (record->pinned ? "yes" : "-")
              << std::setw(17) << ToString(engine_->GetHandleTable().GetState(id))
              << C(StatusColor(*status)) << std::setw(13) << ToString(*status) << C(Color::RESET)
              << engine_->GetBackpressure().GetRetryCount(id) << "\n";
}

void LifecycleCli::ShowStatistics() {
    const LifecycleStateStore& store = engine_->GetStateStore();
    const ResourceHandleTable& table = engine_->GetHandleTable();
    const BackpressureController& backpressure = engine_->GetBackpressure();

    std::cout << "\n" << C(Color::BOLD) << "Lifecycle Statistics" << C(Color::RESET) << "\n\n";

    std::cout << "Tiers:\n";
    std::cout << "  Active: " << store.ActiveSequence().Size()
              << " / " << config_.capacity.active_capacity << "\n";
    std::cout << "  Warm:   " << store.WarmSequence().Size()
              << " / " << config_.capacity.warm_capacity << "\n";
    std::cout << "  Cold:   " << store.IterCold().size() << "\n\n";

    std::cout << "Mappings:\n";
    std::cout << "  Mapped:          " << table.CountInState(MappingState::MAPPED) << "\n";
    std::cout << "  Create pending:  " << table.CountInState(MappingState::CREATE_PENDING) << "\n";
    std::cout << "  Destroy pending: " << table.CountInState(MappingState::DESTROY_PENDING) << "\n";
    std::cout << "  Orphans:         " << table.OrphanCount() << "\n\n";

    std::cout << "Backpressure:\n";
    std::cout << "  Blocked:  " << backpressure.BlockedCount() << "\n";
    std::cout << "  Terminal: " << backpressure.TerminalFailures().size() << "\n\n";

    std::cout << "Simulation:\n";
    std::cout << "  Frames:            " << engine_->FrameCount() << "\n";
    std::cout << "  Backend creates:   " << backend_.TotalCreates() << "\n";
    std::cout << "  Backend destroys:  " << backend_.TotalDestroys() << "\n";
    std::cout << "  Live resources:    " << backend_.LiveCount() << "\n";
    std::cout << "  Diagnostic reports: " << diagnostics_log_.size() << "\n";

    if (engine_->FrameCount() > 0) {
        std::cout << "  Last frame:        " << engine_->GetLastReport().diagnostics.ToString() << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// Snapshots
// ============================================================================

void LifecycleCli::SaveSnapshot(std::istringstream& args) {
    std::string path;
    args >> path;
    if (path.empty()) {
        path = snapshot_file_;
    }

    try {
        LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{path});
        if (!snapshot.Save(engine_->GetStateStore())) {
            Error("Failed to save snapshot to " + path);
            return;
        }
        std::cout << C(Color::GREEN) << "✓ Saved " << snapshot.Count() << " nodes to "
                  << path << C(Color::RESET) << "\n";
    } catch (const std::runtime_error& e) {
        Error(e.what());
    }
}

void LifecycleCli::LoadSnapshot(std::istringstream& args) {
    std::string path;
    args >> path;
    if (path.empty()) {
        path = snapshot_file_;
    }

    std::vector<Intent> intents;
    try {
        LifecycleSnapshotStore snapshot(LifecycleSnapshotStore::Config{path});
        intents = snapshot.LoadIntents();
    } catch (const std::runtime_error& e) {
        Error(e.what());
        return;
    }

    // Resources of the old simulation are discarded with its backend
    backend_ = SimulatedBackend(BackendConfig(config_));
    engine_ = std::make_unique<LifecycleEngine>(backend_, config_.ToEngineConfig());
    AttachEngine();

    engine_->SubmitBatch(intents);
    StepFrames(1);

    std::cout << C(Color::GREEN) << "✓ Restored " << engine_->GetStateStore().Size()
              << " nodes from " << path << C(Color::RESET) << "\n";
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<NodeID> LifecycleCli::ReadNodeID(std::istringstream& args) {
    std::string text;
    args >> text;

    // stoull accepts a sign and wraps "-1" around
    bool digits_only = !text.empty() &&
                       std::all_of(text.begin(), text.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
    try {
        size_t consumed = 0;
        unsigned long long value = digits_only ? std::stoull(text, &consumed) : 0;
        if (consumed == text.size() && value != 0) {
            return NodeID(static_cast<NodeID::ValueType>(value));
        }
    } catch (const std::exception&) {
        // Reported below
    }

    Error("Expected a node id (positive integer), got '" + text + "'");
    return std::nullopt;
}

void LifecycleCli::Error(const std::string& message) {
    std::cout << C(Color::RED) << "Error: " << message << C(Color::RESET) << "\n";
}

const char* LifecycleCli::StatusColor(NodeStatus status) const {
    switch (status) {
        case NodeStatus::LIVE: return Color::GREEN;
        case NodeStatus::LOADING: return Color::CYAN;
        case NodeStatus::UNAVAILABLE: return Color::BOLD_RED;
        case NodeStatus::RETRY_WAIT: return Color::YELLOW;
        default: return Color::DIM;
    }
}

} // namespace lrec
