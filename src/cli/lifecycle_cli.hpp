// File: src/cli/lifecycle_cli.hpp
//
// LREC CLI class definition
// Extracted for testability

#ifndef LREC_LIFECYCLE_CLI_HPP
#define LREC_LIFECYCLE_CLI_HPP

#include "cli/cli_config.hpp"
#include "cli/simulated_backend.hpp"
#include "engine/lifecycle_engine.hpp"
#include "platform/memory_pressure_sampler.hpp"
#include "core/types.hpp"
#include <string>
#include <sstream>
#include <vector>
#include <memory>
#include <optional>

namespace lrec {

/// ANSI color codes for terminal output
namespace Color {
    // Reset
    inline const char* RESET = "\033[0m";

    // Regular colors
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* BLUE = "\033[34m";
    inline const char* MAGENTA = "\033[35m";
    inline const char* CYAN = "\033[36m";

    // Bold colors
    inline const char* BOLD_RED = "\033[1;31m";
    inline const char* BOLD_GREEN = "\033[1;32m";
    inline const char* BOLD_YELLOW = "\033[1;33m";
    inline const char* BOLD_CYAN = "\033[1;36m";

    // Styles
    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Interactive simulator for the lifecycle engine
/// Drives a LifecycleEngine frame by frame against a SimulatedBackend
class LifecycleCli {
public:
    LifecycleCli();

    explicit LifecycleCli(const CliConfig& config);

    /// Main run loop - interactive mode
    void Run();

    /// Process a single command line (for testing)
    void ProcessCommand(const std::string& input);

    /// Run `count` frames
    void StepFrames(size_t count);

    // Accessors for verification
    const LifecycleEngine& GetEngine() const { return *engine_; }
    const SimulatedBackend& GetBackend() const { return backend_; }
    const CliConfig& GetConfig() const { return config_; }
    Timestamp GetClock() const { return clock_; }
    size_t GetCommandsProcessed() const { return commands_processed_; }
    bool IsRunning() const { return running_; }
    bool IsVerboseEnabled() const { return verbose_; }

    /// Set snapshot file path (for testing with temp files)
    void SetSnapshotFile(const std::string& path) { snapshot_file_ = path; }

private:
    CliConfig config_;
    SimulatedBackend backend_;
    std::unique_ptr<LifecycleEngine> engine_;
    MemoryPressureSampler sampler_;

    bool running_ = true;
    bool verbose_ = false;
    bool colors_enabled_ = true;
    std::string prompt_;
    std::string snapshot_file_;

    Timestamp clock_;
    size_t commands_processed_ = 0;
    std::vector<FollowUpIntent> diagnostics_log_;

    /// Connect backend outcomes and diagnostics to the current engine
    void AttachEngine();

    void PrintWelcome();

    // Commands
    void ShowHelp();
    void AddNodeCommand(std::istringstream& args);
    void TierCommand(std::istringstream& args);
    void RemoveCommand(std::istringstream& args);
    void PinCommand(std::istringstream& args, bool pinned);
    void PressureCommand(std::istringstream& args);
    void SampleCommand();
    void FailCommand(std::istringstream& args);
    void CrashCommand(std::istringstream& args);
    void RetryCommand(std::istringstream& args);
    void FrameCommand(std::istringstream& args);
    void ShowStatus(std::istringstream& args);
    void ShowStatistics();
    void SaveSnapshot(std::istringstream& args);
    void LoadSnapshot(std::istringstream& args);

    // Output
    void PrintFrameReport(const FrameReport& report);
    void PrintNodeLine(NodeID id);

    // Parsing helpers
    std::optional<NodeID> ReadNodeID(std::istringstream& args);
    void Error(const std::string& message);

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
    const char* StatusColor(NodeStatus status) const;
};

} // namespace lrec

#endif // LREC_LIFECYCLE_CLI_HPP
