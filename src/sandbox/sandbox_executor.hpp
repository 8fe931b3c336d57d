#pragma once

#include <string>
#include <vector>

#include "sandbox/exec_types.hpp"
#include "utils/cancellation.hpp"

namespace toolguard::sandbox {

enum class ProcessState {
    kSpawned,
    kRunning,
    kExited,
    kTimedOut,
    kAborted,
    kKilling,
    kKilled
};

const char* ToString(ProcessState state);

struct SandboxOptions {
    std::string working_dir = "/workspace";
    // Directories searched for the allowlisted executables; empty means PATH.
    std::vector<std::string> search_path;
};

// Runs one allowlisted command per call as the leader of its own process
// group, with no shell in between. Stdout and stderr are captured into
// separate byte-capped buffers. On timeout or cancellation the whole group
// is killed; when the leader exits, whatever is left of the group is swept,
// so nothing spawned by the call outlives it.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxOptions options);

    // Returns the outcome on exit code 0. Throws ToolError with
    // SPAWN_FAILED, EXEC_FAILED, ABORTED, TIMEOUT or NON_ZERO_EXIT; the last
    // two (and ABORTED after spawn) carry the outcome as details.
    ExecOutcome Run(const ExecCommand& command,
                    const utils::CancellationToken& cancel = {}) const;

    const SandboxOptions& Options() const { return options_; }

private:
    std::string ResolveExecutable(const std::string& name) const;

    SandboxOptions options_;
};

}  // namespace toolguard::sandbox
