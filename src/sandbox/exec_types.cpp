#include "sandbox/exec_types.hpp"

namespace toolguard::sandbox {

const char* ToString(AllowedCommand command) {
    switch (command) {
        case AllowedCommand::kGit: return "git";
        case AllowedCommand::kNpm: return "npm";
        case AllowedCommand::kNode: return "node";
    }
    return "node";
}

std::optional<AllowedCommand> ParseAllowedCommand(const std::string& name) {
    if (name == "git") return AllowedCommand::kGit;
    if (name == "npm") return AllowedCommand::kNpm;
    if (name == "node") return AllowedCommand::kNode;
    return std::nullopt;
}

std::vector<std::string> AllowedCommandNames() {
    return {"git", "npm", "node"};
}

nlohmann::json ToJson(const ExecOutcome& outcome) {
    return {
        {"cwd", outcome.cwd},
        {"command", outcome.command},
        {"args", outcome.args},
        {"exitCode", outcome.exit_code ? nlohmann::json(*outcome.exit_code) : nlohmann::json(nullptr)},
        {"signal", outcome.signal ? nlohmann::json(*outcome.signal) : nlohmann::json(nullptr)},
        {"timedOut", outcome.timed_out},
        {"durationMs", outcome.duration_ms},
        {"stdout", outcome.stdout_text},
        {"stderr", outcome.stderr_text},
        {"stdoutTruncated", outcome.stdout_truncated},
        {"stderrTruncated", outcome.stderr_truncated}
    };
}

}  // namespace toolguard::sandbox
