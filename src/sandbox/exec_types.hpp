#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace toolguard::sandbox {

constexpr long long kDefaultExecTimeoutMs = 60000;
constexpr long long kMaxExecTimeoutMs = 120000;
constexpr long long kDefaultMaxOutputBytes = 200000;
constexpr long long kMinMaxOutputBytes = 1024;
constexpr long long kMaxMaxOutputBytes = 1000000;
constexpr std::size_t kMaxArgs = 64;
constexpr std::size_t kMaxArgLength = 8192;
constexpr std::size_t kMaxStdinBytes = 200000;

enum class AllowedCommand {
    kGit,
    kNpm,
    kNode
};

const char* ToString(AllowedCommand command);
std::optional<AllowedCommand> ParseAllowedCommand(const std::string& name);
std::vector<std::string> AllowedCommandNames();

struct ExecCommand {
    AllowedCommand command = AllowedCommand::kNode;
    std::vector<std::string> args;
    std::optional<std::string> stdin_text;
    std::chrono::milliseconds timeout{kDefaultExecTimeoutMs};
    std::size_t max_output_bytes = static_cast<std::size_t>(kDefaultMaxOutputBytes);
};

struct ExecOutcome {
    std::string cwd;
    std::string command;
    std::vector<std::string> args;
    std::optional<int> exit_code;
    std::optional<std::string> signal;
    bool timed_out = false;
    long long duration_ms = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

// Wire shape: {cwd, command, args, exitCode, signal, timedOut, durationMs,
// stdout, stderr, stdoutTruncated, stderrTruncated}.
nlohmann::json ToJson(const ExecOutcome& outcome);

}  // namespace toolguard::sandbox
