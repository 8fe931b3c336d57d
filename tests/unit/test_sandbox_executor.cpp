#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <signal.h>
#include <sys/types.h>
#include "errors/tool_error.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/cancellation.hpp"

namespace {

namespace fs = std::filesystem;

using toolguard::errors::ToolError;
using toolguard::errors::ToolErrorCode;
using toolguard::sandbox::AllowedCommand;
using toolguard::sandbox::ExecCommand;
using toolguard::sandbox::SandboxExecutor;
using toolguard::sandbox::SandboxOptions;

// Stand-in for node: "-v" prints a version, "-e <script>" runs the script
// with /bin/sh in place of the interpreter.
constexpr const char* kFakeNode = R"(#!/bin/sh
if [ "$1" = "-v" ]; then echo v20.0.0-fake; exit 0; fi
if [ "$1" = "-e" ]; then shift; exec /bin/sh -c "$1"; fi
echo "unsupported: $*" >&2
exit 9
)";

class TempWorkspace {
public:
    TempWorkspace() {
        std::string pattern = (fs::temp_directory_path() / "toolguard_exec_XXXXXX").string();
        if (!::mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        root_ = fs::canonical(pattern);
        fs::create_directories(root_ / "bin");
        fs::create_directories(root_ / "work");
        WriteScript("node", kFakeNode);
    }

    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void WriteScript(const std::string& name, const std::string& body) const {
        const auto path = root_ / "bin" / name;
        std::ofstream out(path);
        out << body;
        out.close();
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    }

    fs::path Work() const { return root_ / "work"; }
    fs::path Bin() const { return root_ / "bin"; }

    SandboxOptions Options() const {
        SandboxOptions options;
        options.working_dir = Work().string();
        options.search_path = {Bin().string()};
        return options;
    }

private:
    fs::path root_;
};

ExecCommand NodeScript(const std::string& script, int timeout_ms = 10000) {
    ExecCommand command;
    command.command = AllowedCommand::kNode;
    command.args = {"-e", script};
    command.timeout = std::chrono::milliseconds(timeout_ms);
    return command;
}

ToolError RunExpectingError(const SandboxExecutor& executor, const ExecCommand& command,
                            const toolguard::utils::CancellationToken& cancel = {}) {
    try {
        executor.Run(command, cancel);
    } catch (const ToolError& ex) {
        return ex;
    }
    ADD_FAILURE() << "expected ToolError";
    return ToolError(ToolErrorCode::kInternalError, "no error");
}

bool ProcessGone(pid_t pid) {
    if (::kill(pid, 0) != 0) {
        return true;
    }
    // A zombie waiting for a reaper is dead for our purposes.
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    std::getline(stat, content);
    const auto close = content.rfind(')');
    return close != std::string::npos && close + 2 < content.size() && content[close + 2] == 'Z';
}

bool WaitUntilGone(pid_t pid) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (ProcessGone(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return ProcessGone(pid);
}

pid_t ReadPid(const fs::path& path) {
    std::ifstream in(path);
    pid_t pid = 0;
    in >> pid;
    return pid;
}

TEST(SandboxExecutorTest, RunsCommandInFixedWorkingDirectory) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());

    ExecCommand version;
    version.command = AllowedCommand::kNode;
    version.args = {"-v"};
    const auto outcome = executor.Run(version);
    EXPECT_EQ(outcome.exit_code.value_or(-1), 0);
    EXPECT_EQ(outcome.stdout_text, "v20.0.0-fake\n");
    EXPECT_EQ(outcome.command, "node");
    EXPECT_EQ(outcome.cwd, workspace.Work().string());
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_FALSE(outcome.signal.has_value());

    const auto pwd = executor.Run(NodeScript("pwd"));
    EXPECT_EQ(pwd.stdout_text, workspace.Work().string() + "\n");
}

TEST(SandboxExecutorTest, ArgumentsAreNotShellExpanded) {
    TempWorkspace workspace;
    workspace.WriteScript("git", "#!/bin/sh\nfor a in \"$@\"; do echo \"[$a]\"; done\n");
    SandboxExecutor executor(workspace.Options());

    ExecCommand command;
    command.command = AllowedCommand::kGit;
    command.args = {"log", "$HOME", "a b", "; rm -rf /"};
    const auto outcome = executor.Run(command);
    EXPECT_EQ(outcome.stdout_text, "[log]\n[$HOME]\n[a b]\n[; rm -rf /]\n");
}

TEST(SandboxExecutorTest, NonZeroExitCarriesTheOutcome) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());

    const auto error = RunExpectingError(executor, NodeScript("echo partial; echo oops >&2; exit 3"));
    EXPECT_EQ(error.Code(), ToolErrorCode::kNonZeroExit);
    EXPECT_EQ(std::string(error.what()), "Process exited with non-zero status");
    EXPECT_EQ(error.Details()["exitCode"], 3);
    EXPECT_EQ(error.Details()["stdout"], "partial\n");
    EXPECT_EQ(error.Details()["stderr"], "oops\n");
    EXPECT_EQ(error.Details()["timedOut"], false);
}

TEST(SandboxExecutorTest, TerminationBySignalIsReported) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());

    const auto error = RunExpectingError(executor, NodeScript("kill -TERM $$"));
    EXPECT_EQ(error.Code(), ToolErrorCode::kNonZeroExit);
    EXPECT_TRUE(error.Details()["exitCode"].is_null());
    EXPECT_EQ(error.Details()["signal"], "SIGTERM");
}

TEST(SandboxExecutorTest, TimeoutKillsTheWholeProcessGroup) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());
    const auto pid_file = workspace.Work() / "child.pid";

    const auto started = std::chrono::steady_clock::now();
    const auto error = RunExpectingError(
        executor, NodeScript("sleep 30 & echo $! > child.pid; wait", 300));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(error.Code(), ToolErrorCode::kTimeout);
    EXPECT_EQ(std::string(error.what()), "Process timed out after 300ms");
    EXPECT_EQ(error.Details()["timedOut"], true);
    EXPECT_EQ(error.Details()["signal"], "SIGKILL");
    EXPECT_TRUE(error.Details()["exitCode"].is_null());
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    const auto child = ReadPid(pid_file);
    ASSERT_GT(child, 0);
    EXPECT_TRUE(WaitUntilGone(child));
}

TEST(SandboxExecutorTest, DescendantsDoNotOutliveACleanExit) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());
    const auto pid_file = workspace.Work() / "child.pid";

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = executor.Run(NodeScript("sleep 30 & echo $! > child.pid; exit 0"));
    EXPECT_EQ(outcome.exit_code.value_or(-1), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));

    const auto child = ReadPid(pid_file);
    ASSERT_GT(child, 0);
    EXPECT_TRUE(WaitUntilGone(child));
}

TEST(SandboxExecutorTest, OutputIsCappedPerStream) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());

    auto command = NodeScript("head -c 5000 /dev/zero | tr '\\000' a; echo small >&2");
    command.max_output_bytes = 1024;
    const auto outcome = executor.Run(command);
    EXPECT_EQ(outcome.stdout_text, std::string(1024, 'a'));
    EXPECT_TRUE(outcome.stdout_truncated);
    EXPECT_EQ(outcome.stderr_text, "small\n");
    EXPECT_FALSE(outcome.stderr_truncated);
}

TEST(SandboxExecutorTest, StdinIsDeliveredAndClosed) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());

    auto command = NodeScript("cat");
    command.stdin_text = "hello from stdin";
    const auto outcome = executor.Run(command);
    EXPECT_EQ(outcome.stdout_text, "hello from stdin");

    // No stdin means EOF right away, not a hang.
    const auto empty = executor.Run(NodeScript("cat"));
    EXPECT_EQ(empty.stdout_text, "");
}

TEST(SandboxExecutorTest, ChildStartsWithDefaultSigpipe) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());
    std::signal(SIGPIPE, SIG_IGN);

    const auto outcome = executor.Run(NodeScript("grep SigIgn /proc/self/status"));
    const auto colon = outcome.stdout_text.find(':');
    ASSERT_NE(colon, std::string::npos) << outcome.stdout_text;
    const auto ignored = std::stoull(outcome.stdout_text.substr(colon + 1), nullptr, 16);
    EXPECT_EQ(ignored & (1ull << (SIGPIPE - 1)), 0u);
}

TEST(SandboxExecutorTest, ExternalCancellationAborts) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());
    toolguard::utils::CancellationSource source;

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        source.Cancel();
    });
    const auto error = RunExpectingError(executor, NodeScript("sleep 30"), source.Token());
    canceller.join();

    EXPECT_EQ(error.Code(), ToolErrorCode::kAborted);
    EXPECT_EQ(error.Details()["timedOut"], false);
}

TEST(SandboxExecutorTest, AlreadyCancelledNeverSpawns) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());
    toolguard::utils::CancellationSource source;
    source.Cancel();

    const auto error = RunExpectingError(executor, NodeScript("touch spawned"), source.Token());
    EXPECT_EQ(error.Code(), ToolErrorCode::kAborted);
    EXPECT_FALSE(fs::exists(workspace.Work() / "spawned"));
}

TEST(SandboxExecutorTest, MissingExecutableIsSpawnFailure) {
    TempWorkspace workspace;
    SandboxExecutor executor(workspace.Options());

    ExecCommand command;
    command.command = AllowedCommand::kNpm;
    const auto error = RunExpectingError(executor, command);
    EXPECT_EQ(error.Code(), ToolErrorCode::kSpawnFailed);
    EXPECT_EQ(std::string(error.what()), "Failed to spawn process");
}

}  // namespace
