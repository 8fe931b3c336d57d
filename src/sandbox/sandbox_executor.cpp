#include "sandbox/sandbox_executor.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <functional>
#include <memory>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "errors/tool_error.hpp"
#include "utils/bounded_buffer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace toolguard::sandbox {
namespace bp = boost::process;

namespace {

using errors::ToolError;
using errors::ToolErrorCode;

constexpr std::size_t kReadChunkBytes = 16 * 1024;
// After the leader exits, descendants that escaped the group sweep can still
// hold the pipes; stop waiting for EOF after this long.
constexpr auto kDrainGrace = std::chrono::seconds(2);

// Writing stdin to a child that already exited must surface as EPIPE, not
// terminate this process.
void IgnoreSigpipeOnce() {
    static const bool ignored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

// Runs in the forked child before exec. An ignored SIGPIPE would survive
// exec, so the child gets the default disposition back.
struct RestoreChildSignals : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::signal(SIGPIPE, SIG_DFL);
    }
};

std::string SignalName(int signal_number) {
    switch (signal_number) {
        case SIGHUP: return "SIGHUP";
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGILL: return "SIGILL";
        case SIGTRAP: return "SIGTRAP";
        case SIGABRT: return "SIGABRT";
        case SIGBUS: return "SIGBUS";
        case SIGFPE: return "SIGFPE";
        case SIGKILL: return "SIGKILL";
        case SIGUSR1: return "SIGUSR1";
        case SIGSEGV: return "SIGSEGV";
        case SIGUSR2: return "SIGUSR2";
        case SIGPIPE: return "SIGPIPE";
        case SIGALRM: return "SIGALRM";
        case SIGTERM: return "SIGTERM";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        default: return "SIG" + std::to_string(signal_number);
    }
}

// Kills the process group with negative-pid semantics and falls back to the
// leader alone if that fails.
void KillProcessTree(pid_t pgid, pid_t pid) {
    if (::kill(-pgid, SIGKILL) == 0) {
        return;
    }
    const int group_errno = errno;
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        utils::Log(utils::LogLevel::kWarn, "exec", "kill failed",
                   {{"pid", std::to_string(pid)},
                    {"group_error", std::strerror(group_errno)},
                    {"error", std::strerror(errno)}});
    }
}

// Leftover group members after the leader was reaped; ESRCH means none.
void SweepProcessGroup(pid_t pgid) {
    if (::kill(-pgid, SIGKILL) == 0) {
        utils::Log(utils::LogLevel::kDebug, "exec", "swept leftover group members",
                   {{"pgid", std::to_string(pgid)}});
    }
}

}  // namespace

const char* ToString(ProcessState state) {
    switch (state) {
        case ProcessState::kSpawned: return "spawned";
        case ProcessState::kRunning: return "running";
        case ProcessState::kExited: return "exited";
        case ProcessState::kTimedOut: return "timed-out";
        case ProcessState::kAborted: return "aborted";
        case ProcessState::kKilling: return "killing";
        case ProcessState::kKilled: return "killed";
    }
    return "unknown";
}

SandboxExecutor::SandboxExecutor(SandboxOptions options)
    : options_(std::move(options)) {}

std::string SandboxExecutor::ResolveExecutable(const std::string& name) const {
    std::vector<boost::filesystem::path> dirs;
    if (options_.search_path.empty()) {
        dirs = boost::this_process::path();
    } else {
        for (const auto& dir : options_.search_path) {
            dirs.emplace_back(dir);
        }
    }
    return bp::search_path(name, dirs).string();
}

ExecOutcome SandboxExecutor::Run(const ExecCommand& command,
                                 const utils::CancellationToken& cancel) const {
    IgnoreSigpipeOnce();

    const auto timeout = std::clamp(command.timeout,
                                    std::chrono::milliseconds(1),
                                    std::chrono::milliseconds(kMaxExecTimeoutMs));
    const auto max_output = std::clamp<std::size_t>(command.max_output_bytes,
                                                    kMinMaxOutputBytes,
                                                    kMaxMaxOutputBytes);
    const std::string name = ToString(command.command);

    ExecOutcome outcome;
    outcome.cwd = options_.working_dir;
    outcome.command = name;
    outcome.args = command.args;

    if (cancel.IsCancelled()) {
        throw ToolError(ToolErrorCode::kAborted, "Request aborted");
    }

    const auto executable = ResolveExecutable(name);
    if (executable.empty()) {
        throw ToolError(ToolErrorCode::kSpawnFailed, "Failed to spawn process",
                        {{"message", "executable not found: " + name}});
    }

    boost::asio::io_context ioc;
    bp::async_pipe out_pipe(ioc);
    bp::async_pipe err_pipe(ioc);
    bp::async_pipe in_pipe(ioc);
    bp::group group;
    boost::asio::steady_timer deadline(ioc);
    boost::asio::steady_timer drain(ioc);
    utils::BoundedBuffer out_buffer(max_output);
    utils::BoundedBuffer err_buffer(max_output);

    ProcessState state = ProcessState::kSpawned;
    bool exited = false;
    bool aborted = false;
    int open_streams = 2;
    std::error_code exit_error;
    std::unique_ptr<bp::child> child;

    const auto started = utils::Now();
    try {
        child = std::make_unique<bp::child>(
            bp::exe = executable,
            bp::args = command.args,
            bp::start_dir = options_.working_dir,
            bp::std_out > out_pipe,
            bp::std_err > err_pipe,
            bp::std_in < in_pipe,
            RestoreChildSignals{},
            group,
            ioc,
            bp::on_exit([&](int, const std::error_code& ec) {
                exited = true;
                exit_error = ec;
                deadline.cancel();
                state = state == ProcessState::kKilling ? ProcessState::kKilled : ProcessState::kExited;
                SweepProcessGroup(child->id());
                if (open_streams > 0) {
                    drain.expires_after(kDrainGrace);
                    drain.async_wait([&](const boost::system::error_code& drain_ec) {
                        if (drain_ec) {
                            return;
                        }
                        boost::system::error_code ignored;
                        out_pipe.close(ignored);
                        err_pipe.close(ignored);
                        in_pipe.close(ignored);
                    });
                }
            }));
    } catch (const bp::process_error& ex) {
        throw ToolError(ToolErrorCode::kSpawnFailed, "Failed to spawn process",
                        {{"message", ex.what()}});
    }

    const pid_t pid = child->id();
    const pid_t pgid = group.native_handle();
    state = ProcessState::kRunning;
    utils::Log(utils::LogLevel::kInfo, "exec", "spawn",
               {{"command", name},
                {"args", std::to_string(command.args.size())},
                {"pid", std::to_string(pid)},
                {"timeout_ms", std::to_string(timeout.count())}});

    auto kill_group = [&](ProcessState reason) {
        utils::Log(utils::LogLevel::kWarn, "exec", "killing process group",
                   {{"pid", std::to_string(pid)}, {"reason", ToString(reason)}});
        state = ProcessState::kKilling;
        KillProcessTree(pgid > 0 ? pgid : pid, pid);
    };

    deadline.expires_after(timeout);
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec || exited || state != ProcessState::kRunning) {
            return;
        }
        outcome.timed_out = true;
        state = ProcessState::kTimedOut;
        kill_group(ProcessState::kTimedOut);
    });

    auto registration = cancel.Subscribe([&] {
        boost::asio::post(ioc, [&] {
            if (exited || state != ProcessState::kRunning) {
                return;
            }
            aborted = true;
            state = ProcessState::kAborted;
            kill_group(ProcessState::kAborted);
        });
    });

    auto stream_closed = [&] {
        if (--open_streams == 0 && exited) {
            drain.cancel();
        }
    };

    std::array<char, kReadChunkBytes> out_chunk{};
    std::array<char, kReadChunkBytes> err_chunk{};
    std::function<void()> read_out;
    std::function<void()> read_err;
    // Pipes are drained to EOF even past the cap so the child never blocks
    // on a full pipe; the buffers drop what does not fit.
    read_out = [&] {
        out_pipe.async_read_some(boost::asio::buffer(out_chunk),
            [&](const boost::system::error_code& ec, std::size_t n) {
                out_buffer.Append(out_chunk.data(), n);
                if (ec) {
                    stream_closed();
                    return;
                }
                read_out();
            });
    };
    read_err = [&] {
        err_pipe.async_read_some(boost::asio::buffer(err_chunk),
            [&](const boost::system::error_code& ec, std::size_t n) {
                err_buffer.Append(err_chunk.data(), n);
                if (ec) {
                    stream_closed();
                    return;
                }
                read_err();
            });
    };
    read_out();
    read_err();

    if (command.stdin_text && !command.stdin_text->empty()) {
        boost::asio::async_write(in_pipe, boost::asio::buffer(*command.stdin_text),
            [&](const boost::system::error_code& ec, std::size_t) {
                if (ec && ec != boost::asio::error::broken_pipe) {
                    utils::Log(utils::LogLevel::kDebug, "exec", "stdin write failed",
                               {{"error", ec.message()}});
                }
                boost::system::error_code ignored;
                in_pipe.close(ignored);
            });
    } else {
        boost::system::error_code ignored;
        in_pipe.close(ignored);
    }

    try {
        ioc.run();
    } catch (const std::exception& ex) {
        registration.Reset();
        KillProcessTree(pgid > 0 ? pgid : pid, pid);
        throw ToolError(ToolErrorCode::kExecFailed, "Process execution failed",
                        {{"message", ex.what()}});
    }
    registration.Reset();

    outcome.duration_ms = utils::ElapsedMs(started);
    outcome.stdout_text = out_buffer.Text();
    outcome.stderr_text = err_buffer.Text();
    outcome.stdout_truncated = out_buffer.Truncated();
    outcome.stderr_truncated = err_buffer.Truncated();

    if (!exited || exit_error) {
        KillProcessTree(pgid > 0 ? pgid : pid, pid);
        throw ToolError(ToolErrorCode::kExecFailed, "Process execution failed",
                        {{"message", exit_error ? exit_error.message() : std::string("process did not exit")}});
    }

    const int status = child->native_exit_code();
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = SignalName(WTERMSIG(status));
    }

    utils::Log(utils::LogLevel::kInfo, "exec", "exit",
               {{"pid", std::to_string(pid)},
                {"state", ToString(state)},
                {"exit_code", outcome.exit_code ? std::to_string(*outcome.exit_code) : "null"},
                {"signal", outcome.signal.value_or("null")},
                {"duration_ms", std::to_string(outcome.duration_ms)},
                {"stdout_bytes", std::to_string(out_buffer.Size())},
                {"stderr_bytes", std::to_string(err_buffer.Size())}});

    if (aborted) {
        throw ToolError(ToolErrorCode::kAborted, "Request aborted", ToJson(outcome));
    }
    if (outcome.timed_out) {
        throw ToolError(ToolErrorCode::kTimeout,
                        "Process timed out after " + std::to_string(timeout.count()) + "ms",
                        ToJson(outcome));
    }
    if (outcome.exit_code.value_or(-1) != 0) {
        throw ToolError(ToolErrorCode::kNonZeroExit, "Process exited with non-zero status",
                        ToJson(outcome));
    }
    return outcome;
}

}  // namespace toolguard::sandbox
