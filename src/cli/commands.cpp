#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "net/beast_http_transport.hpp"
#include "net/guarded_fetcher.hpp"
#include "net/network_policy.hpp"
#include "nlohmann/json.hpp"
#include "tools/shell.hpp"
#include "tools/tool_registry.hpp"
#include "tools/web.hpp"
#include "utils/cancellation.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitToolFailure = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

// Everything the two tools borrow; lives for the whole command.
struct Runtime {
    explicit Runtime(const toolguard::config::Config& config)
        : policy(resolver, config.fetch.blocked_host_suffixes)
        , transport(config.fetch.ca_file)
        , fetcher(policy, transport, config.fetch.user_agent) {
        toolguard::sandbox::SandboxOptions options;
        options.working_dir = config.exec.workspace;
        options.search_path = config.exec.search_path;
        registry.Register(std::make_unique<toolguard::tools::ExecTool>(std::move(options)));
        registry.Register(std::make_unique<toolguard::tools::FetchTool>(fetcher));
    }

    toolguard::net::AsioHostResolver resolver;
    toolguard::net::NetworkPolicy policy;
    toolguard::net::BeastHttpTransport transport;
    toolguard::net::GuardedFetcher fetcher;
    toolguard::tools::ToolRegistry registry;
};

// Turns SIGINT/SIGTERM into a cancellation of the running call.
class SignalWatcher {
public:
    explicit SignalWatcher(toolguard::utils::CancellationSource& source)
        : source_(source) {
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);
        thread_ = std::thread([this] {
            while (!stop_.load()) {
                if (g_signal != 0) {
                    toolguard::utils::Log(toolguard::utils::LogLevel::kWarn, "cli", "signal received",
                                          {{"signal", std::to_string(g_signal)}});
                    source_.Cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }

    ~SignalWatcher() {
        stop_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    toolguard::utils::CancellationSource& source_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

void PrintUsage() {
    std::cerr << "Usage: toolguard exec '<json>' | toolguard fetch '<json>' | "
              << "toolguard tools | toolguard self-check\n"
              << "  '-' or no argument reads the JSON arguments from stdin." << std::endl;
}

int RunTool(Runtime& runtime, const std::string& name, int argc, char** argv) {
    std::string text;
    if (argc < 3 || std::string(argv[2]) == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        text = argv[2];
    }

    nlohmann::json arguments;
    try {
        arguments = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "toolguard: arguments are not valid JSON: " << ex.what() << std::endl;
        return kExitUsage;
    }

    toolguard::utils::CancellationSource source;
    toolguard::tools::ToolResult result;
    {
        SignalWatcher watcher(source);
        result = runtime.registry.Execute(name, arguments, source.Token());
    }
    std::cout << result.text << std::endl;
    return result.is_error ? kExitToolFailure : kExitOk;
}

struct Check {
    std::string name;
    std::string tool;
    nlohmann::json arguments;
    std::function<bool(const toolguard::tools::ToolResult&, const nlohmann::json&)> passes;
};

int RunSelfCheck(Runtime& runtime) {
    const auto is_error = [](const toolguard::tools::ToolResult& result, const nlohmann::json&) {
        return result.is_error;
    };
    const std::vector<Check> checks = {
        {"exec node -v", "exec", {{"command", "node"}, {"args", nlohmann::json::array({"-v"})}, {"timeoutMs", 30000}},
         [](const toolguard::tools::ToolResult& result, const nlohmann::json& body) {
             return !result.is_error && body.value("ok", false) && body.value("exitCode", -1) == 0
                 && body.contains("stdout") && body["stdout"].is_string();
         }},
        {"exec bash rejected", "exec",
         {{"command", "bash"}, {"args", nlohmann::json::array({"-lc", "echo nope"})}}, is_error},
        {"exec git -C / rejected", "exec", {{"command", "git"}, {"args", nlohmann::json::array({"-C", "/"})}}, is_error},
        {"fetch loopback blocked", "fetch", {{"url", "http://127.0.0.1"}}, is_error},
        {"fetch example.com", "fetch",
         {{"url", "https://example.com"}, {"timeoutMs", 15000}, {"maxBytes", 200000}},
         [](const toolguard::tools::ToolResult& result, const nlohmann::json& body) {
             if (result.is_error || !body.value("ok", false) || body.value("status", 0) != 200
                 || !body.contains("body") || !body["body"].is_string()) {
                 return false;
             }
             const auto text = toolguard::utils::ToLower(body["body"].get<std::string>());
             return text.find("example domain") != std::string::npos;
         }},
    };

    int failures = 0;
    for (const auto& check : checks) {
        const auto result = runtime.registry.Execute(check.tool, check.arguments);
        const auto body = nlohmann::json::parse(result.text, nullptr, false);
        const bool passed = !body.is_discarded() && check.passes(result, body);
        std::cout << (passed ? "ok   " : "FAIL ") << check.name << std::endl;
        if (!passed) {
            std::cout << result.text << std::endl;
            ++failures;
        }
    }
    std::cout << (failures == 0 ? "self-check passed" : "self-check failed") << std::endl;
    return failures == 0 ? kExitOk : kExitToolFailure;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    if (command != "exec" && command != "fetch" && command != "tools" && command != "self-check") {
        PrintUsage();
        return kExitUsage;
    }

    const auto config = toolguard::config::LoadConfig();
    toolguard::utils::Configure({toolguard::utils::ParseLogLevel(config.logging.level,
                                                                 toolguard::utils::LogLevel::kInfo)});

    try {
        Runtime runtime(config);
        if (command == "tools") {
            std::cout << runtime.registry.GetDefinitions().dump(2) << std::endl;
            return kExitOk;
        }
        if (command == "self-check") {
            return RunSelfCheck(runtime);
        }
        return RunTool(runtime, command, argc, argv);
    } catch (const std::exception& ex) {
        toolguard::utils::Log(toolguard::utils::LogLevel::kError, "cli", "fatal", {{"error", ex.what()}});
        return kExitToolFailure;
    }
}
