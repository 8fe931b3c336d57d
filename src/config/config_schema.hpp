#pragma once

#include <string>
#include <vector>

namespace toolguard::config {

struct ExecConfig {
    std::string workspace = "/workspace";
    // Empty means the PATH of this process.
    std::vector<std::string> search_path;
};

struct FetchConfig {
    std::string user_agent = "toolguard-fetch/0.1";
    // Added to the built-in blocked suffixes, never replacing them.
    std::vector<std::string> blocked_host_suffixes;
    std::string ca_file;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ExecConfig exec;
    FetchConfig fetch;
    LoggingConfig logging;
};

}  // namespace toolguard::config
