#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace toolguard::config {
namespace {

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::vector<std::string> ReadStringArray(const nlohmann::json& value) {
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (item.is_string() && !item.get_ref<const std::string&>().empty()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto override_path = utils::GetEnv("TOOLGUARD_CONFIG");
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    return GetHomePath() / ".toolguard" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("exec") && data["exec"].is_object()) {
        const auto& exec = data["exec"];
        if (exec.contains("workspace") && exec["workspace"].is_string()) {
            config.exec.workspace = exec["workspace"].get<std::string>();
        }
        if (exec.contains("searchPath") && exec["searchPath"].is_array()) {
            config.exec.search_path = ReadStringArray(exec["searchPath"]);
        }
    }

    if (data.contains("fetch") && data["fetch"].is_object()) {
        const auto& fetch = data["fetch"];
        if (fetch.contains("userAgent") && fetch["userAgent"].is_string()) {
            config.fetch.user_agent = fetch["userAgent"].get<std::string>();
        }
        if (fetch.contains("blockedHostSuffixes") && fetch["blockedHostSuffixes"].is_array()) {
            config.fetch.blocked_host_suffixes = ReadStringArray(fetch["blockedHostSuffixes"]);
        }
        if (fetch.contains("caFile") && fetch["caFile"].is_string()) {
            config.fetch.ca_file = fetch["caFile"].get<std::string>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto workspace = utils::GetEnv("TOOLGUARD_EXEC__WORKSPACE");
    if (!workspace.empty()) {
        config.exec.workspace = workspace;
    }

    const auto search_path = utils::GetEnv("TOOLGUARD_EXEC__SEARCH_PATH");
    if (!search_path.empty()) {
        config.exec.search_path = utils::Split(search_path, ':');
    }

    const auto user_agent = utils::GetEnv("TOOLGUARD_FETCH__USER_AGENT");
    if (!user_agent.empty()) {
        config.fetch.user_agent = user_agent;
    }

    const auto blocked_suffixes = utils::GetEnv("TOOLGUARD_FETCH__BLOCKED_SUFFIXES");
    if (!blocked_suffixes.empty()) {
        config.fetch.blocked_host_suffixes = utils::Split(blocked_suffixes, ',');
    }

    const auto ca_file = utils::GetEnv("TOOLGUARD_FETCH__CA_FILE");
    if (!ca_file.empty()) {
        config.fetch.ca_file = ca_file;
    }

    const auto log_level = utils::GetEnv("TOOLGUARD_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::Log(utils::LogLevel::kWarn, "config", "cannot open", {{"path", path.string()}});
        return config;
    }
    try {
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "config", "parse failed, using defaults",
                   {{"path", path.string()}, {"error", ex.what()}});
        return Config{};
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFrom(GetConfigPath());
    ApplyEnvOverrides(config);
    return config;
}

}  // namespace toolguard::config
