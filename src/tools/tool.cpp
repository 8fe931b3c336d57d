#include "tools/tool.hpp"

namespace toolguard::tools {
namespace {

constexpr int kIndent = 2;

}  // namespace

ToolResult OkResult(const nlohmann::json& payload) {
    nlohmann::json envelope = {{"ok", true}};
    for (const auto& [key, value] : payload.items()) {
        envelope[key] = value;
    }
    return {false, envelope.dump(kIndent)};
}

ToolResult ErrorResult(const nlohmann::json& error) {
    const nlohmann::json envelope = {{"ok", false}, {"error", error}};
    return {true, envelope.dump(kIndent)};
}

}  // namespace toolguard::tools
