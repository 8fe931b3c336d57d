#include "sandbox/command_policy.hpp"

#include <cctype>
#include <optional>

#include "errors/tool_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace toolguard::sandbox {
namespace {

using errors::ToolError;
using errors::ToolErrorCode;

constexpr const char* kCwdOverride = "cwd override";
constexpr const char* kGlobalLocation = "global location";

const std::vector<ArgumentRule> kGitRules = {
    {"-C", FlagMatch::kExactOrAttached, kCwdOverride},
    {"--git-dir", FlagMatch::kExactOrJoined, kCwdOverride},
    {"--work-tree", FlagMatch::kExactOrJoined, kCwdOverride},
    {"--separate-git-dir", FlagMatch::kAbbreviated, kCwdOverride, nullptr, 3},
    {"-c", FlagMatch::kWithValue, kCwdOverride, "core.worktree"},
    {"-ccore.worktree", FlagMatch::kPrefix, kCwdOverride},
    {"--config-env", FlagMatch::kWithValue, kCwdOverride, "core.worktree"},
    {"--config-env=core.worktree", FlagMatch::kPrefix, kCwdOverride},
};

// npm's option parser expands unambiguous abbreviations of long flags and
// bundles of single-letter shorthands, so those spellings are denied too.
const std::vector<ArgumentRule> kNpmRules = {
    {"--prefix", FlagMatch::kAbbreviated, kCwdOverride, nullptr, 3},
    {"-C", FlagMatch::kExactOrAttached, kCwdOverride},
    {"--global", FlagMatch::kAbbreviated, kGlobalLocation, nullptr, 3},
    {"-g", FlagMatch::kShortBundle, kGlobalLocation},
    {"--location", FlagMatch::kAbbreviatedWithValue, kGlobalLocation, "global", 3},
};

const std::vector<ArgumentRule> kNodeRules = {};

struct LongFlag {
    std::string name;
    std::optional<std::string> value;  // set for "--name=value"
};

// "--pref=/x" abbreviates "--prefix" when "pref" is at least `min_chars` long.
std::optional<LongFlag> AbbreviatedLongFlag(const std::string& arg, const std::string& flag,
                                            std::size_t min_chars) {
    if (!utils::StartsWith(arg, "--") || arg.size() < 3) {
        return std::nullopt;
    }
    const auto lower = utils::ToLower(arg);
    const auto eq = lower.find('=');
    LongFlag parsed;
    parsed.name = lower.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
    if (eq != std::string::npos) {
        parsed.value = lower.substr(eq + 1);
    }
    const auto full = flag.substr(2);
    if (parsed.name.size() < min_chars || parsed.name.size() > full.size()
        || full.compare(0, parsed.name.size(), parsed.name) != 0) {
        return std::nullopt;
    }
    return parsed;
}

// A single-dash group of letters is a bundle of shorthands; "-dg" sets -g.
bool InShortBundle(const std::string& arg, char letter) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    if (arg[1] == letter && (arg.size() == 2 || arg[2] == '=')) {
        return true;
    }
    for (std::size_t i = 1; i < arg.size(); ++i) {
        if (!std::isalpha(static_cast<unsigned char>(arg[i]))) {
            return false;
        }
    }
    return arg.find(letter, 1) != std::string::npos;
}

// The text to report when `arg` (and possibly `next`) matches, nullopt otherwise.
std::optional<std::string> Match(const ArgumentRule& rule, const std::string& arg, const std::string* next) {
    const std::string flag(rule.flag);
    const auto next_has_value = [&] {
        return next != nullptr && rule.value != nullptr
            && utils::StartsWith(utils::ToLower(*next), rule.value);
    };
    switch (rule.match) {
        case FlagMatch::kExactOrJoined:
            if (arg == flag || utils::StartsWith(arg, flag + "=")) {
                return arg;
            }
            return std::nullopt;
        case FlagMatch::kExactOrAttached:
            if (utils::StartsWith(arg, flag)) {
                return arg;
            }
            return std::nullopt;
        case FlagMatch::kPrefix:
            if (utils::StartsWith(utils::ToLower(arg), flag)) {
                return arg;
            }
            return std::nullopt;
        case FlagMatch::kWithValue:
            if (arg == flag && next_has_value()) {
                return arg + " " + *next;
            }
            return std::nullopt;
        case FlagMatch::kAbbreviated:
            if (AbbreviatedLongFlag(arg, flag, rule.min_abbreviation)) {
                return arg;
            }
            return std::nullopt;
        case FlagMatch::kAbbreviatedWithValue: {
            const auto parsed = AbbreviatedLongFlag(arg, flag, rule.min_abbreviation);
            if (!parsed || rule.value == nullptr) {
                return std::nullopt;
            }
            if (parsed->value) {
                if (utils::StartsWith(*parsed->value, rule.value)) {
                    return arg;
                }
                return std::nullopt;
            }
            if (next_has_value()) {
                return arg + " " + *next;
            }
            return std::nullopt;
        }
        case FlagMatch::kShortBundle:
            if (flag.size() == 2 && InShortBundle(arg, flag[1])) {
                return arg;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

[[noreturn]] void Deny(const std::string& shown, const char* reason) {
    utils::Log(utils::LogLevel::kWarn, "policy", "argument denied",
               {{"arg", shown}, {"reason", reason}});
    throw ToolError(ToolErrorCode::kDisallowedArgument,
                    "Disallowed argument: " + shown,
                    {{"reason", reason}});
}

}  // namespace

AllowedCommand CommandPolicy::RequireAllowed(const std::string& name) {
    const auto command = ParseAllowedCommand(name);
    if (!command) {
        throw ToolError(ToolErrorCode::kCommandNotAllowed,
                        "command must be one of: " + utils::Join(AllowedCommandNames(), ", "),
                        {{"allowed", AllowedCommandNames()}});
    }
    return *command;
}

void CommandPolicy::ValidateArguments(AllowedCommand command, const std::vector<std::string>& args) {
    const auto& rules = RulesFor(command);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto* next = i + 1 < args.size() ? &args[i + 1] : nullptr;
        for (const auto& rule : rules) {
            if (const auto shown = Match(rule, args[i], next)) {
                Deny(*shown, rule.reason);
            }
        }
    }
}

const std::vector<ArgumentRule>& CommandPolicy::RulesFor(AllowedCommand command) {
    switch (command) {
        case AllowedCommand::kGit: return kGitRules;
        case AllowedCommand::kNpm: return kNpmRules;
        case AllowedCommand::kNode: return kNodeRules;
    }
    return kNodeRules;
}

}  // namespace toolguard::sandbox
