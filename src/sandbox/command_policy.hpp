#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sandbox/exec_types.hpp"

namespace toolguard::sandbox {

// How a rule's flag is matched against one argument.
enum class FlagMatch {
    kExactOrJoined,          // "--work-tree" or "--work-tree=/x"
    kExactOrAttached,        // "-C" or "-C/x"
    kPrefix,                 // "-ccore.worktree=/x"
    kWithValue,              // "-c" followed by the token "core.worktree=..."
    kAbbreviated,            // "--prefix", "--pref", "--prefi=/x"
    kAbbreviatedWithValue,   // "--location=global", "--loc global"
    kShortBundle             // "-g", "-g=true", "-gd", "-dg"
};

struct ArgumentRule {
    const char* flag;
    FlagMatch match;
    const char* reason;
    // kWithValue and kAbbreviatedWithValue: lower-cased prefix of the value.
    const char* value = nullptr;
    // kAbbreviated*: shortest accepted abbreviation, in characters after "--".
    std::size_t min_abbreviation = 0;
};

// Argument rules are per command: each allowed CLI has its own ways of
// pointing itself at another directory.
class CommandPolicy {
public:
    // Throws COMMAND_NOT_ALLOWED when `name` is not in the allowlist.
    static AllowedCommand RequireAllowed(const std::string& name);

    // Throws DISALLOWED_ARGUMENT on the first argument matching a rule.
    static void ValidateArguments(AllowedCommand command, const std::vector<std::string>& args);

    static const std::vector<ArgumentRule>& RulesFor(AllowedCommand command);
};

}  // namespace toolguard::sandbox
