#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "errors/tool_error.hpp"
#include "sandbox/command_policy.hpp"

namespace {

using toolguard::errors::ToolError;
using toolguard::errors::ToolErrorCode;
using toolguard::sandbox::AllowedCommand;
using toolguard::sandbox::CommandPolicy;

void ExpectDenied(AllowedCommand command, const std::vector<std::string>& args,
                  const std::string& shown, const std::string& reason) {
    try {
        CommandPolicy::ValidateArguments(command, args);
        ADD_FAILURE() << "expected denial for " << shown;
    } catch (const ToolError& ex) {
        EXPECT_EQ(ex.Code(), ToolErrorCode::kDisallowedArgument);
        EXPECT_EQ(std::string(ex.what()), "Disallowed argument: " + shown);
        EXPECT_EQ(ex.Details()["reason"], reason);
    }
}

TEST(CommandPolicyTest, OnlyAllowlistedCommands) {
    EXPECT_EQ(CommandPolicy::RequireAllowed("git"), AllowedCommand::kGit);
    EXPECT_EQ(CommandPolicy::RequireAllowed("npm"), AllowedCommand::kNpm);
    EXPECT_EQ(CommandPolicy::RequireAllowed("node"), AllowedCommand::kNode);
    for (const auto* name : {"bash", "sh", "Git", "/usr/bin/git", "", "node "}) {
        try {
            CommandPolicy::RequireAllowed(name);
            ADD_FAILURE() << "accepted " << name;
        } catch (const ToolError& ex) {
            EXPECT_EQ(ex.Code(), ToolErrorCode::kCommandNotAllowed);
            EXPECT_EQ(std::string(ex.what()), "command must be one of: git, npm, node");
            EXPECT_EQ(ex.Details()["allowed"].size(), 3u);
        }
    }
}

TEST(CommandPolicyTest, GitDirectoryOverridesDenied) {
    ExpectDenied(AllowedCommand::kGit, {"-C", "/"}, "-C", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"-C/tmp", "status"}, "-C/tmp", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"--git-dir=/x/.git", "log"}, "--git-dir=/x/.git", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"--work-tree", "/x"}, "--work-tree", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"-c", "core.worktree=/x", "status"},
                 "-c core.worktree=/x", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"-c", "Core.Worktree=/x"}, "-c Core.Worktree=/x", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"-ccore.worktree=/x"}, "-ccore.worktree=/x", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"--config-env=core.worktree=VAR"},
                 "--config-env=core.worktree=VAR", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"init", "--separate-git-dir=/tmp/g"},
                 "--separate-git-dir=/tmp/g", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"clone", "--separate-git-dir", "/tmp/g", "repo"},
                 "--separate-git-dir", "cwd override");
    ExpectDenied(AllowedCommand::kGit, {"init", "--separate=/tmp/g"}, "--separate=/tmp/g", "cwd override");
}

TEST(CommandPolicyTest, NpmDirectoryAndGlobalOverridesDenied) {
    ExpectDenied(AllowedCommand::kNpm, {"install", "--prefix", "/x"}, "--prefix", "cwd override");
    ExpectDenied(AllowedCommand::kNpm, {"--prefix=/x", "ls"}, "--prefix=/x", "cwd override");
    ExpectDenied(AllowedCommand::kNpm, {"-C", "/x"}, "-C", "cwd override");
    ExpectDenied(AllowedCommand::kNpm, {"install", "-g", "left-pad"}, "-g", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"--global"}, "--global", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"--location=global"}, "--location=global", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"--location", "global"}, "--location global", "global location");
}

TEST(CommandPolicyTest, NpmAbbreviatedAndBundledFlagsDenied) {
    ExpectDenied(AllowedCommand::kNpm, {"ls", "--prefi=/tmp/x"}, "--prefi=/tmp/x", "cwd override");
    ExpectDenied(AllowedCommand::kNpm, {"--pref", "/x", "ls"}, "--pref", "cwd override");
    ExpectDenied(AllowedCommand::kNpm, {"--PREFIX=/x"}, "--PREFIX=/x", "cwd override");
    ExpectDenied(AllowedCommand::kNpm, {"install", "--glob"}, "--glob", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"install", "--global=true"}, "--global=true", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"install", "-gd", "left-pad"}, "-gd", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"install", "-dg", "left-pad"}, "-dg", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"install", "-g=true"}, "-g=true", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"--locat=global"}, "--locat=global", "global location");
    ExpectDenied(AllowedCommand::kNpm, {"--loc", "Global", "ls"}, "--loc Global", "global location");
}

TEST(CommandPolicyTest, OrdinaryArgumentsAccepted) {
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kGit, {"status", "--short"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kGit, {"-c", "user.name=x", "commit"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kNpm, {"install", "--location", "project"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kNpm, {"run", "gtest"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kNpm, {"install", "--loc=project"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kNpm, {"install", "-D", "--prefer-offline"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kNpm, {"ls", "--long", "--loglevel=warn"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kGit, {"log", "-g"}));
    EXPECT_NO_THROW(CommandPolicy::ValidateArguments(AllowedCommand::kNode, {"-C", "/", "-e", "1"}));
}

}  // namespace
