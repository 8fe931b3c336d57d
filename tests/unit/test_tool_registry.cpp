#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>
#include "errors/tool_error.hpp"
#include "net/guarded_fetcher.hpp"
#include "net/http_transport.hpp"
#include "net/network_policy.hpp"
#include "tools/shell.hpp"
#include "tools/tool_registry.hpp"
#include "tools/web.hpp"

namespace {

using nlohmann::json;
using toolguard::tools::ToolRegistry;
using toolguard::tools::ToolResult;

class EchoTool : public toolguard::tools::Tool {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override { return "Echoes its arguments."; }
    std::string ParametersJson() const override { return R"({"type":"object"})"; }
    ToolResult Execute(const json& arguments, const toolguard::utils::CancellationToken& cancel) override {
        ++calls;
        return toolguard::tools::OkResult({{"echo", arguments}, {"cancelled", cancel.IsCancelled()}});
    }

    int calls = 0;
};

class OneHostResolver : public toolguard::net::HostResolver {
public:
    std::vector<boost::asio::ip::address> Resolve(const std::string& host) override {
        if (host != "example.com") {
            throw boost::system::system_error(boost::asio::error::host_not_found);
        }
        return {boost::asio::ip::make_address("93.184.216.34")};
    }
};

class StaticTransport : public toolguard::net::HttpTransport {
public:
    void Get(const toolguard::net::ResolvedUrl&,
             const toolguard::net::HttpRequestOptions&,
             const toolguard::utils::CancellationToken&,
             const toolguard::net::HeadCallback& on_head,
             const toolguard::net::BodyCallback& on_body) override {
        toolguard::net::HttpResponseHead head;
        head.status = 200;
        head.reason = "OK";
        head.headers = {{"Content-Type", "text/plain"}};
        if (on_head(head)) {
            const std::string body = "hello";
            on_body(body.data(), body.size());
        }
    }
};

json Parse(const ToolResult& result) {
    return json::parse(result.text);
}

TEST(ToolRegistryTest, UnknownToolIsAnErrorEnvelope) {
    ToolRegistry registry;
    const auto result = registry.Execute("shell", json::object());
    EXPECT_TRUE(result.is_error);
    const auto body = Parse(result);
    EXPECT_EQ(body["ok"], false);
    EXPECT_EQ(body["error"]["code"], "UNKNOWN_TOOL");
    EXPECT_EQ(body["error"]["message"], "Unknown tool: shell");
    EXPECT_FALSE(body["error"].contains("details"));
}

TEST(ToolRegistryTest, SuccessEnvelopeMergesThePayload) {
    ToolRegistry registry;
    auto echo = std::make_unique<EchoTool>();
    auto* echo_ptr = echo.get();
    registry.Register(std::move(echo));

    toolguard::utils::CancellationSource source;
    source.Cancel();
    const auto result = registry.Execute("echo", json{{"x", 1}}, source.Token());
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(echo_ptr->calls, 1);
    const auto body = Parse(result);
    EXPECT_EQ(body["ok"], true);
    EXPECT_EQ(body["echo"]["x"], 1);
    EXPECT_EQ(body["cancelled"], true);
    // Pretty-printed with two-space indentation.
    EXPECT_NE(result.text.find("\n  \"ok\": true"), std::string::npos);
}

TEST(ToolRegistryTest, DefinitionsAreSortedWithParsedSchemas) {
    ToolRegistry registry;
    toolguard::sandbox::SandboxOptions options;
    options.working_dir = "/workspace";
    registry.Register(std::make_unique<toolguard::tools::ExecTool>(options));
    registry.Register(std::make_unique<EchoTool>());

    EXPECT_TRUE(registry.Has("exec"));
    EXPECT_FALSE(registry.Has("fetch"));
    EXPECT_EQ(registry.Get("nope"), nullptr);
    EXPECT_EQ(registry.List(), (std::vector<std::string>{"echo", "exec"}));

    const auto definitions = registry.GetDefinitions();
    ASSERT_EQ(definitions.size(), 2u);
    EXPECT_EQ(definitions[0]["name"], "echo");
    const auto& exec = definitions[1];
    EXPECT_EQ(exec["name"], "exec");
    EXPECT_NE(exec["description"].get<std::string>().find("cwd=/workspace"), std::string::npos);
    EXPECT_EQ(exec["inputSchema"]["additionalProperties"], false);
    EXPECT_EQ(exec["inputSchema"]["required"], json::array({"command"}));
    EXPECT_EQ(exec["inputSchema"]["properties"]["command"]["enum"], json::array({"git", "npm", "node"}));
    EXPECT_EQ(exec["inputSchema"]["properties"]["timeoutMs"]["maximum"], 120000);
}

TEST(ToolRegistryTest, ExecToolReportsPolicyErrors) {
    ToolRegistry registry;
    toolguard::sandbox::SandboxOptions options;
    options.working_dir = "/nonexistent-toolguard-workspace";
    registry.Register(std::make_unique<toolguard::tools::ExecTool>(options));

    const auto bash = Parse(registry.Execute("exec", json{{"command", "bash"}, {"args", json::array({"-lc", "id"})}}));
    EXPECT_EQ(bash["ok"], false);
    EXPECT_EQ(bash["error"]["code"], "COMMAND_NOT_ALLOWED");

    const auto escape = Parse(registry.Execute("exec", json{{"command", "git"}, {"args", json::array({"-C", "/"})}}));
    EXPECT_EQ(escape["error"]["code"], "DISALLOWED_ARGUMENT");

    const auto shape = Parse(registry.Execute("exec", json{{"command", "node"}, {"cwd", "/"}}));
    EXPECT_EQ(shape["error"]["code"], "INVALID_INPUT");
    EXPECT_EQ(shape["error"]["details"]["field"], "cwd");
}

TEST(ToolRegistryTest, FetchToolWrapsOutcomesAndErrors) {
    OneHostResolver resolver;
    toolguard::net::NetworkPolicy policy(resolver);
    StaticTransport transport;
    toolguard::net::GuardedFetcher fetcher(policy, transport);
    ToolRegistry registry;
    registry.Register(std::make_unique<toolguard::tools::FetchTool>(fetcher));

    const auto ok = Parse(registry.Execute("fetch", json{{"url", "https://example.com"}}));
    EXPECT_EQ(ok["ok"], true);
    EXPECT_EQ(ok["status"], 200);
    EXPECT_EQ(ok["statusText"], "OK");
    EXPECT_EQ(ok["body"], "hello");
    EXPECT_EQ(ok["bytesRead"], 5);
    EXPECT_EQ(ok["truncated"], false);
    EXPECT_EQ(ok["headers"]["content-type"], "text/plain");
    EXPECT_EQ(ok["redirects"], json::array());

    const auto blocked = registry.Execute("fetch", json{{"url", "http://[::1]/"}});
    EXPECT_TRUE(blocked.is_error);
    const auto blocked_body = Parse(blocked);
    EXPECT_EQ(blocked_body["error"]["code"], "SSRF_BLOCKED");
    EXPECT_EQ(blocked_body["error"]["details"]["host"], "[::1]");

    const auto dns = Parse(registry.Execute("fetch", json{{"url", "https://missing.test"}}));
    EXPECT_EQ(dns["error"]["code"], "DNS_FAILED");

    const auto input = Parse(registry.Execute("fetch", json{{"url", "https://example.com"}, {"maxBytes", 5}}));
    EXPECT_EQ(input["error"]["code"], "INVALID_INPUT");
}

}  // namespace
