#include "net/beast_http_transport.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "errors/tool_error.hpp"
#include "utils/logging.hpp"

namespace toolguard::net {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

using errors::ToolError;
using errors::ToolErrorCode;

constexpr std::size_t kBodyChunkBytes = 16 * 1024;
constexpr std::uint32_t kHeaderLimitBytes = 64 * 1024;

template <typename Stream>
struct IsTlsStream : std::false_type {};

template <typename Next>
struct IsTlsStream<beast::ssl_stream<Next>> : std::true_type {};

std::string ToStdString(beast::string_view value) {
    return std::string(value.data(), value.size());
}

// Drives the io_context until the handler installed by `initiate` ran.
template <typename Initiate>
beast::error_code RunOp(asio::io_context& ioc, Initiate&& initiate) {
    bool done = false;
    beast::error_code result;
    initiate([&](const beast::error_code& ec, auto&&...) {
        result = ec;
        done = true;
    });
    ioc.restart();
    while (!done && ioc.run_one() > 0) {
    }
    if (!done) {
        result = asio::error::operation_aborted;
    }
    return result;
}

// One request/response on a fresh connection. `stage` names the step that
// failed, the same way the error text reads in the logs.
template <typename Stream>
class Exchange {
public:
    Exchange(asio::io_context& ioc,
             Stream& stream,
             const ResolvedUrl& target,
             const HttpRequestOptions& options,
             const utils::CancellationToken& cancel)
        : ioc_(ioc), stream_(stream), target_(target), options_(options), cancel_(cancel) {}

    void Run(const HeadCallback& on_head, const BodyCallback& on_body) {
        auto registration = cancel_.Subscribe([this] {
            asio::post(ioc_, [this] {
                aborted_ = true;
                beast::get_lowest_layer(stream_).cancel();
                beast::get_lowest_layer(stream_).close();
            });
        });

        Connect();
        if constexpr (IsTlsStream<Stream>::value) {
            Handshake();
        }
        SendRequest();
        ReadResponse(on_head, on_body);

        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(stream_).close();
    }

private:
    void Arm() {
        beast::get_lowest_layer(stream_).expires_at(options_.deadline);
    }

    void Check(const beast::error_code& ec) {
        if (aborted_ || cancel_.IsCancelled()) {
            throw ToolError(ToolErrorCode::kAborted, "Request aborted");
        }
        if (ec) {
            throw ToolError(ToolErrorCode::kFetchFailed, "Fetch failed",
                            {{"message", stage_ + ": " + ec.message()},
                             {"url", target_.ToString()}});
        }
    }

    void Connect() {
        stage_ = "connect";
        std::vector<tcp::endpoint> endpoints;
        const auto port = static_cast<unsigned short>(target_.GetUrl().EffectivePort());
        for (const auto& address : target_.Addresses()) {
            endpoints.emplace_back(address, port);
        }
        Arm();
        Check(RunOp(ioc_, [&](auto handler) {
            beast::get_lowest_layer(stream_).async_connect(endpoints, std::move(handler));
        }));
    }

    void Handshake() {
        stage_ = "sni";
        const auto& hostname = target_.Hostname();
        if (!target_.HostIsIp()) {
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), hostname.c_str())) {
                const auto err = static_cast<int>(::ERR_get_error());
                Check(beast::error_code(err, asio::error::get_ssl_category()));
            }
        }
        stream_.set_verify_callback(ssl::host_name_verification(hostname));

        stage_ = "tls_handshake";
        Arm();
        Check(RunOp(ioc_, [&](auto handler) {
            stream_.async_handshake(ssl::stream_base::client, std::move(handler));
        }));
    }

    void SendRequest() {
        stage_ = "write";
        http::request<http::empty_body> request{http::verb::get, target_.GetUrl().Target(), 11};
        request.set(http::field::host, target_.GetUrl().HostHeader());
        request.set(http::field::user_agent, options_.user_agent);
        request.set(http::field::accept, "*/*");
        request.set(http::field::connection, "close");
        Arm();
        Check(RunOp(ioc_, [&](auto handler) {
            http::async_write(stream_, request, std::move(handler));
        }));
    }

    void ReadResponse(const HeadCallback& on_head, const BodyCallback& on_body) {
        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.header_limit(kHeaderLimitBytes);
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

        stage_ = "read_header";
        Arm();
        Check(RunOp(ioc_, [&](auto handler) {
            http::async_read_header(stream_, buffer, parser, std::move(handler));
        }));

        const auto& message = parser.get();
        HttpResponseHead head;
        head.status = static_cast<int>(message.result_int());
        head.reason = ToStdString(message.reason());
        for (const auto& field : message) {
            head.headers.emplace_back(ToStdString(field.name_string()), ToStdString(field.value()));
        }
        if (!on_head(head)) {
            return;
        }

        stage_ = "read_body";
        std::array<char, kBodyChunkBytes> chunk{};
        while (!parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            Arm();
            auto ec = RunOp(ioc_, [&](auto handler) {
                http::async_read_some(stream_, buffer, parser, std::move(handler));
            });
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec == ssl::error::stream_truncated && parser.need_eof()) {
                // Servers commonly drop TLS without close_notify; for a body
                // delimited by connection close that is still the end of it.
                ec = {};
                parser.put_eof(ec);
            }
            Check(ec);
            const auto received = chunk.size() - parser.get().body().size;
            if (received > 0 && !on_body(chunk.data(), received)) {
                return;
            }
        }
    }

    asio::io_context& ioc_;
    Stream& stream_;
    const ResolvedUrl& target_;
    const HttpRequestOptions& options_;
    const utils::CancellationToken& cancel_;
    std::string stage_ = "init";
    bool aborted_ = false;
};

}  // namespace

BeastHttpTransport::BeastHttpTransport(const std::string& ca_file)
    : tls_context_(ssl::context::tls_client) {
    tls_context_.set_options(ssl::context::default_workarounds
                             | ssl::context::no_sslv2
                             | ssl::context::no_sslv3);
    tls_context_.set_verify_mode(ssl::verify_peer);
    try {
        if (ca_file.empty()) {
            tls_context_.set_default_verify_paths();
        } else {
            tls_context_.load_verify_file(ca_file);
        }
    } catch (const boost::system::system_error& ex) {
        throw ToolError(ToolErrorCode::kInternalError, "TLS setup failed",
                        {{"message", ex.what()}, {"caFile", ca_file}});
    }
}

void BeastHttpTransport::Get(const ResolvedUrl& target,
                             const HttpRequestOptions& options,
                             const utils::CancellationToken& cancel,
                             const HeadCallback& on_head,
                             const BodyCallback& on_body) {
    if (cancel.IsCancelled()) {
        throw ToolError(ToolErrorCode::kAborted, "Request aborted");
    }

    asio::io_context ioc;
    if (target.GetUrl().scheme == "https") {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, tls_context_);
        Exchange<beast::ssl_stream<beast::tcp_stream>> exchange(ioc, stream, target, options, cancel);
        exchange.Run(on_head, on_body);
    } else {
        beast::tcp_stream stream(ioc);
        Exchange<beast::tcp_stream> exchange(ioc, stream, target, options, cancel);
        exchange.Run(on_head, on_body);
    }
    utils::Log(utils::LogLevel::kDebug, "fetch", "request done", {{"url", target.ToString()}});
}

}  // namespace toolguard::net
