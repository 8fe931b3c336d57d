#pragma once

#include <string>

#include <boost/asio/ssl/context.hpp>

#include "net/http_transport.hpp"

namespace toolguard::net {

// HTTP/1.1 over Boost.Beast, TLS through OpenSSL. The peer certificate is
// verified against the URL hostname and SNI is sent for non-IP hosts, while
// the TCP connection only ever goes to the pinned addresses.
class BeastHttpTransport : public HttpTransport {
public:
    // Empty `ca_file` means the system default verify paths.
    explicit BeastHttpTransport(const std::string& ca_file = "");

    void Get(const ResolvedUrl& target,
             const HttpRequestOptions& options,
             const utils::CancellationToken& cancel,
             const HeadCallback& on_head,
             const BodyCallback& on_body) override;

private:
    boost::asio::ssl::context tls_context_;
};

}  // namespace toolguard::net
