#pragma once

#include "cmlink/proxy/Socks5ProxyConfig.hpp"
#include "cmlink/util/Url.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cmlink::util {

// HTTP/1.1 GET client used for directory lookups. Each request runs its own
// io_context on the calling thread and is abandoned once the timeout passes.
// When built with a proxy URL every request, plain or TLS, goes through a
// SOCKS5 tunnel.
class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::empty_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    HttpClient();

    // Throws proxy::ProxyConfigError(client_build_failed) when the URL is not a
    // usable SOCKS5 proxy URL.
    explicit HttpClient(const std::string& proxyUrl);

    [[nodiscard]] const std::optional<proxy::Socks5ProxyConfig>& proxy() const noexcept { return proxy_; }

    // Follows at most maxRedirects redirects. timeout bounds each request
    // including the tunnel and TLS handshake; expiry throws
    // boost::system::system_error(timed_out).
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     std::chrono::seconds timeout,
                     unsigned int maxRedirects = 3);

private:
    HttpResponse execute(HttpRequest request, const Url& url, std::chrono::seconds timeout);

    std::optional<proxy::Socks5ProxyConfig> proxy_;
    boost::asio::ssl::context sslContext_;
};

} // namespace cmlink::util
