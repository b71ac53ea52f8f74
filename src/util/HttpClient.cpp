#include "cmlink/util/HttpClient.hpp"

#include "cmlink/proxy/Socks5Tunnel.hpp"
#include "cmlink/util/Logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/ssl.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>

namespace cmlink::util {
namespace {
constexpr unsigned kHttpVersion = 11;

std::uint16_t defaultPort(const Url& url) {
    return url.scheme == "https" ? 443 : 80;
}

bool isRedirect(boost::beast::http::status status) {
    switch (status) {
    case boost::beast::http::status::moved_permanently:
    case boost::beast::http::status::found:
    case boost::beast::http::status::see_other:
    case boost::beast::http::status::temporary_redirect:
    case boost::beast::http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

std::string combineLocation(const Url& base, const std::string& location) {
    std::string prefix = base.scheme + "://" + base.authority();
    if (location.empty()) {
        return prefix + base.target;
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    if (location.front() == '/') {
        return prefix + location;
    }
    auto slashPos = base.target.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : base.target.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

std::string hostHeader(const Url& url) {
    if (!url.port || *url.port == defaultPort(url)) {
        return formatHost(url.host);
    }
    return url.authority();
}

// One GET exchange: tunnel or direct connect, optional TLS, write, read.
class GetOperation : public std::enable_shared_from_this<GetOperation> {
public:
    GetOperation(boost::asio::io_context& io,
                 boost::asio::ssl::context& sslContext,
                 const std::optional<proxy::Socks5ProxyConfig>& proxy,
                 HttpClient::HttpRequest request,
                 Url url,
                 std::chrono::seconds timeout)
        : resolver_(io)
        , stream_(io, sslContext)
        , proxy_(proxy)
        , request_(std::move(request))
        , url_(std::move(url))
        , tls_(url_.scheme == "https")
        , timeout_(timeout) {}

    // Throws proxy::ProxyConfigError when the proxy credentials are unusable.
    void start() {
        if (proxy_) {
            auto tunnel = proxy::Socks5Tunnel::create(lowest(), *proxy_,
                                                      {url_.host, url_.portOr(defaultPort(url_))}, timeout_);
            tunnel->start([self = shared_from_this()](std::exception_ptr error) {
                if (error) {
                    self->fail(std::move(error));
                    return;
                }
                self->onConnected();
            });
            return;
        }

        resolver_.async_resolve(url_.host, std::to_string(url_.portOr(defaultPort(url_))),
            [self = shared_from_this()](const boost::system::error_code& ec,
                                        const boost::asio::ip::tcp::resolver::results_type& results) {
                self->onResolve(ec, results);
            });
    }

    void abort() {
        boost::system::error_code ignored;
        resolver_.cancel();
        lowest().socket().close(ignored);
    }

    [[nodiscard]] bool done() const noexcept { return done_; }

    HttpClient::HttpResponse result() {
        if (error_) {
            std::rethrow_exception(error_);
        }
        return std::move(response_);
    }

private:
    boost::beast::tcp_stream& lowest() { return boost::beast::get_lowest_layer(stream_); }

    void onResolve(const boost::system::error_code& ec,
                   const boost::asio::ip::tcp::resolver::results_type& results) {
        if (ec) {
            failIo(ec);
            return;
        }
        lowest().expires_after(timeout_);
        lowest().async_connect(results,
            [self = shared_from_this()](const boost::system::error_code& ec,
                                        const boost::asio::ip::tcp::endpoint&) {
                if (ec) {
                    self->failIo(ec);
                    return;
                }
                self->onConnected();
            });
    }

    void onConnected() {
        if (!tls_) {
            write();
            return;
        }
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
            fail(std::make_exception_ptr(std::runtime_error("Failed to set SNI host name")));
            return;
        }
        stream_.set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
        lowest().expires_after(timeout_);
        stream_.async_handshake(boost::asio::ssl::stream_base::client,
            [self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec) {
                    self->failIo(ec);
                    return;
                }
                self->write();
            });
    }

    void write() {
        lowest().expires_after(timeout_);
        auto next = [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                self->failIo(ec);
                return;
            }
            self->read();
        };
        if (tls_) {
            boost::beast::http::async_write(stream_, request_, std::move(next));
        } else {
            boost::beast::http::async_write(lowest(), request_, std::move(next));
        }
    }

    void read() {
        auto next = [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                self->failIo(ec);
                return;
            }
            self->onRead();
        };
        if (tls_) {
            boost::beast::http::async_read(stream_, buffer_, response_, std::move(next));
        } else {
            boost::beast::http::async_read(lowest(), buffer_, response_, std::move(next));
        }
    }

    void onRead() {
        if (!tls_) {
            boost::system::error_code ec;
            lowest().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::asio::error::not_connected) {
                log(LogLevel::debug, "HTTP socket shutdown failed: " + ec.message());
            }
            done_ = true;
            return;
        }
        lowest().expires_after(timeout_);
        stream_.async_shutdown([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
                log(LogLevel::debug, "TLS shutdown failed: " + ec.message());
            }
            self->done_ = true;
        });
    }

    void failIo(const boost::system::error_code& ec) {
        fail(std::make_exception_ptr(boost::system::system_error(ec, "HTTP request to " + url_.host)));
    }

    void fail(std::exception_ptr error) {
        boost::system::error_code ignored;
        lowest().socket().close(ignored);
        error_ = std::move(error);
        done_ = true;
    }

    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;
    std::optional<proxy::Socks5ProxyConfig> proxy_;
    HttpClient::HttpRequest request_;
    Url url_;
    bool tls_;
    std::chrono::seconds timeout_;
    boost::beast::flat_buffer buffer_;
    HttpClient::HttpResponse response_;
    std::exception_ptr error_;
    bool done_{false};
};

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

HttpClient::HttpClient(const std::string& proxyUrl)
    : HttpClient() {
    try {
        proxy_ = proxy::Socks5ProxyConfig::parse(proxyUrl);
    } catch (const proxy::ProxyConfigError& ex) {
        throw proxy::ProxyConfigError(proxy::ProxyConfigError::Type::client_build_failed,
                                      std::string{"Failed to build HTTP client with SOCKS5 proxy: "} + ex.what());
    }
}

HttpClient::HttpResponse HttpClient::execute(HttpRequest request, const Url& url, std::chrono::seconds timeout) {
    request.version(kHttpVersion);
    request.set(boost::beast::http::field::host, hostHeader(url));
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);

    boost::asio::io_context local;
    auto operation = std::make_shared<GetOperation>(local, sslContext_, proxy_, std::move(request), url, timeout);
    operation->start();
    local.run_for(timeout);

    if (!operation->done()) {
        operation->abort();
        throw boost::system::system_error(make_error_code(boost::asio::error::timed_out),
                                          "HTTP request to " + url.host + " exceeded " +
                                              std::to_string(timeout.count()) + "s");
    }
    return operation->result();
}

HttpClient::HttpResponse HttpClient::get(const std::string& url,
                                         const std::vector<Header>& headers,
                                         std::chrono::seconds timeout,
                                         unsigned int maxRedirects) {
    std::string currentUrl = url;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        Url parsed = parseUrl(currentUrl);
        if (parsed.scheme != "http" && parsed.scheme != "https") {
            throw std::invalid_argument("Unsupported URL scheme for HTTP fetch: " + currentUrl);
        }
        if (parsed.host.empty()) {
            throw std::invalid_argument("URL missing host: " + currentUrl);
        }

        HttpRequest request{boost::beast::http::verb::get, parsed.target, kHttpVersion};
        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        log(LogLevel::trace, "GET " + currentUrl + (proxy_ ? " via " + proxy_->toString() : std::string{}));
        auto response = execute(std::move(request), parsed, timeout);

        if (!isRedirect(response.result())) {
            return response;
        }
        auto locationIt = response.base().find(boost::beast::http::field::location);
        if (locationIt == response.base().end()) {
            return response;
        }
        currentUrl = combineLocation(parsed, std::string(locationIt->value()));
    }

    throw std::runtime_error("Maximum redirect count exceeded for " + url);
}

} // namespace cmlink::util
