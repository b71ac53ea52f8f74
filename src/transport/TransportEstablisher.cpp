#include "cmlink/transport/TransportEstablisher.hpp"

#include "cmlink/cm/ServerSelector.hpp"
#include "cmlink/proxy/ProxyError.hpp"
#include "cmlink/transport/TransportError.hpp"
#include "cmlink/transport/UpgradeRequest.hpp"
#include "cmlink/util/Logging.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/stream_base.hpp>
#include <openssl/ssl.h>

#include <memory>
#include <utility>

namespace cmlink::transport {
namespace {

constexpr std::uint16_t kDefaultWssPort = 443;

std::exception_ptr transportError(TransportError::Type type, const std::string& message) {
    return std::make_exception_ptr(TransportError(type, message));
}

// Maps whatever the stream strategy reported onto the transport taxonomy.
std::exception_ptr classifyStreamFailure(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const TransportError&) {
        return std::current_exception();
    } catch (const proxy::ProxyError& ex) {
        return transportError(TransportError::Type::proxy_tunnel, ex.what());
    } catch (const proxy::ProxyConfigError& ex) {
        return std::make_exception_ptr(fromProxyConfigError(ex));
    } catch (const std::exception& ex) {
        return transportError(TransportError::Type::connect_failed, ex.what());
    }
}

class ConnectOperation : public std::enable_shared_from_this<ConnectOperation> {
public:
    ConnectOperation(boost::asio::io_context& io,
                     boost::asio::ssl::context& sslContext,
                     UpgradeRequest upgrade,
                     std::string endpoint,
                     ConnectStrategy strategy,
                     std::chrono::seconds timeout,
                     ConnectHandler handler)
        : ws_(std::make_unique<WebSocketStream>(boost::asio::make_strand(io), sslContext))
        , upgrade_(std::move(upgrade))
        , endpoint_(std::move(endpoint))
        , strategy_(std::move(strategy))
        , timeout_(timeout)
        , handler_(std::move(handler)) {}

    void start() {
        proxy::TunnelTarget target{upgrade_.url.host, upgrade_.url.portOr(kDefaultWssPort)};
        auto& lowest = boost::beast::get_lowest_layer(*ws_);
        std::visit(
            [&](const auto& strategy) {
                strategy.open(lowest, target, timeout_, [self = shared_from_this()](std::exception_ptr error) {
                    self->onStreamOpened(std::move(error));
                });
            },
            strategy_);
    }

private:
    void onStreamOpened(std::exception_ptr error) {
        if (error) {
            finish(classifyStreamFailure(std::move(error)));
            return;
        }

        auto& tls = ws_->next_layer();
        if (!SSL_set_tlsext_host_name(tls.native_handle(), upgrade_.url.host.c_str())) {
            finish(transportError(TransportError::Type::handshake,
                                  "Failed to set SNI host name for " + upgrade_.url.host));
            return;
        }
        tls.set_verify_callback(boost::asio::ssl::host_name_verification(upgrade_.url.host));

        boost::beast::get_lowest_layer(*ws_).expires_after(timeout_);
        tls.async_handshake(boost::asio::ssl::stream_base::client,
            [self = shared_from_this()](const boost::system::error_code& ec) { self->onTlsHandshake(ec); });
    }

    void onTlsHandshake(const boost::system::error_code& ec) {
        if (ec) {
            finish(transportError(TransportError::Type::handshake,
                                  "TLS handshake with " + endpoint_ + " failed: " + ec.message()));
            return;
        }

        namespace websocket = boost::beast::websocket;
        boost::beast::get_lowest_layer(*ws_).expires_never();
        auto timeouts = websocket::stream_base::timeout::suggested(boost::beast::role_type::client);
        timeouts.handshake_timeout = timeout_;
        ws_->set_option(timeouts);

        // Beast writes and checks its own Sec-WebSocket-Key; everything else
        // comes from the prepared upgrade request.
        ws_->set_option(websocket::stream_base::decorator(
            [fields = upgrade_.request.base()](websocket::request_type& request) {
                for (const auto& field : fields) {
                    if (field.name() == boost::beast::http::field::sec_websocket_key) {
                        continue;
                    }
                    request.set(field.name_string(), field.value());
                }
            }));

        ws_->async_handshake(response_, upgrade_.host, upgrade_.url.target,
            [self = shared_from_this()](const boost::system::error_code& ec) { self->onUpgrade(ec); });
    }

    void onUpgrade(const boost::system::error_code& ec) {
        if (ec) {
            std::string message = "WebSocket upgrade with " + endpoint_ + " failed: " + ec.message();
            if (ec == boost::beast::websocket::error::upgrade_declined) {
                message += " (HTTP " + std::to_string(response_.result_int()) + ")";
            }
            finish(transportError(TransportError::Type::handshake, message));
            return;
        }

        ws_->binary(true);
        util::log(util::LogLevel::info, "Connected to CM " + endpoint_ +
                                            (std::holds_alternative<ProxiedConnect>(strategy_)
                                                 ? " via " + std::get<ProxiedConnect>(strategy_).proxy.toString()
                                                 : std::string{}));
        auto connection = std::make_shared<CmConnection>(std::move(ws_), endpoint_);
        auto handler = std::move(handler_);
        handler(nullptr, CmTransport(CmReadHalf(connection), CmWriteHalf(connection), endpoint_));
    }

    void finish(std::exception_ptr error) {
        if (ws_) {
            boost::system::error_code ignored;
            boost::beast::get_lowest_layer(*ws_).socket().close(ignored);
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "CM connect to " + endpoint_ + " failed: " + ex.what());
        }
        auto handler = std::move(handler_);
        handler(std::move(error), CmTransport{});
    }

    std::unique_ptr<WebSocketStream> ws_;
    UpgradeRequest upgrade_;
    std::string endpoint_;
    ConnectStrategy strategy_;
    std::chrono::seconds timeout_;
    ConnectHandler handler_;
    boost::beast::websocket::response_type response_;
};

} // namespace

void DirectConnect::open(boost::beast::tcp_stream& stream,
                         const proxy::TunnelTarget& target,
                         std::chrono::seconds timeout,
                         StreamHandler handler) const {
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(stream.get_executor());
    std::string label = target.host + ":" + std::to_string(target.port);
    resolver->async_resolve(target.host, std::to_string(target.port),
        [resolver, &stream, timeout, label, handler = std::move(handler)](
            const boost::system::error_code& ec, const boost::asio::ip::tcp::resolver::results_type& results) {
            if (ec) {
                handler(transportError(TransportError::Type::connect_failed,
                                       "Failed to resolve " + label + ": " + ec.message()));
                return;
            }
            stream.expires_after(timeout);
            stream.async_connect(results,
                [label, handler](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
                    if (ec) {
                        handler(transportError(TransportError::Type::connect_failed,
                                               "Failed to connect to " + label + ": " + ec.message()));
                        return;
                    }
                    handler(nullptr);
                });
        });
}

void ProxiedConnect::open(boost::beast::tcp_stream& stream,
                          const proxy::TunnelTarget& target,
                          std::chrono::seconds timeout,
                          StreamHandler handler) const {
    std::shared_ptr<proxy::Socks5Tunnel> tunnel;
    try {
        tunnel = proxy::Socks5Tunnel::create(stream, proxy, target, timeout);
    } catch (const proxy::ProxyConfigError&) {
        boost::asio::post(stream.get_executor(),
                          [handler, error = std::current_exception()]() { handler(error); });
        return;
    }
    tunnel->start(std::move(handler));
}

TransportEstablisher::TransportEstablisher(boost::asio::io_context& io,
                                           boost::asio::ssl::context& sslContext,
                                           util::Random& random,
                                           std::chrono::seconds connectTimeout)
    : io_(io)
    , sslContext_(sslContext)
    , random_(random)
    , connectTimeout_(connectTimeout) {}

void TransportEstablisher::asyncConnect(const cm::CmServer& server,
                                        const proxy::Socks5ProxyConfig* proxy,
                                        ConnectHandler handler) {
    std::exception_ptr error;
    std::shared_ptr<ConnectOperation> operation;
    try {
        ConnectStrategy strategy = DirectConnect{};
        if (proxy) {
            // Partial credentials are rejected before any socket exists.
            (void)proxy->authentication();
            strategy = ProxiedConnect{*proxy};
        }
        auto upgrade = buildUpgradeRequest(server.endpoint, random_);
        util::log(util::LogLevel::debug, "Connecting to " + upgrade.url.scheme + "://" + upgrade.host +
                                             upgrade.url.target);
        operation = std::make_shared<ConnectOperation>(io_, sslContext_, std::move(upgrade), server.endpoint,
                                                       std::move(strategy), connectTimeout_, handler);
    } catch (const TransportError&) {
        error = std::current_exception();
    } catch (const proxy::ProxyConfigError& ex) {
        error = std::make_exception_ptr(fromProxyConfigError(ex));
    }

    if (error) {
        boost::asio::post(io_, [handler = std::move(handler), error]() { handler(error, CmTransport{}); });
        return;
    }
    operation->start();
}

CmConnector::CmConnector(boost::asio::thread_pool& worker,
                         cm::ServerSelector& selector,
                         TransportEstablisher& establisher)
    : worker_(worker)
    , selector_(selector)
    , establisher_(establisher) {}

void CmConnector::asyncConnect(ConnectHandler handler) {
    run(std::nullopt, std::move(handler));
}

void CmConnector::asyncConnect(const proxy::Socks5ProxyConfig& proxy, ConnectHandler handler) {
    run(proxy, std::move(handler));
}

void CmConnector::run(std::optional<proxy::Socks5ProxyConfig> proxy, ConnectHandler handler) {
    boost::asio::post(worker_, [this, proxy = std::move(proxy), handler = std::move(handler)]() {
        const proxy::Socks5ProxyConfig* proxyPtr = proxy ? &*proxy : nullptr;
        cm::CmServer server;
        try {
            server = selector_.select(proxyPtr);
        } catch (const TransportError&) {
            boost::asio::post(establisher_.context(),
                              [handler, error = std::current_exception()]() { handler(error, CmTransport{}); });
            return;
        }
        establisher_.asyncConnect(server, proxyPtr, handler);
    });
}

boost::asio::ssl::context makeClientSslContext() {
    boost::asio::ssl::context context(boost::asio::ssl::context::tls_client);
    context.set_default_verify_paths();
    context.set_verify_mode(boost::asio::ssl::verify_peer);
    return context;
}

} // namespace cmlink::transport
