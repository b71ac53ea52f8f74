#pragma once

#include "cmlink/cm/CmServerList.hpp"
#include "cmlink/proxy/Socks5ProxyConfig.hpp"
#include "cmlink/proxy/Socks5Tunnel.hpp"
#include "cmlink/transport/CmTransport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <variant>

namespace cmlink::cm {
class ServerSelector;
}

namespace cmlink::util {
class Random;
}

namespace cmlink::transport {

// Handlers receive a null exception_ptr and a valid transport on success, or a
// TransportError and an empty transport on failure.
using ConnectHandler = std::function<void(std::exception_ptr, CmTransport)>;
using StreamHandler = std::function<void(std::exception_ptr)>;

// Plain TCP connect to the target.
struct DirectConnect {
    void open(boost::beast::tcp_stream& stream,
              const proxy::TunnelTarget& target,
              std::chrono::seconds timeout,
              StreamHandler handler) const;
};

// TCP connect to the proxy followed by a SOCKS5 CONNECT to the target.
struct ProxiedConnect {
    proxy::Socks5ProxyConfig proxy;

    void open(boost::beast::tcp_stream& stream,
              const proxy::TunnelTarget& target,
              std::chrono::seconds timeout,
              StreamHandler handler) const;
};

using ConnectStrategy = std::variant<DirectConnect, ProxiedConnect>;

class TransportEstablisher {
public:
    TransportEstablisher(boost::asio::io_context& io,
                         boost::asio::ssl::context& sslContext,
                         util::Random& random,
                         std::chrono::seconds connectTimeout = std::chrono::seconds{30});

    // Opens wss://{endpoint}/cmsocket/, directly or through the SOCKS5 proxy.
    // The handler always runs on the I/O context, never inline.
    void asyncConnect(const cm::CmServer& server, const proxy::Socks5ProxyConfig* proxy, ConnectHandler handler);

    [[nodiscard]] boost::asio::io_context& context() noexcept { return io_; }

private:
    boost::asio::io_context& io_;
    boost::asio::ssl::context& sslContext_;
    util::Random& random_;
    std::chrono::seconds connectTimeout_;
};

// Picks a CM server on the worker pool, where the list refresh may block,
// then establishes the transport on the I/O context.
class CmConnector {
public:
    CmConnector(boost::asio::thread_pool& worker, cm::ServerSelector& selector, TransportEstablisher& establisher);

    void asyncConnect(ConnectHandler handler);
    void asyncConnect(const proxy::Socks5ProxyConfig& proxy, ConnectHandler handler);

private:
    void run(std::optional<proxy::Socks5ProxyConfig> proxy, ConnectHandler handler);

    boost::asio::thread_pool& worker_;
    cm::ServerSelector& selector_;
    TransportEstablisher& establisher_;
};

// TLS client context trusting the system store, with peer verification on.
boost::asio::ssl::context makeClientSslContext();

} // namespace cmlink::transport
