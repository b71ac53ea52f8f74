#pragma once

#include "cmlink/proxy/Socks5ProxyConfig.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cmlink::proxy {

struct TunnelTarget {
    std::string host;
    std::uint16_t port{};
};

// SOCKS5 CONNECT (RFC 1928) with optional username/password sub-negotiation
// (RFC 1929). On success the stream is connected to the proxy and every byte
// written to it is relayed to the target.
class Socks5Tunnel : public std::enable_shared_from_this<Socks5Tunnel> {
public:
    using Handler = std::function<void(std::exception_ptr)>;

    // Throws ProxyConfigError before touching the network when the proxy
    // carries only half of a credential pair.
    static std::shared_ptr<Socks5Tunnel> create(boost::beast::tcp_stream& stream,
                                                const Socks5ProxyConfig& proxy,
                                                TunnelTarget target,
                                                std::chrono::seconds timeout);

    Socks5Tunnel(boost::beast::tcp_stream& stream,
                 const Socks5ProxyConfig& proxy,
                 std::optional<ProxyCredentials> credentials,
                 TunnelTarget target,
                 std::chrono::seconds timeout);

    void start(Handler handler);

private:
    void onResolveProxy(const boost::system::error_code& ec,
                        const boost::asio::ip::tcp::resolver::results_type& results);
    void onConnect(const boost::system::error_code& ec);
    void onMethodSelected(const boost::system::error_code& ec);
    void sendAuthentication();
    void onAuthenticationReply(const boost::system::error_code& ec);
    void prepareConnectRequest();
    void onResolveTarget(const boost::system::error_code& ec,
                         const boost::asio::ip::tcp::resolver::results_type& results);
    void sendConnectRequest(const boost::asio::ip::address* address);
    void onReplyHeader(const boost::system::error_code& ec);
    void onReplyDomainLength(const boost::system::error_code& ec);
    void onReplyAddress(const boost::system::error_code& ec);

    using Step = void (Socks5Tunnel::*)(const boost::system::error_code&);

    void writeThenRead(std::size_t replySize, Step next);
    void read(std::size_t offset, std::size_t size, Step next);
    void fail(std::exception_ptr error);
    void failIo(const boost::system::error_code& ec, const char* step);
    void succeed();

    boost::beast::tcp_stream& stream_;
    boost::asio::ip::tcp::resolver resolver_;
    std::string proxyHost_;
    std::uint16_t proxyPort_{};
    bool remoteDns_{};
    std::optional<ProxyCredentials> credentials_;
    TunnelTarget target_;
    std::chrono::seconds timeout_;
    Handler handler_;

    std::vector<unsigned char> request_;
    std::array<unsigned char, 262> reply_{};
};

} // namespace cmlink::proxy
