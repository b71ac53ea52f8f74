#include "cmlink/proxy/Socks5Tunnel.hpp"

#include "cmlink/proxy/ProxyError.hpp"
#include "cmlink/util/Logging.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <utility>

namespace cmlink::proxy {
namespace {

constexpr unsigned char kVersion = 0x05;
constexpr unsigned char kAuthVersion = 0x01;
constexpr unsigned char kMethodNone = 0x00;
constexpr unsigned char kMethodPassword = 0x02;
constexpr unsigned char kMethodRejected = 0xFF;
constexpr unsigned char kCommandConnect = 0x01;
constexpr unsigned char kAddressIpv4 = 0x01;
constexpr unsigned char kAddressDomain = 0x03;
constexpr unsigned char kAddressIpv6 = 0x04;

const char* replyText(unsigned char code) {
    switch (code) {
    case 0x01: return "general SOCKS server failure";
    case 0x02: return "connection not allowed by ruleset";
    case 0x03: return "network unreachable";
    case 0x04: return "host unreachable";
    case 0x05: return "connection refused";
    case 0x06: return "TTL expired";
    case 0x07: return "command not supported";
    case 0x08: return "address type not supported";
    default:   return "unknown SOCKS5 reply";
    }
}

std::exception_ptr proxyError(ProxyError::Type type, int status, const std::string& message) {
    return std::make_exception_ptr(ProxyError(type, status, message));
}

} // namespace

std::shared_ptr<Socks5Tunnel> Socks5Tunnel::create(boost::beast::tcp_stream& stream,
                                                   const Socks5ProxyConfig& proxy,
                                                   TunnelTarget target,
                                                   std::chrono::seconds timeout) {
    auto credentials = proxy.authentication();
    if (credentials && credentials->username.size() > 255) {
        throw ProxyConfigError(ProxyConfigError::Type::invalid_username, "SOCKS5 username is limited to 255 bytes");
    }
    if (credentials && credentials->password.size() > 255) {
        throw ProxyConfigError(ProxyConfigError::Type::invalid_password, "SOCKS5 password is limited to 255 bytes");
    }
    if (target.host.size() > 255) {
        throw ProxyConfigError(ProxyConfigError::Type::invalid_url, "SOCKS5 target host name is too long");
    }
    return std::make_shared<Socks5Tunnel>(stream, proxy, std::move(credentials), std::move(target), timeout);
}

Socks5Tunnel::Socks5Tunnel(boost::beast::tcp_stream& stream,
                           const Socks5ProxyConfig& proxy,
                           std::optional<ProxyCredentials> credentials,
                           TunnelTarget target,
                           std::chrono::seconds timeout)
    : stream_(stream)
    , resolver_(stream.get_executor())
    , proxyHost_(proxy.host())
    , proxyPort_(proxy.port())
    , remoteDns_(proxy.remoteDns())
    , credentials_(std::move(credentials))
    , target_(std::move(target))
    , timeout_(timeout) {}

void Socks5Tunnel::start(Handler handler) {
    handler_ = std::move(handler);
    resolver_.async_resolve(proxyHost_, std::to_string(proxyPort_),
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    const boost::asio::ip::tcp::resolver::results_type& results) {
            self->onResolveProxy(ec, results);
        });
}

void Socks5Tunnel::onResolveProxy(const boost::system::error_code& ec,
                                  const boost::asio::ip::tcp::resolver::results_type& results) {
    if (ec) {
        failIo(ec, "resolve proxy");
        return;
    }
    stream_.expires_after(timeout_);
    stream_.async_connect(results,
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    const boost::asio::ip::tcp::endpoint&) {
            self->onConnect(ec);
        });
}

void Socks5Tunnel::onConnect(const boost::system::error_code& ec) {
    if (ec) {
        failIo(ec, "connect to proxy");
        return;
    }
    if (credentials_) {
        request_ = {kVersion, 2, kMethodNone, kMethodPassword};
    } else {
        request_ = {kVersion, 1, kMethodNone};
    }
    writeThenRead(2, &Socks5Tunnel::onMethodSelected);
}

void Socks5Tunnel::onMethodSelected(const boost::system::error_code& ec) {
    if (ec) {
        failIo(ec, "method selection");
        return;
    }
    if (reply_[0] != kVersion) {
        fail(proxyError(ProxyError::Type::protocol_violation, 0, "SOCKS5 proxy answered with an unexpected version"));
        return;
    }
    switch (reply_[1]) {
    case kMethodNone:
        prepareConnectRequest();
        return;
    case kMethodPassword:
        if (!credentials_) {
            fail(proxyError(ProxyError::Type::authentication_required, 0,
                            "SOCKS5 proxy requires username/password authentication"));
            return;
        }
        sendAuthentication();
        return;
    case kMethodRejected:
        fail(proxyError(ProxyError::Type::authentication_required, 0,
                        "SOCKS5 proxy rejected every offered authentication method"));
        return;
    default:
        fail(proxyError(ProxyError::Type::protocol_violation, 0,
                        "SOCKS5 proxy selected an authentication method that was not offered"));
        return;
    }
}

void Socks5Tunnel::sendAuthentication() {
    const auto& username = credentials_->username;
    const auto& password = credentials_->password;
    request_.clear();
    request_.push_back(kAuthVersion);
    request_.push_back(static_cast<unsigned char>(username.size()));
    request_.insert(request_.end(), username.begin(), username.end());
    request_.push_back(static_cast<unsigned char>(password.size()));
    request_.insert(request_.end(), password.begin(), password.end());
    writeThenRead(2, &Socks5Tunnel::onAuthenticationReply);
}

void Socks5Tunnel::onAuthenticationReply(const boost::system::error_code& ec) {
    if (ec) {
        failIo(ec, "authentication");
        return;
    }
    if (reply_[0] != kAuthVersion) {
        fail(proxyError(ProxyError::Type::protocol_violation, 0,
                        "SOCKS5 proxy answered authentication with an unexpected version"));
        return;
    }
    if (reply_[1] != 0x00) {
        fail(proxyError(ProxyError::Type::authentication_failed, reply_[1],
                        "SOCKS5 proxy rejected the supplied credentials"));
        return;
    }
    prepareConnectRequest();
}

void Socks5Tunnel::prepareConnectRequest() {
    boost::system::error_code parseError;
    auto literal = boost::asio::ip::make_address(target_.host, parseError);
    if (!parseError) {
        sendConnectRequest(&literal);
        return;
    }
    if (remoteDns_) {
        sendConnectRequest(nullptr);
        return;
    }
    resolver_.async_resolve(target_.host, std::to_string(target_.port),
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    const boost::asio::ip::tcp::resolver::results_type& results) {
            self->onResolveTarget(ec, results);
        });
}

void Socks5Tunnel::onResolveTarget(const boost::system::error_code& ec,
                                   const boost::asio::ip::tcp::resolver::results_type& results) {
    if (ec || results.empty()) {
        failIo(ec ? ec : boost::system::error_code{boost::asio::error::host_not_found}, "resolve target");
        return;
    }
    auto address = results.begin()->endpoint().address();
    sendConnectRequest(&address);
}

void Socks5Tunnel::sendConnectRequest(const boost::asio::ip::address* address) {
    request_ = {kVersion, kCommandConnect, 0x00};
    if (address == nullptr) {
        request_.push_back(kAddressDomain);
        request_.push_back(static_cast<unsigned char>(target_.host.size()));
        request_.insert(request_.end(), target_.host.begin(), target_.host.end());
    } else if (address->is_v4()) {
        request_.push_back(kAddressIpv4);
        auto bytes = address->to_v4().to_bytes();
        request_.insert(request_.end(), bytes.begin(), bytes.end());
    } else {
        request_.push_back(kAddressIpv6);
        auto bytes = address->to_v6().to_bytes();
        request_.insert(request_.end(), bytes.begin(), bytes.end());
    }
    request_.push_back(static_cast<unsigned char>(target_.port >> 8));
    request_.push_back(static_cast<unsigned char>(target_.port & 0xFF));

    util::log(util::LogLevel::debug,
              "SOCKS5 CONNECT " + target_.host + ":" + std::to_string(target_.port) + " via " +
                  proxyHost_ + ":" + std::to_string(proxyPort_));
    writeThenRead(4, &Socks5Tunnel::onReplyHeader);
}

void Socks5Tunnel::onReplyHeader(const boost::system::error_code& ec) {
    if (ec) {
        failIo(ec, "connect request");
        return;
    }
    if (reply_[0] != kVersion) {
        fail(proxyError(ProxyError::Type::protocol_violation, 0, "SOCKS5 proxy answered with an unexpected version"));
        return;
    }
    if (reply_[1] != 0x00) {
        fail(proxyError(ProxyError::Type::request_rejected, reply_[1],
                        std::string{"SOCKS5 proxy refused the tunnel: "} + replyText(reply_[1])));
        return;
    }
    switch (reply_[3]) {
    case kAddressIpv4:
        read(4, 4 + 2, &Socks5Tunnel::onReplyAddress);
        return;
    case kAddressIpv6:
        read(4, 16 + 2, &Socks5Tunnel::onReplyAddress);
        return;
    case kAddressDomain:
        read(4, 1, &Socks5Tunnel::onReplyDomainLength);
        return;
    default:
        fail(proxyError(ProxyError::Type::protocol_violation, 0, "SOCKS5 proxy sent an unknown address type"));
        return;
    }
}

void Socks5Tunnel::onReplyDomainLength(const boost::system::error_code& ec) {
    if (ec) {
        failIo(ec, "connect reply");
        return;
    }
    read(5, static_cast<std::size_t>(reply_[4]) + 2, &Socks5Tunnel::onReplyAddress);
}

void Socks5Tunnel::onReplyAddress(const boost::system::error_code& ec) {
    if (ec) {
        failIo(ec, "connect reply");
        return;
    }
    succeed();
}

void Socks5Tunnel::writeThenRead(std::size_t replySize, Step next) {
    stream_.expires_after(timeout_);
    boost::asio::async_write(stream_, boost::asio::buffer(request_),
        [self = shared_from_this(), replySize, next](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                ((*self).*next)(ec);
                return;
            }
            self->read(0, replySize, next);
        });
}

void Socks5Tunnel::read(std::size_t offset, std::size_t size, Step next) {
    stream_.expires_after(timeout_);
    boost::asio::async_read(stream_, boost::asio::buffer(reply_.data() + offset, size),
        [self = shared_from_this(), next](const boost::system::error_code& ec, std::size_t) {
            ((*self).*next)(ec);
        });
}

void Socks5Tunnel::fail(std::exception_ptr error) {
    boost::system::error_code ignored;
    stream_.socket().close(ignored);
    auto handler = std::move(handler_);
    handler(std::move(error));
}

void Socks5Tunnel::failIo(const boost::system::error_code& ec, const char* step) {
    fail(proxyError(ProxyError::Type::connect_failed, 0,
                    "SOCKS5 tunnel via " + proxyHost_ + ":" + std::to_string(proxyPort_) + " failed during " +
                        step + ": " + ec.message()));
}

void Socks5Tunnel::succeed() {
    stream_.expires_never();
    auto handler = std::move(handler_);
    handler(nullptr);
}

} // namespace cmlink::proxy
