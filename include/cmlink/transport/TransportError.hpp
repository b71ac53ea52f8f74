#pragma once

#include "cmlink/proxy/Socks5ProxyConfig.hpp"

#include <stdexcept>
#include <string>

namespace cmlink::transport {

class TransportError : public std::runtime_error {
public:
    enum class Type {
        proxy_config,
        client_build,
        no_server_available,
        server_list,
        invalid_url,
        url_no_host_name,
        request_build,
        connect_failed,
        proxy_tunnel,
        handshake,
        channel_closed,
        decode,
        timeout,
    };

    TransportError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    // Connection level failures where another CM endpoint may succeed.
    [[nodiscard]] bool retryable() const noexcept {
        return type_ == Type::connect_failed || type_ == Type::proxy_tunnel || type_ == Type::handshake ||
               type_ == Type::timeout;
    }

private:
    Type type_;
};

const char* toString(TransportError::Type type) noexcept;

TransportError fromProxyConfigError(const proxy::ProxyConfigError& error);

} // namespace cmlink::transport
