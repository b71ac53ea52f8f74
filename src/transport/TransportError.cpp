#include "cmlink/transport/TransportError.hpp"

namespace cmlink::transport {

const char* toString(TransportError::Type type) noexcept {
    switch (type) {
    case TransportError::Type::proxy_config: return "proxy_config";
    case TransportError::Type::client_build: return "client_build";
    case TransportError::Type::no_server_available: return "no_server_available";
    case TransportError::Type::server_list: return "server_list";
    case TransportError::Type::invalid_url: return "invalid_url";
    case TransportError::Type::url_no_host_name: return "url_no_host_name";
    case TransportError::Type::request_build: return "request_build";
    case TransportError::Type::connect_failed: return "connect_failed";
    case TransportError::Type::proxy_tunnel: return "proxy_tunnel";
    case TransportError::Type::handshake: return "handshake";
    case TransportError::Type::channel_closed: return "channel_closed";
    case TransportError::Type::decode: return "decode";
    case TransportError::Type::timeout: return "timeout";
    }
    return "unknown";
}

TransportError fromProxyConfigError(const proxy::ProxyConfigError& error) {
    auto type = error.type() == proxy::ProxyConfigError::Type::client_build_failed ? TransportError::Type::client_build
                                                                                   : TransportError::Type::proxy_config;
    return TransportError(type, error.what());
}

} // namespace cmlink::transport
