#pragma once

#include <stdexcept>
#include <string>

namespace cmlink::proxy {

class ProxyError : public std::runtime_error {
public:
    enum class Type {
        connect_failed,
        authentication_required,
        authentication_failed,
        request_rejected,
        protocol_violation,
    };

    // status is the SOCKS5 reply code, or 0 when the proxy never answered.
    ProxyError(Type type, int status, const std::string& message)
        : std::runtime_error(message)
        , type_(type)
        , status_(status) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    Type type_;
    int status_;
};

} // namespace cmlink::proxy
