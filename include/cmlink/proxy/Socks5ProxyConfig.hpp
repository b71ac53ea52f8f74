#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cmlink::util {
class HttpClient;
}

namespace cmlink::proxy {

class ProxyConfigError : public std::runtime_error {
public:
    enum class Type {
        invalid_url,
        missing_host,
        unsupported_scheme,
        invalid_username,
        invalid_password,
        partial_credentials,
        client_build_failed,
    };

    ProxyConfigError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

private:
    Type type_;
};

struct ProxyCredentials {
    std::string username;
    std::string password;
};

/// SOCKS5 proxy definition. Immutable once built; the with* helpers return
/// modified copies.
///
/// remoteDns selects between socks5h (the proxy resolves the target name) and
/// socks5 (the client resolves it and sends an address).
class Socks5ProxyConfig {
public:
    Socks5ProxyConfig(std::string host, std::uint16_t port);

    /// Accepts socks5://[user[:pass]@]host[:port], socks5h://... or a bare
    /// host[:port], which means socks5h on port 1080.
    static Socks5ProxyConfig parse(std::string_view value);

    [[nodiscard]] Socks5ProxyConfig withRemoteDns(bool remoteDns) const;
    [[nodiscard]] Socks5ProxyConfig withCredentials(std::string username, std::string password) const;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool remoteDns() const noexcept { return remoteDns_; }

    /// Username is reported absent when it is empty.
    [[nodiscard]] std::pair<std::optional<std::string>, std::optional<std::string>> credentials() const;

    /// Both halves or nothing; throws ProxyConfigError(partial_credentials)
    /// when only one of them is set.
    [[nodiscard]] std::optional<ProxyCredentials> authentication() const;

    [[nodiscard]] std::string proxyUrl() const;
    [[nodiscard]] std::unique_ptr<util::HttpClient> buildHttpClient() const;
    [[nodiscard]] std::pair<std::string, std::uint16_t> proxyAddress() const { return {host_, port_}; }

    /// Display form; never contains the password.
    [[nodiscard]] std::string toString() const;

    bool operator==(const Socks5ProxyConfig& other) const = default;

private:
    [[nodiscard]] const char* scheme() const noexcept { return remoteDns_ ? "socks5h" : "socks5"; }

    std::string host_;
    std::uint16_t port_{};
    std::optional<std::string> username_;
    std::optional<std::string> password_;
    bool remoteDns_{true};
};

std::ostream& operator<<(std::ostream& os, const Socks5ProxyConfig& config);

} // namespace cmlink::proxy
