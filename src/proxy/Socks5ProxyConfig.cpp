#include "cmlink/proxy/Socks5ProxyConfig.hpp"

#include "cmlink/util/HttpClient.hpp"
#include "cmlink/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>

namespace cmlink::proxy {
namespace {

constexpr std::uint16_t kDefaultProxyPort = 1080;

bool hasControlCharacters(std::string_view value) {
    return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::iscntrl(c); });
}

} // namespace

Socks5ProxyConfig::Socks5ProxyConfig(std::string host, std::uint16_t port)
    : host_(std::move(host))
    , port_(port) {}

Socks5ProxyConfig Socks5ProxyConfig::parse(std::string_view value) {
    util::Url url;
    try {
        if (value.find("://") != std::string_view::npos) {
            url = util::parseUrl(value);
        } else {
            url = util::parseUrl("socks5h://" + std::string(value));
        }
    } catch (const util::UrlError& ex) {
        throw ProxyConfigError(ProxyConfigError::Type::invalid_url,
                               std::string{"Invalid SOCKS5 proxy URL: "} + ex.what());
    }

    if (url.scheme != "socks5" && url.scheme != "socks5h") {
        throw ProxyConfigError(ProxyConfigError::Type::unsupported_scheme,
                               "Scheme " + url.scheme + " is not supported for SOCKS5 proxy URLs");
    }
    if (url.host.empty()) {
        throw ProxyConfigError(ProxyConfigError::Type::missing_host, "SOCKS5 proxy URL does not contain host");
    }

    Socks5ProxyConfig config(url.host, url.portOr(kDefaultProxyPort));
    config.remoteDns_ = url.scheme == "socks5h";
    if (!url.username.empty()) {
        config.username_ = url.username;
    }
    config.password_ = url.password;
    return config;
}

Socks5ProxyConfig Socks5ProxyConfig::withRemoteDns(bool remoteDns) const {
    Socks5ProxyConfig copy = *this;
    copy.remoteDns_ = remoteDns;
    return copy;
}

Socks5ProxyConfig Socks5ProxyConfig::withCredentials(std::string username, std::string password) const {
    Socks5ProxyConfig copy = *this;
    copy.username_ = std::move(username);
    copy.password_ = std::move(password);
    return copy;
}

std::pair<std::optional<std::string>, std::optional<std::string>> Socks5ProxyConfig::credentials() const {
    std::optional<std::string> username;
    if (username_ && !username_->empty()) {
        username = username_;
    }
    return {username, password_};
}

std::optional<ProxyCredentials> Socks5ProxyConfig::authentication() const {
    auto [username, password] = credentials();
    if (username && password) {
        return ProxyCredentials{*username, *password};
    }
    if (username || password) {
        throw ProxyConfigError(ProxyConfigError::Type::partial_credentials,
                               "SOCKS5 proxy auth requires both username and password");
    }
    return std::nullopt;
}

std::string Socks5ProxyConfig::proxyUrl() const {
    if (host_.empty()) {
        throw ProxyConfigError(ProxyConfigError::Type::invalid_url, "Invalid SOCKS5 proxy URL: empty host");
    }

    std::string userInfo;
    if (username_ && !username_->empty()) {
        if (hasControlCharacters(*username_)) {
            throw ProxyConfigError(ProxyConfigError::Type::invalid_username, "Invalid username for SOCKS5 proxy");
        }
        userInfo = util::percentEncode(*username_);
    }
    if (password_) {
        if (hasControlCharacters(*password_)) {
            throw ProxyConfigError(ProxyConfigError::Type::invalid_password, "Invalid password for SOCKS5 proxy");
        }
        userInfo += ":" + util::percentEncode(*password_);
    }

    std::string url = std::string{scheme()} + "://";
    if (!userInfo.empty()) {
        url += userInfo + "@";
    }
    url += util::formatHost(host_) + ":" + std::to_string(port_);

    try {
        auto parsed = util::parseUrl(url);
        if (parsed.host.empty()) {
            throw util::UrlError("empty host");
        }
    } catch (const util::UrlError& ex) {
        throw ProxyConfigError(ProxyConfigError::Type::invalid_url,
                               std::string{"Invalid SOCKS5 proxy URL: "} + ex.what());
    }
    return url;
}

std::unique_ptr<util::HttpClient> Socks5ProxyConfig::buildHttpClient() const {
    return std::make_unique<util::HttpClient>(proxyUrl());
}

std::string Socks5ProxyConfig::toString() const {
    auto username = credentials().first;
    std::string text = std::string{scheme()} + "://";
    if (username) {
        text += *username + ":***@";
    }
    text += host_ + ":" + std::to_string(port_);
    return text;
}

std::ostream& operator<<(std::ostream& os, const Socks5ProxyConfig& config) {
    return os << config.toString();
}

} // namespace cmlink::proxy
