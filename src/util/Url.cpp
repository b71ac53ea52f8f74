#include "cmlink/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace cmlink::util {
namespace {

bool validScheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool validHost(std::string_view host) {
    return std::none_of(host.begin(), host.end(), [](unsigned char c) {
        return std::iscntrl(c) || std::isspace(c) ||
               std::string_view{"<>\"{}|\\^`[]@/?#"}.find(static_cast<char>(c)) != std::string_view::npos;
    });
}

std::optional<std::uint16_t> parsePort(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.size() > 5 || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw UrlError("invalid port number: " + std::string(text));
    }
    auto value = std::stoul(std::string(text));
    if (value > 65535) {
        throw UrlError("invalid port number: " + std::string(text));
    }
    return static_cast<std::uint16_t>(value);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string Url::authority() const {
    std::string value = formatHost(host);
    if (port) {
        value += ":" + std::to_string(*port);
    }
    return value;
}

std::uint16_t Url::portOr(std::uint16_t fallback) const noexcept {
    return port.value_or(fallback);
}

Url parseUrl(std::string_view text) {
    auto schemeEnd = text.find("://");
    if (schemeEnd == std::string_view::npos) {
        throw UrlError("URL missing scheme: " + std::string(text));
    }

    Url url;
    url.scheme = std::string(text.substr(0, schemeEnd));
    if (!validScheme(url.scheme)) {
        throw UrlError("invalid URL scheme: " + std::string(text));
    }
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    auto rest = text.substr(schemeEnd + 3);
    auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (authorityEnd != std::string_view::npos) {
        auto target = rest.substr(authorityEnd);
        url.target = target.front() == '/' ? std::string(target) : "/" + std::string(target);
    }

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        auto userInfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        auto colon = userInfo.find(':');
        url.username = percentDecode(userInfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            url.password = percentDecode(userInfo.substr(colon + 1));
        }
    }

    std::string_view portText;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw UrlError("unterminated IPv6 address: " + std::string(text));
        }
        url.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw UrlError("invalid authority: " + std::string(text));
            }
            portText = after.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        url.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            portText = authority.substr(colon + 1);
        }
        if (!validHost(url.host)) {
            throw UrlError("invalid host in URL: " + std::string(text));
        }
    }
    url.port = parsePort(portText);
    return url;
}

std::string formatHost(std::string_view host) {
    if (host.find(':') != std::string_view::npos) {
        return "[" + std::string(host) + "]";
    }
    return std::string(host);
}

std::string percentEncode(std::string_view value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string percentDecode(std::string_view value) {
    std::string output;
    output.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0) {
                output.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        output.push_back(value[i]);
    }
    return output;
}

} // namespace cmlink::util
