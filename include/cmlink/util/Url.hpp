#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cmlink::util {

class UrlError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct Url {
    std::string scheme;
    std::string username;
    std::optional<std::string> password;
    std::string host;
    std::optional<std::uint16_t> port;
    std::string target{"/"};

    // host[:port] without user-info; IPv6 hosts are bracketed.
    [[nodiscard]] std::string authority() const;
    [[nodiscard]] std::uint16_t portOr(std::uint16_t fallback) const noexcept;
};

// Parses scheme://[user[:password]@]host[:port][/target]. The host may be empty;
// callers decide whether that is acceptable.
Url parseUrl(std::string_view text);

std::string formatHost(std::string_view host);
std::string percentEncode(std::string_view value);
std::string percentDecode(std::string_view value);

} // namespace cmlink::util
