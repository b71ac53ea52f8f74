#pragma once

#include "cmlink/util/Url.hpp"

#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>

#include <string>
#include <string_view>

namespace cmlink::util {
class Random;
}

namespace cmlink::transport {

inline constexpr char kClientMarkerHeader[] = "X-Cmlink-Client";
inline constexpr char kClientMarkerValue[] = "cmlink/1.0";

struct UpgradeRequest {
    util::Url url;
    // Host header value: URL authority without user-info.
    std::string host;
    // Sec-WebSocket-Key of the prepared request. The handshake in
    // TransportEstablisher lets Beast generate and check its own key, so this
    // value never goes on the wire.
    std::string key;
    boost::beast::http::request<boost::beast::http::empty_body> request;
};

// base64 of 16 random bytes (RFC 6455 section 4.1).
std::string generateWebSocketKey(util::Random& random);

std::string cmSocketUrl(std::string_view endpoint);

// Throws TransportError: invalid_url, url_no_host_name or request_build.
UpgradeRequest buildUpgradeRequest(std::string_view endpoint, util::Random& random);

} // namespace cmlink::transport
