#include "cmlink/transport/UpgradeRequest.hpp"

#include "cmlink/transport/TransportError.hpp"
#include "cmlink/util/Base64.hpp"
#include "cmlink/util/Random.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include <algorithm>
#include <cctype>

namespace cmlink::transport {
namespace {

constexpr std::size_t kWebSocketKeyBytes = 16;

bool validTarget(std::string_view target) {
    return std::none_of(target.begin(), target.end(), [](unsigned char c) {
        return std::iscntrl(c) || std::isspace(c);
    });
}

} // namespace

std::string generateWebSocketKey(util::Random& random) {
    return util::base64Encode(random.bytes(kWebSocketKeyBytes));
}

std::string cmSocketUrl(std::string_view endpoint) {
    return "wss://" + std::string(endpoint) + "/cmsocket/";
}

UpgradeRequest buildUpgradeRequest(std::string_view endpoint, util::Random& random) {
    namespace http = boost::beast::http;

    UpgradeRequest upgrade;
    try {
        upgrade.url = util::parseUrl(cmSocketUrl(endpoint));
    } catch (const util::UrlError& ex) {
        throw TransportError(TransportError::Type::invalid_url,
                             "Invalid CM endpoint '" + std::string(endpoint) + "': " + ex.what());
    }
    if (upgrade.url.host.empty()) {
        throw TransportError(TransportError::Type::url_no_host_name,
                             "CM endpoint '" + std::string(endpoint) + "' has no host name");
    }
    if (!validTarget(upgrade.url.target)) {
        throw TransportError(TransportError::Type::request_build,
                             "CM endpoint '" + std::string(endpoint) + "' yields an invalid request target");
    }

    upgrade.host = upgrade.url.authority();
    upgrade.key = generateWebSocketKey(random);

    auto& request = upgrade.request;
    request.method(http::verb::get);
    request.target(upgrade.url.target);
    request.version(11);
    request.set(kClientMarkerHeader, kClientMarkerValue);
    request.set(http::field::host, upgrade.host);
    request.set(http::field::connection, "Upgrade");
    request.set(http::field::upgrade, "websocket");
    request.set(http::field::sec_websocket_version, "13");
    request.set(http::field::sec_websocket_key, upgrade.key);
    return upgrade;
}

} // namespace cmlink::transport
