#include "cmlink/transport/TransportError.hpp"
#include "cmlink/transport/UpgradeRequest.hpp"
#include "cmlink/util/Base64.hpp"
#include "cmlink/util/Random.hpp"

#include <boost/beast/http/field.hpp>
#include <gtest/gtest.h>

using namespace cmlink;
using transport::TransportError;

namespace {

TransportError::Type buildErrorType(const std::string& endpoint) {
    util::Random random{7};
    try {
        (void)transport::buildUpgradeRequest(endpoint, random);
    } catch (const TransportError& ex) {
        return ex.type();
    }
    ADD_FAILURE() << "expected endpoint '" << endpoint << "' to be rejected";
    return TransportError::Type::request_build;
}

} // namespace

TEST(UpgradeRequestTest, BuildsCmSocketUrl) {
    EXPECT_EQ(transport::cmSocketUrl("cm1.example.net:443"), "wss://cm1.example.net:443/cmsocket/");
}

TEST(UpgradeRequestTest, CarriesWebSocketHeaders) {
    namespace http = boost::beast::http;
    util::Random random{1};
    auto upgrade = transport::buildUpgradeRequest("cm1.example.net:27020", random);

    EXPECT_EQ(upgrade.url.host, "cm1.example.net");
    EXPECT_EQ(upgrade.url.portOr(443), 27020);
    EXPECT_EQ(upgrade.url.target, "/cmsocket/");
    EXPECT_EQ(upgrade.host, "cm1.example.net:27020");

    const auto& request = upgrade.request;
    EXPECT_EQ(request.method(), http::verb::get);
    EXPECT_EQ(request.target(), "/cmsocket/");
    EXPECT_EQ(request[http::field::connection], "Upgrade");
    EXPECT_EQ(request[http::field::upgrade], "websocket");
    EXPECT_EQ(request[http::field::sec_websocket_version], "13");
    EXPECT_EQ(request[http::field::host], "cm1.example.net:27020");
    EXPECT_EQ(request[http::field::sec_websocket_key], upgrade.key);
    EXPECT_EQ(request[transport::kClientMarkerHeader], transport::kClientMarkerValue);
}

TEST(UpgradeRequestTest, KeyIsSixteenRandomBytes) {
    util::Random random{99};
    auto first = transport::buildUpgradeRequest("cm.example.net", random);
    auto second = transport::buildUpgradeRequest("cm.example.net", random);

    auto decoded = util::base64Decode(first.key);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->size(), 16u);
    EXPECT_EQ(first.key.size(), 24u);
    EXPECT_NE(first.key, second.key);
}

TEST(UpgradeRequestTest, SeededRandomIsReproducible) {
    util::Random left{1234};
    util::Random right{1234};
    EXPECT_EQ(transport::generateWebSocketKey(left), transport::generateWebSocketKey(right));
}

TEST(UpgradeRequestTest, HostOmitsUserInfo) {
    util::Random random{3};
    auto upgrade = transport::buildUpgradeRequest("user:secret@cm.example.net:443", random);
    EXPECT_EQ(upgrade.host, "cm.example.net:443");
    EXPECT_EQ(upgrade.request[boost::beast::http::field::host], "cm.example.net:443");
}

TEST(UpgradeRequestTest, RejectsUnusableEndpoints) {
    EXPECT_EQ(buildErrorType("cm.example.net:99999"), TransportError::Type::invalid_url);
    EXPECT_EQ(buildErrorType("cm example.net"), TransportError::Type::invalid_url);
    EXPECT_EQ(buildErrorType(""), TransportError::Type::url_no_host_name);
    EXPECT_EQ(buildErrorType(":443"), TransportError::Type::url_no_host_name);
    EXPECT_EQ(buildErrorType("cm.example.net/a b"), TransportError::Type::request_build);
}
