#include "cmlink/cm/CmServerList.hpp"
#include "cmlink/cm/ServerSelector.hpp"
#include "cmlink/transport/TransportError.hpp"
#include "cmlink/transport/TransportEstablisher.hpp"
#include "cmlink/util/Random.hpp"

#include "support/ScriptedSocks5Server.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <gtest/gtest.h>

#include <optional>

using namespace cmlink;
using transport::TransportError;

namespace {

struct ConnectOutcome {
    bool called{false};
    std::exception_ptr error;
    bool transportValid{false};

    transport::ConnectHandler handler() {
        return [this](std::exception_ptr e, transport::CmTransport connection) {
            called = true;
            error = std::move(e);
            transportValid = connection.valid();
        };
    }

    [[nodiscard]] std::optional<TransportError> transportError() const {
        if (!error) {
            return std::nullopt;
        }
        try {
            std::rethrow_exception(error);
        } catch (const TransportError& ex) {
            return ex;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

std::uint16_t closedLoopbackPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::address_v4::loopback(), 0});
    auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

class TransportEstablisherTest : public ::testing::Test {
protected:
    boost::asio::io_context io_;
    boost::asio::ssl::context ssl_{transport::makeClientSslContext()};
    util::Random random_{17};
    transport::TransportEstablisher establisher_{io_, ssl_, random_, std::chrono::seconds{5}};
};

} // namespace

TEST_F(TransportEstablisherTest, InvalidEndpointFailsWithoutNetwork) {
    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{"cm.example.net:99999"}, nullptr, outcome.handler());
    EXPECT_FALSE(outcome.called);
    io_.run();

    ASSERT_TRUE(outcome.called);
    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::invalid_url);
    EXPECT_FALSE(outcome.transportValid);
}

TEST_F(TransportEstablisherTest, EndpointWithoutHostFails) {
    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{":443"}, nullptr, outcome.handler());
    io_.run();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::url_no_host_name);
}

TEST_F(TransportEstablisherTest, PartialCredentialsFailBeforeAnySocket) {
    boost::asio::ip::tcp::acceptor acceptor(io_, {boost::asio::ip::address_v4::loopback(), 0});
    auto proxy = proxy::Socks5ProxyConfig::parse("socks5h://alice@127.0.0.1:" +
                                                 std::to_string(acceptor.local_endpoint().port()));

    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{"cm.example.net:443"}, &proxy, outcome.handler());
    io_.run();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::proxy_config);
    EXPECT_FALSE(error->retryable());

    acceptor.non_blocking(true);
    boost::asio::ip::tcp::socket peer(io_);
    boost::system::error_code ec;
    acceptor.accept(peer, ec);
    EXPECT_EQ(ec, boost::asio::error::would_block);
}

TEST_F(TransportEstablisherTest, RefusedTunnelReportsProxyTunnel) {
    test_support::ScriptedSocks5Server server({.replyCode = 0x02});
    proxy::Socks5ProxyConfig proxy("127.0.0.1", server.port());

    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{"cm.example.net:27020"}, &proxy, outcome.handler());
    io_.run();
    server.join();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::proxy_tunnel);
    EXPECT_TRUE(error->retryable());
    EXPECT_EQ(server.connectRequest(), test_support::domainConnectRequest("cm.example.net", 27020));
}

TEST_F(TransportEstablisherTest, TunnelDefaultsToPort443) {
    test_support::ScriptedSocks5Server server({.replyCode = 0x01});
    proxy::Socks5ProxyConfig proxy("127.0.0.1", server.port());

    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{"cm.example.net"}, &proxy, outcome.handler());
    io_.run();
    server.join();

    EXPECT_EQ(server.connectRequest(), test_support::domainConnectRequest("cm.example.net", 443));
}

TEST_F(TransportEstablisherTest, TlsFailureAfterTunnelReportsHandshake) {
    // The scripted proxy closes the tunnel right after granting it.
    test_support::ScriptedSocks5Server server({});
    proxy::Socks5ProxyConfig proxy("127.0.0.1", server.port());

    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{"cm.example.net:443"}, &proxy, outcome.handler());
    io_.run();
    server.join();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::handshake);
}

TEST_F(TransportEstablisherTest, DirectConnectFailureIsReported) {
    ConnectOutcome outcome;
    establisher_.asyncConnect(cm::CmServer{"127.0.0.1:" + std::to_string(closedLoopbackPort())}, nullptr,
                              outcome.handler());
    io_.run();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::connect_failed);
    EXPECT_TRUE(error->retryable());
}

TEST_F(TransportEstablisherTest, ConnectorReportsEmptyServerList) {
    boost::asio::thread_pool worker(1);
    cm::CmServerCache cache{std::make_unique<cm::StaticCmServerList>(std::vector<cm::CmServer>{})};
    cm::ServerSelector selector{cache, random_};
    transport::CmConnector connector{worker, selector, establisher_};

    auto guard = boost::asio::make_work_guard(io_);
    ConnectOutcome outcome;
    auto handler = outcome.handler();
    connector.asyncConnect([&guard, handler](std::exception_ptr error, transport::CmTransport connection) {
        handler(std::move(error), std::move(connection));
        guard.reset();
    });
    io_.run();
    worker.join();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::no_server_available);
}

TEST_F(TransportEstablisherTest, ConnectorUsesProxyForSelectedServer) {
    test_support::ScriptedSocks5Server server({.replyCode = 0x04});
    boost::asio::thread_pool worker(1);
    cm::CmServerCache cache{
        std::make_unique<cm::StaticCmServerList>(std::vector<cm::CmServer>{cm::CmServer{"cm9.example.net:443"}})};
    cm::ServerSelector selector{cache, random_};
    transport::CmConnector connector{worker, selector, establisher_};

    auto guard = boost::asio::make_work_guard(io_);
    ConnectOutcome outcome;
    auto handler = outcome.handler();
    connector.asyncConnect(proxy::Socks5ProxyConfig("127.0.0.1", server.port()),
        [&guard, handler](std::exception_ptr error, transport::CmTransport connection) {
            handler(std::move(error), std::move(connection));
            guard.reset();
        });
    io_.run();
    worker.join();
    server.join();

    auto error = outcome.transportError();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type(), TransportError::Type::proxy_tunnel);
    EXPECT_EQ(server.connectRequest(), test_support::domainConnectRequest("cm9.example.net", 443));
}

TEST(TransportErrorTest, NamesEveryType) {
    EXPECT_STREQ(transport::toString(TransportError::Type::connect_failed), "connect_failed");
    EXPECT_STREQ(transport::toString(TransportError::Type::channel_closed), "channel_closed");
    EXPECT_STREQ(transport::toString(TransportError::Type::timeout), "timeout");

    auto mapped = transport::fromProxyConfigError(
        proxy::ProxyConfigError(proxy::ProxyConfigError::Type::client_build_failed, "bad client"));
    EXPECT_EQ(mapped.type(), TransportError::Type::client_build);
    mapped = transport::fromProxyConfigError(
        proxy::ProxyConfigError(proxy::ProxyConfigError::Type::partial_credentials, "half"));
    EXPECT_EQ(mapped.type(), TransportError::Type::proxy_config);
}
