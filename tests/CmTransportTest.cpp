#include "cmlink/cm/CmServerList.hpp"
#include "cmlink/transport/CmTransport.hpp"
#include "cmlink/transport/ResponseCorrelator.hpp"
#include "cmlink/transport/TransportError.hpp"
#include "cmlink/transport/TransportEstablisher.hpp"
#include "cmlink/transport/UpgradeRequest.hpp"
#include "cmlink/util/Random.hpp"

#include "support/LoopbackWssServer.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cmlink;
using namespace cmlink::transport;
using namespace std::chrono_literals;

namespace {

// Frames look like "<job id>:<payload>"; anything without a colon is unsolicited.
std::optional<std::pair<JobId, ResponseBody>> decodeTestFrame(const std::string& frame) {
    auto colon = frame.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<JobId>(std::stoull(frame.substr(0, colon))),
                          ResponseBody{1, 0, frame.substr(colon + 1)});
}

struct WaitOutcome {
    bool called{false};
    std::exception_ptr error;
    ResponseBody body;

    CompletionSlot::Waiter waiter() {
        return [this](std::exception_ptr e, ResponseBody b) {
            called = true;
            error = std::move(e);
            body = std::move(b);
        };
    }

    [[nodiscard]] std::optional<TransportError::Type> errorType() const {
        if (!error) {
            return std::nullopt;
        }
        try {
            std::rethrow_exception(error);
        } catch (const TransportError& ex) {
            return ex.type();
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

class CmTransportTest : public ::testing::Test {
protected:
    // A connection whose stream never reached the server.
    CmTransport unconnectedTransport() {
        auto stream = std::make_unique<WebSocketStream>(boost::asio::make_strand(io_), ssl_);
        auto connection = std::make_shared<CmConnection>(std::move(stream), "cm.example.net:443");
        return CmTransport(CmReadHalf(connection), CmWriteHalf(connection), "cm.example.net:443");
    }

    boost::asio::io_context io_;
    boost::asio::ssl::context ssl_{makeClientSslContext()};
};

} // namespace

TEST_F(CmTransportTest, SplitMovesBothHalvesOut) {
    auto connection = unconnectedTransport();
    EXPECT_TRUE(connection.valid());
    EXPECT_EQ(connection.endpoint(), "cm.example.net:443");

    auto [reader, writer] = std::move(connection).split();
    EXPECT_TRUE(reader.valid());
    EXPECT_TRUE(writer.valid());
    EXPECT_FALSE(connection.valid());
    EXPECT_FALSE(CmTransport{}.valid());
}

TEST_F(CmTransportTest, DroppingWriteHalfFailsReads) {
    auto [reader, writer] = unconnectedTransport().split();
    { auto dropped = std::move(writer); }

    std::optional<boost::system::error_code> readError;
    reader.asyncRead([&readError](boost::system::error_code ec, std::string) { readError = ec; });
    io_.run();

    ASSERT_TRUE(readError.has_value());
    EXPECT_EQ(*readError, boost::asio::error::not_connected);
}

TEST_F(CmTransportTest, DroppingReadHalfFailsSends) {
    auto [reader, writer] = unconnectedTransport().split();
    { auto dropped = std::move(reader); }

    std::vector<boost::system::error_code> sendErrors;
    writer.send("first", [&sendErrors](boost::system::error_code ec) { sendErrors.push_back(ec); });
    writer.send("second", [&sendErrors](boost::system::error_code ec) { sendErrors.push_back(ec); });
    io_.run();

    ASSERT_EQ(sendErrors.size(), 2u);
    EXPECT_EQ(sendErrors[0], boost::asio::error::not_connected);
    EXPECT_EQ(sendErrors[1], boost::asio::error::not_connected);
}

TEST_F(CmTransportTest, ReassigningHalfClosesPreviousConnection) {
    auto [reader, writer] = unconnectedTransport().split();
    auto [otherReader, otherWriter] = unconnectedTransport().split();
    writer = std::move(otherWriter);

    std::optional<boost::system::error_code> readError;
    reader.asyncRead([&readError](boost::system::error_code ec, std::string) { readError = ec; });
    io_.run();

    ASSERT_TRUE(readError.has_value());
    EXPECT_EQ(*readError, boost::asio::error::not_connected);
    EXPECT_TRUE(writer.valid());
}

TEST_F(CmTransportTest, EmptyHalvesRejectOperations) {
    CmReadHalf reader;
    CmWriteHalf writer;
    EXPECT_FALSE(reader.valid());
    EXPECT_FALSE(writer.valid());
    EXPECT_THROW(reader.asyncRead([](boost::system::error_code, std::string) {}), std::logic_error);
    EXPECT_THROW(writer.send("payload"), std::logic_error);
}

TEST_F(CmTransportTest, ReadLoopFailsPendingRequestsWhenReadFails) {
    auto correlator = std::make_shared<ResponseCorrelator>();
    auto slot = correlator->registerRequest(41);
    WaitOutcome outcome;
    slot->asyncWait(io_, 5s, "LogonMessage", outcome.waiter());

    auto [reader, writer] = unconnectedTransport().split();
    { auto dropped = std::move(writer); }
    auto loop = std::make_shared<ReadLoop>(std::move(reader), correlator, decodeTestFrame);
    loop->start();
    io_.run();

    ASSERT_TRUE(outcome.called);
    EXPECT_EQ(outcome.errorType(), TransportError::Type::channel_closed);
    EXPECT_EQ(slot->state(), CompletionSlot::State::failed);
    EXPECT_EQ(correlator->pending(), 0u);
}

TEST_F(CmTransportTest, ReadLoopStopClosesConnection) {
    auto [reader, writer] = unconnectedTransport().split();
    auto loop = std::make_shared<ReadLoop>(std::move(reader), std::make_shared<ResponseCorrelator>(), decodeTestFrame);
    loop->stop();

    std::optional<boost::system::error_code> sendError;
    writer.send("after stop", [&sendError](boost::system::error_code ec) { sendError = ec; });
    io_.run();

    ASSERT_TRUE(sendError.has_value());
    EXPECT_EQ(*sendError, boost::asio::error::not_connected);
}

TEST(CmTransportLoopbackTest, ConnectsOverTlsAndRoutesFrames) {
    test_support::LoopbackWssServer server({
        .frames = {"presence-update", "7:pong", "9:stray"},
        .expectedClientFrames = 1,
    });

    boost::asio::io_context io;
    // The loopback certificate is self-signed, so this client does not verify it.
    boost::asio::ssl::context clientSsl(boost::asio::ssl::context::tls_client);
    clientSsl.set_verify_mode(boost::asio::ssl::verify_none);
    util::Random random{23};
    TransportEstablisher establisher{io, clientSsl, random, 5s};

    auto correlator = std::make_shared<ResponseCorrelator>();
    auto answered = correlator->registerRequest(7);
    auto unanswered = correlator->registerRequest(8);
    WaitOutcome answeredOutcome;
    WaitOutcome unansweredOutcome;
    answered->asyncWait(io, 5s, "PingMessage", answeredOutcome.waiter());
    unanswered->asyncWait(io, 5s, "LogonMessage", unansweredOutcome.waiter());

    std::exception_ptr connectError;
    std::optional<CmWriteHalf> writer;
    std::shared_ptr<ReadLoop> loop;
    std::optional<boost::system::error_code> sendError;
    const std::string endpoint = "127.0.0.1:" + std::to_string(server.port());
    establisher.asyncConnect(cm::CmServer{endpoint}, nullptr,
        [&](std::exception_ptr error, CmTransport connection) {
            if (error) {
                connectError = std::move(error);
                return;
            }
            auto [readHalf, writeHalf] = std::move(connection).split();
            writeHalf.send("hello", [&sendError](boost::system::error_code ec) { sendError = ec; });
            writer.emplace(std::move(writeHalf));
            loop = std::make_shared<ReadLoop>(std::move(readHalf), correlator, decodeTestFrame);
            loop->start();
        });
    io.run_for(10s);
    server.join();

    ASSERT_FALSE(connectError);
    EXPECT_EQ(server.failure(), "");
    EXPECT_EQ(server.upgradeRequest().target(), "/cmsocket/");
    EXPECT_EQ(server.upgradeRequest()["X-Cmlink-Client"], "cmlink/1.0");
    // Beast puts its own key on the wire, not the one prepared from the injected Random.
    util::Random replay{23};
    auto prepared = buildUpgradeRequest(endpoint, replay);
    EXPECT_FALSE(server.upgradeRequest()[boost::beast::http::field::sec_websocket_key].empty());
    EXPECT_NE(server.upgradeRequest()[boost::beast::http::field::sec_websocket_key], prepared.key);
    ASSERT_EQ(server.clientFrames().size(), 1u);
    EXPECT_EQ(server.clientFrames()[0], "hello");
    ASSERT_TRUE(sendError.has_value());
    EXPECT_FALSE(*sendError);

    ASSERT_TRUE(answeredOutcome.called);
    EXPECT_FALSE(answeredOutcome.error);
    EXPECT_EQ(answeredOutcome.body.payload, "pong");

    ASSERT_TRUE(unansweredOutcome.called);
    EXPECT_EQ(unansweredOutcome.errorType(), TransportError::Type::channel_closed);
    EXPECT_EQ(correlator->pending(), 0u);
}
