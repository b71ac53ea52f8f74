#include "cmlink/cm/CmServerList.hpp"
#include "cmlink/cm/ServerSelector.hpp"
#include "cmlink/config/ClientConfig.hpp"
#include "cmlink/transport/TransportError.hpp"
#include "cmlink/transport/TransportEstablisher.hpp"
#include "cmlink/util/Logging.hpp"
#include "cmlink/util/Random.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {
using namespace cmlink;

std::unique_ptr<cm::CmServerList> makeServerList(const config::ClientConfig& config) {
    if (!config.directoryUrl.empty()) {
        util::log(util::LogLevel::info, "Using CM directory " + config.directoryUrl);
        return std::make_unique<cm::DirectoryCmServerList>(cm::DirectoryCmServerList::Options{config.directoryUrl});
    }
    std::vector<cm::CmServer> servers;
    servers.reserve(config.servers.size());
    for (const auto& endpoint : config.servers) {
        servers.push_back(cm::CmServer{endpoint});
    }
    util::log(util::LogLevel::info, "Using " + std::to_string(servers.size()) + " configured CM endpoints");
    return std::make_unique<cm::StaticCmServerList>(std::move(servers));
}

std::string describe(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const transport::TransportError& ex) {
        return std::string{transport::toString(ex.type())} + ": " + ex.what() +
               (ex.retryable() ? " (retryable)" : "");
    } catch (const std::exception& ex) {
        return ex.what();
    }
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path configPath = argc > 1 ? std::filesystem::path{argv[1]} : std::filesystem::path{"data/cmlink.json"};
    auto clientConfig = config::loadClientConfig(configPath);
    util::initLogging(clientConfig.logLevel);

    if (clientConfig.directoryUrl.empty() && clientConfig.servers.empty()) {
        util::log(util::LogLevel::error, "No CM endpoints configured; set servers or directoryUrl");
        return 2;
    }

    boost::asio::io_context io;
    auto guard = boost::asio::make_work_guard(io);
    boost::asio::thread_pool workerPool(2);

    util::Random random;
    cm::CmServerCache cache{makeServerList(clientConfig)};
    cm::ServerSelector selector{cache, random};
    auto sslContext = transport::makeClientSslContext();
    transport::TransportEstablisher establisher{io, sslContext, random, clientConfig.connectTimeout};
    transport::CmConnector connector{workerPool, selector, establisher};

    std::atomic<int> exitCode{1};
    auto onConnected = [&exitCode, &guard](std::exception_ptr error, transport::CmTransport connection) {
        if (error) {
            util::log(util::LogLevel::error, "CM probe failed: " + describe(error));
        } else {
            util::log(util::LogLevel::info, "CM probe connected to " + connection.endpoint());
            exitCode = 0;
            // Dropping the halves closes the connection.
            auto halves = std::move(connection).split();
        }
        guard.reset();
    };

    if (clientConfig.proxy) {
        util::log(util::LogLevel::info, "Connecting through " + clientConfig.proxy->toString());
        connector.asyncConnect(*clientConfig.proxy, onConnected);
    } else {
        connector.asyncConnect(onConnected);
    }

    unsigned int ioThreadsCount = std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> ioThreads;
    ioThreads.reserve(ioThreadsCount - 1);
    for (unsigned int i = 0; i < ioThreadsCount - 1; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerPool.join();
    return exitCode.load();
}
