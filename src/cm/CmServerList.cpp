#include "cmlink/cm/CmServerList.hpp"

#include "cmlink/util/HttpClient.hpp"
#include "cmlink/util/JsonUtil.hpp"
#include "cmlink/util/Logging.hpp"
#include "cmlink/util/Random.hpp"

#include <boost/json.hpp>

#include <stdexcept>

namespace cmlink::cm {
namespace {

std::optional<CmServer> pickFrom(const std::vector<CmServer>& servers, util::Random& random) {
    if (servers.empty()) {
        return std::nullopt;
    }
    return servers[random.index(servers.size())];
}

} // namespace

StaticCmServerList::StaticCmServerList(std::vector<CmServer> servers)
    : servers_(std::move(servers)) {}

std::optional<CmServer> StaticCmServerList::pickRandom(util::Random& random) const {
    return pickFrom(servers_, random);
}

DirectoryCmServerList::DirectoryCmServerList(Options options)
    : options_(std::move(options)) {}

void DirectoryCmServerList::refresh() {
    if (fresh()) {
        return;
    }
    util::HttpClient client;
    refreshWith(client);
}

void DirectoryCmServerList::refreshWith(util::HttpClient& client) {
    if (fresh()) {
        return;
    }
    if (options_.url.empty()) {
        throw std::runtime_error("CM directory URL is not configured");
    }

    std::vector<util::HttpClient::Header> headers{
        {"Accept", "application/json"}
    };
    auto response = client.get(options_.url, headers, options_.timeout);
    if (response.result() != boost::beast::http::status::ok) {
        throw std::runtime_error("CM directory returned status " + std::to_string(response.result_int()));
    }

    auto servers = parseCmServerList(response.body());
    util::log(util::LogLevel::info, "CM directory returned " + std::to_string(servers.size()) + " websocket servers");
    servers_ = std::move(servers);
    refreshedAt_ = std::chrono::steady_clock::now();
}

std::optional<CmServer> DirectoryCmServerList::pickRandom(util::Random& random) const {
    return pickFrom(servers_, random);
}

bool DirectoryCmServerList::fresh() const {
    return refreshedAt_ && !servers_.empty() &&
           std::chrono::steady_clock::now() - *refreshedAt_ < options_.minRefreshInterval;
}

std::vector<CmServer> parseCmServerList(const std::string& payload) {
    auto json = util::parseJson(payload);
    const boost::json::value* list = nullptr;
    if (json.is_object()) {
        if (auto response = json.as_object().if_contains("response"); response && response->is_object()) {
            list = response->as_object().if_contains("serverlist");
        }
    }
    if (list == nullptr || !list->is_array()) {
        throw std::runtime_error("CM directory payload has no serverlist");
    }

    std::vector<CmServer> servers;
    for (const auto& item : list->as_array()) {
        if (!item.is_object()) {
            continue;
        }
        const auto& obj = item.as_object();
        CmServer server;
        if (auto it = obj.if_contains("endpoint"); it && it->is_string()) {
            server.endpoint = std::string(it->as_string());
        }
        if (auto it = obj.if_contains("type"); it && it->is_string()) {
            server.type = std::string(it->as_string());
        }
        if (auto it = obj.if_contains("dc"); it && it->is_string()) {
            server.dataCenter = std::string(it->as_string());
        }
        if (server.endpoint.empty() || server.type != "websockets") {
            continue;
        }
        servers.push_back(std::move(server));
    }
    return servers;
}

} // namespace cmlink::cm
