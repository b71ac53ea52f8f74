#include "cmlink/cm/ServerSelector.hpp"

#include "cmlink/proxy/Socks5ProxyConfig.hpp"
#include "cmlink/transport/TransportError.hpp"
#include "cmlink/util/HttpClient.hpp"
#include "cmlink/util/Logging.hpp"
#include "cmlink/util/Random.hpp"

namespace cmlink::cm {

CmServerCache::CmServerCache(std::unique_ptr<CmServerList> list)
    : list_(std::move(list)) {}

std::optional<CmServer> CmServerCache::refreshAndPick(util::HttpClient* client, util::Random& random) {
    std::scoped_lock lock(mutex_);
    if (client) {
        list_->refreshWith(*client);
    } else {
        list_->refresh();
    }
    return list_->pickRandom(random);
}

ServerSelector::ServerSelector(CmServerCache& cache, util::Random& random)
    : cache_(cache)
    , random_(random) {}

CmServer ServerSelector::select(const proxy::Socks5ProxyConfig* proxy) {
    using transport::TransportError;

    std::unique_ptr<util::HttpClient> proxiedClient;
    std::optional<CmServer> server;
    try {
        if (proxy) {
            proxiedClient = proxy->buildHttpClient();
        }
        server = cache_.refreshAndPick(proxiedClient.get(), random_);
    } catch (const proxy::ProxyConfigError& ex) {
        throw transport::fromProxyConfigError(ex);
    } catch (const TransportError&) {
        throw;
    } catch (const std::exception& ex) {
        throw TransportError(TransportError::Type::server_list,
                             std::string{"Failed to refresh CM server list: "} + ex.what());
    }

    if (!server) {
        throw TransportError(TransportError::Type::no_server_available, "No CM server available");
    }
    util::log(util::LogLevel::debug, "Selected CM server " + server->endpoint);
    return *server;
}

} // namespace cmlink::cm
