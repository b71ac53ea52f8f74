#pragma once

#include "cmlink/cm/CmServerList.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace cmlink::proxy {
class Socks5ProxyConfig;
}

namespace cmlink::util {
class HttpClient;
class Random;
}

namespace cmlink::cm {

// Shared candidate list. Owned by the application and handed to selectors by
// reference so tests can supply a deterministic list.
class CmServerCache {
public:
    explicit CmServerCache(std::unique_ptr<CmServerList> list);

    // Refresh (through client when given) and pick under the cache lock. The
    // lock is released before returning.
    std::optional<CmServer> refreshAndPick(util::HttpClient* client, util::Random& random);

private:
    std::mutex mutex_;
    std::unique_ptr<CmServerList> list_;
};

class ServerSelector {
public:
    ServerSelector(CmServerCache& cache, util::Random& random);

    // Throws transport::TransportError: no_server_available when the refreshed
    // list is empty, server_list when the refresh fails, proxy_config or
    // client_build when the proxied directory client cannot be built.
    CmServer select(const proxy::Socks5ProxyConfig* proxy = nullptr);

private:
    CmServerCache& cache_;
    util::Random& random_;
};

} // namespace cmlink::cm
