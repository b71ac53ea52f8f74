#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cmlink::util {
class HttpClient;
class Random;
}

namespace cmlink::cm {

struct CmServer {
    std::string endpoint;
    std::string type{"websockets"};
    std::string dataCenter;
};

// Candidate list of CM endpoints. Implementations are not thread safe; the
// owning CmServerCache serializes access.
class CmServerList {
public:
    virtual ~CmServerList() = default;

    virtual void refresh() = 0;
    virtual void refreshWith(util::HttpClient& client) = 0;
    virtual std::optional<CmServer> pickRandom(util::Random& random) const = 0;
};

class StaticCmServerList : public CmServerList {
public:
    explicit StaticCmServerList(std::vector<CmServer> servers);

    void refresh() override {}
    void refreshWith(util::HttpClient&) override {}
    std::optional<CmServer> pickRandom(util::Random& random) const override;

private:
    std::vector<CmServer> servers_;
};

// List backed by a CM directory web API returning
// {"response":{"serverlist":[{"endpoint":..,"type":..,"dc":..}]}}.
class DirectoryCmServerList : public CmServerList {
public:
    struct Options {
        std::string url;
        std::chrono::seconds minRefreshInterval{std::chrono::minutes{5}};
        std::chrono::seconds timeout{15};
    };

    explicit DirectoryCmServerList(Options options);

    void refresh() override;
    void refreshWith(util::HttpClient& client) override;
    std::optional<CmServer> pickRandom(util::Random& random) const override;

    [[nodiscard]] const std::vector<CmServer>& servers() const noexcept { return servers_; }

private:
    bool fresh() const;

    Options options_;
    std::vector<CmServer> servers_;
    std::optional<std::chrono::steady_clock::time_point> refreshedAt_;
};

// Keeps only websocket capable entries. Throws std::runtime_error when the
// payload is not a directory response.
std::vector<CmServer> parseCmServerList(const std::string& payload);

} // namespace cmlink::cm
