#include "cmlink/config/ClientConfig.hpp"

#include "cmlink/util/JsonUtil.hpp"

#include <cstdlib>
#include <string_view>

namespace cmlink::config {
namespace {

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string> splitServers(std::string_view value) {
    std::vector<std::string> servers;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto pos = value.find(',', start);
        auto length = (pos == std::string_view::npos) ? value.size() - start : pos - start;
        auto trimmed = trimView(value.substr(start, length));
        if (!trimmed.empty()) {
            servers.emplace_back(trimmed);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return servers;
}

void applySeconds(std::chrono::seconds& target, long long value, const char* name) {
    if (value > 0) {
        target = std::chrono::seconds(value);
    } else {
        util::log(util::LogLevel::warn, std::string{"Ignoring non-positive "} + name);
    }
}

struct ProxySettings {
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

std::optional<proxy::Socks5ProxyConfig> buildProxy(const ProxySettings& settings) {
    if (!settings.url || trimView(*settings.url).empty()) {
        return std::nullopt;
    }
    try {
        auto proxy = proxy::Socks5ProxyConfig::parse(trimView(*settings.url));
        if (settings.username || settings.password) {
            auto [username, password] = proxy.credentials();
            std::optional<std::string> user = settings.username ? settings.username : username;
            std::optional<std::string> pass = settings.password ? settings.password : password;
            if (user && pass) {
                proxy = proxy.withCredentials(*user, *pass);
            } else {
                util::log(util::LogLevel::warn, "Ignoring proxy credentials without both username and password");
            }
        }
        return proxy;
    } catch (const proxy::ProxyConfigError& ex) {
        util::log(util::LogLevel::warn, std::string{"Ignoring invalid proxy setting: "} + ex.what());
        return std::nullopt;
    }
}

} // namespace

ClientConfig loadClientConfig(const std::filesystem::path& path) {
    ClientConfig config;
    ProxySettings proxySettings;

    try {
        if (auto json = util::readJsonFile(path); json && json->is_object()) {
            const auto& obj = json->as_object();
            if (auto it = obj.if_contains("proxy"); it && it->is_string()) {
                proxySettings.url = std::string(it->as_string());
            }
            if (auto it = obj.if_contains("proxyUsername"); it && it->is_string()) {
                proxySettings.username = std::string(it->as_string());
            }
            if (auto it = obj.if_contains("proxyPassword"); it && it->is_string()) {
                proxySettings.password = std::string(it->as_string());
            }
            if (auto it = obj.if_contains("servers")) {
                if (it->is_array()) {
                    for (const auto& item : it->as_array()) {
                        if (item.is_string() && !item.as_string().empty()) {
                            config.servers.emplace_back(item.as_string());
                        }
                    }
                } else if (it->is_string()) {
                    config.servers = splitServers(std::string_view(it->as_string()));
                }
            }
            if (auto it = obj.if_contains("directoryUrl"); it && it->is_string()) {
                config.directoryUrl = std::string(it->as_string());
            }
            if (auto it = obj.if_contains("connectTimeoutSeconds"); it && it->is_int64()) {
                applySeconds(config.connectTimeout, it->as_int64(), "connectTimeoutSeconds");
            }
            if (auto it = obj.if_contains("logLevel"); it && it->is_string()) {
                if (auto level = util::parseLogLevel(std::string_view(it->as_string()))) {
                    config.logLevel = *level;
                } else {
                    util::log(util::LogLevel::warn, "Unknown logLevel in " + path.string());
                }
            }
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to read configuration " + path.string() + ": " + ex.what());
    }

    if (const char* value = std::getenv("CMLINK_PROXY")) {
        proxySettings.url = value;
    }
    if (const char* value = std::getenv("CMLINK_PROXY_USERNAME")) {
        proxySettings.username = value;
    }
    if (const char* value = std::getenv("CMLINK_PROXY_PASSWORD")) {
        proxySettings.password = value;
    }
    if (const char* value = std::getenv("CMLINK_SERVERS")) {
        config.servers = splitServers(value);
    }
    if (const char* value = std::getenv("CMLINK_DIRECTORY_URL")) {
        config.directoryUrl = value;
    }
    if (const char* value = std::getenv("CMLINK_CONNECT_TIMEOUT")) {
        applySeconds(config.connectTimeout, std::strtoll(value, nullptr, 10), "CMLINK_CONNECT_TIMEOUT");
    }
    if (const char* value = std::getenv("CMLINK_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            config.logLevel = *level;
        } else {
            util::log(util::LogLevel::warn, std::string{"Unknown CMLINK_LOG_LEVEL: "} + value);
        }
    }

    config.proxy = buildProxy(proxySettings);
    return config;
}

} // namespace cmlink::config
