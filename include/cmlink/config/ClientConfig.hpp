#pragma once

#include "cmlink/proxy/Socks5ProxyConfig.hpp"
#include "cmlink/util/Logging.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cmlink::config {

struct ClientConfig {
    std::optional<proxy::Socks5ProxyConfig> proxy;
    std::vector<std::string> servers;
    std::string directoryUrl;
    std::chrono::seconds connectTimeout{30};
    util::LogLevel logLevel{util::LogLevel::info};
};

// Reads the JSON file at path when it exists, then applies CMLINK_*
// environment overrides. Invalid values are logged and ignored.
ClientConfig loadClientConfig(const std::filesystem::path& path);

} // namespace cmlink::config
