#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace cmlink::util {

boost::json::value parseJson(const std::string& payload);

// std::nullopt when the file is missing or empty; parse errors propagate.
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

} // namespace cmlink::util
