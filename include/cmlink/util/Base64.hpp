#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cmlink::util {

std::string base64Encode(std::string_view input);

// Returns std::nullopt on characters outside the standard alphabet or bad padding.
std::optional<std::string> base64Decode(std::string_view input);

} // namespace cmlink::util
