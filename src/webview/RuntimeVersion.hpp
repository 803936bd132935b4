#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace wv::webview
{

// Parses "120.0.2210.91" (an optional channel suffix after a space, as in
// "120.0.2210.91 canary", is ignored). nullopt when a component is not a
// number.
std::optional<std::vector<std::uint32_t>> parse_version(std::string_view text);

// -1 when a < b, 0 when equal, 1 when a > b. Missing trailing components
// count as 0. nullopt when either side does not parse.
std::optional<int> compare_versions(std::string_view a, std::string_view b);

} // namespace wv::webview
