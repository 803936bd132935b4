#include "webview/RuntimeVersion.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace wv::webview
{

std::optional<std::vector<std::uint32_t>> parse_version(std::string_view text)
{
    if (auto space = text.find(' '); space != std::string_view::npos)
    {
        text = text.substr(0, space);
    }
    if (text.empty())
    {
        return std::nullopt;
    }
    std::vector<std::uint32_t> parts;
    while (true)
    {
        auto dot = text.find('.');
        auto piece = text.substr(0, dot);
        std::uint32_t value = 0;
        auto const *end = piece.data() + piece.size();
        auto [ptr, ec] = std::from_chars(piece.data(), end, value);
        if (piece.empty() || ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        parts.push_back(value);
        if (dot == std::string_view::npos)
        {
            break;
        }
        text.remove_prefix(dot + 1);
    }
    return parts;
}

std::optional<int> compare_versions(std::string_view a, std::string_view b)
{
    auto left = parse_version(a);
    auto right = parse_version(b);
    if (!left || !right)
    {
        return std::nullopt;
    }
    auto const count = std::max(left->size(), right->size());
    left->resize(count, 0);
    right->resize(count, 0);
    for (std::size_t i = 0; i < count; ++i)
    {
        if ((*left)[i] < (*right)[i])
        {
            return -1;
        }
        if ((*left)[i] > (*right)[i])
        {
            return 1;
        }
    }
    return 0;
}

} // namespace wv::webview
