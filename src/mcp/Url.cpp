// SPDX-License-Identifier: Apache-2.0
#include "Url.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpvisor
{

auto parseUrl(std::string_view text) -> Result<Url>
{
    auto const schemeEnd = text.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': missing scheme", text));

    auto url = Url {};
    url.scheme = std::string(text.substr(0, schemeEnd));
    std::ranges::transform(url.scheme, url.scheme.begin(), [](unsigned char c) { return std::tolower(c); });

    if (url.scheme != "http" && url.scheme != "https" && url.scheme != "ws" && url.scheme != "wss")
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Invalid URL '{}': unsupported scheme '{}'", text, url.scheme));

    auto rest = text.substr(schemeEnd + 3);
    auto const pathStart = rest.find_first_of("/?#");
    auto authority = rest.substr(0, pathStart);
    url.target = pathStart == std::string_view::npos ? "/" : std::string(rest.substr(pathStart));
    if (auto const fragment = url.target.find('#'); fragment != std::string::npos)
        url.target.erase(fragment);
    if (url.target.empty() || url.target.front() != '/')
        url.target.insert(0, "/");

    // Credentials are not used by any transport.
    if (auto const at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);

    if (!authority.empty() && authority.front() == '[')
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': bad IPv6 host", text));
        url.host = std::string(authority.substr(1, close - 1));
        authority = authority.substr(close + 1);
        if (!authority.empty() && authority.front() == ':')
            url.port = std::string(authority.substr(1));
    }
    else if (auto const colon = authority.find(':'); colon != std::string_view::npos)
    {
        url.host = std::string(authority.substr(0, colon));
        url.port = std::string(authority.substr(colon + 1));
    }
    else
    {
        url.host = std::string(authority);
    }

    if (url.host.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': missing host", text));

    if (url.port.empty())
        url.port = url.isSecure() ? "443" : "80";
    else if (!std::ranges::all_of(url.port, [](unsigned char c) { return std::isdigit(c) != 0; }))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': bad port", text));

    return url;
}

} // namespace mcpvisor
