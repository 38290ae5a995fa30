// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace mcpvisor
{

/// @brief Components of a server URL.
struct Url
{
    std::string scheme; // lower-case: http, https, ws or wss
    std::string host;
    std::string port;   // explicit port, or the scheme's default
    std::string target; // path and query, at least "/"

    /// @brief Returns true for https and wss.
    [[nodiscard]] auto isSecure() const -> bool { return scheme == "https" || scheme == "wss"; }
};

/// @brief Parses an absolute http, https, ws or wss URL.
/// @return The parsed URL or an InvalidArgument error.
[[nodiscard]] auto parseUrl(std::string_view text) -> Result<Url>;

} // namespace mcpvisor
