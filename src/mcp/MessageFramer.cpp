// SPDX-License-Identifier: Apache-2.0
#include "MessageFramer.hpp"

namespace mcpvisor
{

auto MessageFramer::feed(std::string_view chunk) -> std::vector<std::string>
{
    _buffer.append(chunk);

    auto lines = std::vector<std::string> {};
    auto start = size_t { 0 };
    while (true)
    {
        auto const newlinePos = _buffer.find('\n', start);
        if (newlinePos == std::string::npos)
            break;

        auto line = std::string_view(_buffer).substr(start, newlinePos - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.find_first_not_of(" \t") != std::string_view::npos)
            lines.emplace_back(line);

        start = newlinePos + 1;
    }

    _buffer.erase(0, start);
    return lines;
}

} // namespace mcpvisor
