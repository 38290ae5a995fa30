// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Splits a byte stream into newline-delimited frames.
///
/// A partial line at the end of a chunk is buffered and completed by the next chunk.
/// Carriage returns before the newline and blank lines are dropped.
class MessageFramer
{
  public:
    /// @brief Appends a chunk of bytes and returns every line it completed.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<std::string>;

    /// @brief Returns the bytes of the incomplete trailing line.
    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

    /// @brief Discards any buffered partial line.
    void reset() { _buffer.clear(); }

  private:
    std::string _buffer;
};

} // namespace mcpvisor
