#pragma once
#include "mcpgate/types.hpp"

#include <string>
#include <vector>

namespace mcpgate::client
{

/// One outcome of feeding bytes: a parsed envelope or a line that failed to parse.
struct FrameEvent
{
    enum class Kind
    {
        Message,
        ParseError
    };

    Kind kind{Kind::Message};
    Json message;       ///< valid when kind == Message
    std::string line;   ///< the raw line (without terminator)
    std::string error;  ///< parser diagnostic when kind == ParseError
};

/// Newline-delimited JSON-RPC framing.
///
/// feed() may be called with arbitrary chunk boundaries; the sequence of
/// events depends only on the concatenated bytes. Blank lines are skipped and
/// a trailing '\r' is stripped. Malformed lines produce ParseError events.
class MessageFramer
{
  public:
    std::vector<FrameEvent> feed(const std::string& chunk);
    std::vector<FrameEvent> feed(const char* data, size_t size);

    /// Bytes of an incomplete trailing line held for the next feed().
    size_t buffered() const
    {
        return buffer_.size();
    }

    void reset()
    {
        buffer_.clear();
    }

    /// Compact JSON followed by exactly one '\n'.
    static std::string serialize(const Json& envelope);

  private:
    std::string buffer_;
};

} // namespace mcpgate::client
