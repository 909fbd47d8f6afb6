#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mcpgate::container
{

enum class StreamType : uint8_t
{
    Stdin = 0,
    Stdout = 1,
    Stderr = 2
};

struct StreamChunk
{
    StreamType stream;
    std::string data;
};

/// Splits the engine's multiplexed attach stream.
///
/// Non-TTY containers prefix every frame with an 8-byte header:
/// [stream type, 0, 0, 0, size (uint32 big-endian)]. TTY containers send raw
/// bytes, all reported as stdout. Partial headers and payloads are buffered.
class StreamDemuxer
{
  public:
    explicit StreamDemuxer(bool tty) : tty_(tty) {}

    std::vector<StreamChunk> feed(const char* data, size_t size);

    size_t buffered() const
    {
        return buffer_.size();
    }

    /// Encode one frame (used by in-process engines).
    static std::string encode(StreamType stream, const std::string& payload);

  private:
    bool tty_;
    std::string buffer_;
};

} // namespace mcpgate::container
