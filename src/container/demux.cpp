#include "mcpgate/container/demux.hpp"

namespace mcpgate::container
{

namespace
{
constexpr size_t kHeaderSize = 8;
}

std::vector<StreamChunk> StreamDemuxer::feed(const char* data, size_t size)
{
    std::vector<StreamChunk> out;
    if (tty_)
    {
        if (size > 0)
            out.push_back({StreamType::Stdout, std::string(data, size)});
        return out;
    }

    buffer_.append(data, size);
    size_t pos = 0;
    while (buffer_.size() - pos >= kHeaderSize)
    {
        const auto* h = reinterpret_cast<const unsigned char*>(buffer_.data() + pos);
        const uint32_t len = (static_cast<uint32_t>(h[4]) << 24) |
                             (static_cast<uint32_t>(h[5]) << 16) |
                             (static_cast<uint32_t>(h[6]) << 8) | static_cast<uint32_t>(h[7]);
        if (buffer_.size() - pos - kHeaderSize < len)
            break;

        StreamType type = h[0] == 2 ? StreamType::Stderr
                                    : (h[0] == 0 ? StreamType::Stdin : StreamType::Stdout);
        if (len > 0)
            out.push_back({type, buffer_.substr(pos + kHeaderSize, len)});
        pos += kHeaderSize + len;
    }
    buffer_.erase(0, pos);
    return out;
}

std::string StreamDemuxer::encode(StreamType stream, const std::string& payload)
{
    const auto len = static_cast<uint32_t>(payload.size());
    std::string frame(kHeaderSize, '\0');
    frame[0] = static_cast<char>(stream);
    frame[4] = static_cast<char>((len >> 24) & 0xff);
    frame[5] = static_cast<char>((len >> 16) & 0xff);
    frame[6] = static_cast<char>((len >> 8) & 0xff);
    frame[7] = static_cast<char>(len & 0xff);
    return frame + payload;
}

} // namespace mcpgate::container
