#include "mcpgate/client/framer.hpp"

namespace mcpgate::client
{

std::vector<FrameEvent> MessageFramer::feed(const std::string& chunk)
{
    return feed(chunk.data(), chunk.size());
}

std::vector<FrameEvent> MessageFramer::feed(const char* data, size_t size)
{
    buffer_.append(data, size);

    std::vector<FrameEvent> events;
    size_t start = 0;
    for (;;)
    {
        size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos)
            break;

        std::string line = buffer_.substr(start, nl - start);
        start = nl + 1;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;

        FrameEvent ev;
        try
        {
            ev.message = Json::parse(line);
            ev.kind = FrameEvent::Kind::Message;
        }
        catch (const Json::parse_error& e)
        {
            ev.kind = FrameEvent::Kind::ParseError;
            ev.error = e.what();
        }
        ev.line = std::move(line);
        events.push_back(std::move(ev));
    }
    buffer_.erase(0, start);
    return events;
}

std::string MessageFramer::serialize(const Json& envelope)
{
    std::string out = envelope.dump();
    out.push_back('\n');
    return out;
}

} // namespace mcpgate::client
