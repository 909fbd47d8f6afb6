#include "mcpgate/gateway/stdio_server.hpp"

#include "mcpgate/jsonrpc.hpp"
#include "mcpgate/util/json.hpp"

#include <iostream>
#include <string>

namespace mcpgate::gateway
{

StdioServer::StdioServer(Handler handler) : StdioServer(std::move(handler), std::cin, std::cout) {}

StdioServer::StdioServer(Handler handler, std::istream& in, std::ostream& out)
    : handler_(std::move(handler)), in_(in), out_(out)
{
}

void StdioServer::run()
{
    std::string line;
    while (!stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;

        Json request = util::json::try_parse(line);
        if (request.is_discarded())
        {
            out_ << jsonrpc::error(Json(), jsonrpc::PARSE_ERROR, "Parse error").dump() << std::endl;
            continue;
        }

        Json response = handler_(request);
        if (!request.is_object() || !request.contains("id"))
            continue;
        out_ << response.dump() << std::endl;
    }
}

} // namespace mcpgate::gateway
