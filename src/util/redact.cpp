#include "mcpgate/util/redact.hpp"

#include <regex>
#include <set>

namespace mcpgate::util
{

namespace
{
const std::set<std::string>& sensitive_flags()
{
    static const std::set<std::string> flags = {"--api-key", "--token", "--auth", "--password",
                                                "--secret"};
    return flags;
}

std::string trim(const std::string& s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

constexpr size_t kMaxLogged = 500;
} // namespace

std::string url_for_logging(const std::string& url)
{
    std::string base = url.substr(0, url.find_first_of("?#"));

    auto scheme_end = base.find("://");
    if (scheme_end == std::string::npos)
        return base;

    auto authority_start = scheme_end + 3;
    auto path_start = base.find('/', authority_start);
    std::string authority = base.substr(authority_start, path_start == std::string::npos
                                                             ? std::string::npos
                                                             : path_start - authority_start);
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    std::string path = path_start == std::string::npos ? "/" : base.substr(path_start);
    return base.substr(0, authority_start) + authority + path;
}

std::vector<std::string> args_for_logging(const std::vector<std::string>& args)
{
    const auto& flags = sensitive_flags();
    std::vector<std::string> out;
    out.reserve(args.size());

    for (size_t i = 0; i < args.size(); ++i)
    {
        const auto& arg = args[i];
        auto eq = arg.find('=');
        if (eq != std::string::npos && flags.count(arg.substr(0, eq)))
        {
            out.push_back(arg.substr(0, eq) + "=***");
            continue;
        }

        out.push_back(arg);
        if (flags.count(arg) && i + 1 < args.size())
        {
            out.push_back("***");
            ++i;
        }
    }
    return out;
}

std::string command_for_logging(const std::string& program, const std::vector<std::string>& args)
{
    std::string line = program;
    for (const auto& a : args_for_logging(args))
        line += " " + a;
    return line;
}

std::string error_for_logging(const std::string& message)
{
    std::string trimmed = trim(message);
    if (trimmed.empty())
        return "Unknown error";

    static const std::regex html_start(R"(<\s*(!doctype|html|head|body|div|span|p)[\s>])",
                                       std::regex::icase);
    std::smatch m;
    if (std::regex_search(trimmed, m, html_start))
    {
        std::string prefix = trimmed.substr(0, static_cast<size_t>(m.position(0)));
        prefix = std::regex_replace(prefix, std::regex(R"(\s*[:\-]+\s*$)"), "");
        trimmed = (prefix.empty() ? std::string("Received HTML response") : prefix) +
                  " (response body omitted)";
    }

    if (trimmed.size() > kMaxLogged)
        trimmed = trimmed.substr(0, kMaxLogged) + "...";
    return trimmed;
}

std::string sanitize_description(const std::string& description)
{
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\{\{.*?\}\})"),
        std::regex(R"(SYSTEM\s*:)", std::regex::icase),
        std::regex(R"(ignore\s+.*?previous)", std::regex::icase),
        std::regex(R"(execute\s+.*?command)", std::regex::icase),
        std::regex(R"(\$\(.*?\))"),
        std::regex(R"(<script.*?>)", std::regex::icase),
    };

    std::string out = description;
    for (const auto& re : patterns)
        out = std::regex_replace(out, re, "[FILTERED_CONTENT]");

    if (out.size() > kMaxLogged)
        out = out.substr(0, kMaxLogged) + "...";
    return out;
}

} // namespace mcpgate::util
