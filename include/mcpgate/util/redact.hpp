#pragma once

#include <string>
#include <vector>

namespace mcpgate::util
{

/// Origin and path of a URL, without query string, fragment or userinfo.
std::string url_for_logging(const std::string& url);

/// Mask values of secret-bearing flags (--api-key, --token, --auth, --password,
/// --secret) in both "--flag value" and "--flag=value" forms.
std::vector<std::string> args_for_logging(const std::vector<std::string>& args);

/// Join args_for_logging(args) with single spaces.
std::string command_for_logging(const std::string& program, const std::vector<std::string>& args);

/// Trim an error message for logs: empty -> "Unknown error", HTML bodies are
/// elided, and the result is capped at 500 characters.
std::string error_for_logging(const std::string& message);

/// Replace prompt-injection patterns in a tool description with
/// "[FILTERED_CONTENT]" and cap it at 500 characters.
std::string sanitize_description(const std::string& description);

} // namespace mcpgate::util
