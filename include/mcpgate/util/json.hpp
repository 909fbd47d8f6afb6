#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpgate::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump(const json& j) { return j.dump(); }
inline std::string dump_pretty(const json& j, int indent = 2) { return j.dump(indent); }

// Non-throwing parse; returns a discarded value on malformed input
inline json try_parse(const std::string& s) { return json::parse(s, nullptr, false); }

// Canonical string form of a JSON-RPC id (numbers and strings alike)
inline std::string id_key(const json& id) {
  if (id.is_string()) return id.get<std::string>();
  return id.dump();
}

} // namespace mcpgate::util::json
