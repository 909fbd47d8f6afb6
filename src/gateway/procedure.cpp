#include "mcpgate/gateway/procedure.hpp"

namespace mcpgate::gateway {

std::string Procedure::tool_name() const {
  if (tool && !tool->name.empty()) return tool->name;
  auto dot = path.rfind('.');
  return dot == std::string::npos ? path : path.substr(dot + 1);
}

std::string Procedure::tool_description() const {
  if (tool && !tool->description.empty()) return tool->description;
  return "Execute " + tool_name();
}

void ProcedureRegistry::add(Procedure p) {
  if (p.path.empty()) throw ValidationError("Procedure path must not be empty");
  if (!p.executor) throw ValidationError("Procedure " + p.path + " has no executor");
  if (procedures_.count(p.path)) throw ValidationError("Procedure " + p.path + " already registered");
  procedures_.emplace(p.path, std::move(p));
}

const Procedure* ProcedureRegistry::find_tool(const std::string& name) const {
  for (const auto& [path, p] : procedures_)
    if (p.tool && p.tool_name() == name) return &p;
  return nullptr;
}

std::vector<const Procedure*> ProcedureRegistry::tools() const {
  std::vector<const Procedure*> out;
  for (const auto& [path, p] : procedures_)
    if (p.tool) out.push_back(&p);
  return out;
}

} // namespace mcpgate::gateway
