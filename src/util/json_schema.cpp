#include "mcpgate/util/json_schema.hpp"

namespace mcpgate::util::schema {

static bool is_type(const Json& inst, const std::string& type) {
  if (type == "object") return inst.is_object();
  if (type == "array") return inst.is_array();
  if (type == "string") return inst.is_string();
  if (type == "number") return inst.is_number();
  if (type == "integer") {
    if (inst.is_number_integer()) return true;
    return inst.is_number_float() && inst.get<double>() == static_cast<double>(static_cast<long long>(inst.get<double>()));
  }
  if (type == "boolean") return inst.is_boolean();
  if (type == "null") return inst.is_null();
  return true; // unknown treated as pass-through
}

static bool matches_type(const Json& schema_type, const Json& inst) {
  if (schema_type.is_string()) return is_type(inst, schema_type.get<std::string>());
  if (schema_type.is_array()) {
    for (auto& t : schema_type)
      if (t.is_string() && is_type(inst, t.get<std::string>())) return true;
    return false;
  }
  return true;
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path);

static void validate_object(const Json& schema, const Json& inst, const std::string& path) {
  if (schema.contains("required") && schema["required"].is_array()) {
    for (auto& req : schema["required"]) {
      auto key = req.get<std::string>();
      if (!inst.contains(key)) throw ValidationError("missing required: " + path + "." + key);
    }
  }
  const bool has_props = schema.contains("properties") && schema["properties"].is_object();
  if (has_props) {
    for (auto& [name, subschema] : schema["properties"].items())
      if (inst.contains(name)) validate_at(subschema, inst[name], path + "." + name);
  }
  if (schema.contains("additionalProperties")) {
    const auto& extra = schema["additionalProperties"];
    for (auto& [name, value] : inst.items()) {
      if (has_props && schema["properties"].contains(name)) continue;
      if (extra.is_boolean() && !extra.get<bool>())
        throw ValidationError("unexpected property: " + path + "." + name);
      if (extra.is_object()) validate_at(extra, value, path + "." + name);
    }
  }
}

static void validate_array(const Json& schema, const Json& inst, const std::string& path) {
  if (schema.contains("minItems") && inst.size() < schema["minItems"].get<size_t>())
    throw ValidationError("too few items: " + path);
  if (schema.contains("maxItems") && inst.size() > schema["maxItems"].get<size_t>())
    throw ValidationError("too many items: " + path);
  if (schema.contains("items") && schema["items"].is_object()) {
    for (size_t i = 0; i < inst.size(); ++i)
      validate_at(schema["items"], inst[i], path + "[" + std::to_string(i) + "]");
  }
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path) {
  if (!schema.is_object()) return;

  if (schema.contains("type") && !matches_type(schema["type"], inst))
    throw ValidationError("type mismatch for: " + path + " (expected " + schema["type"].dump() + ")");

  if (schema.contains("enum") && schema["enum"].is_array()) {
    bool found = false;
    for (auto& candidate : schema["enum"])
      if (candidate == inst) { found = true; break; }
    if (!found) throw ValidationError("value not in enum: " + path);
  }
  if (schema.contains("const") && schema["const"] != inst)
    throw ValidationError("value does not match const: " + path);

  if (inst.is_number()) {
    double v = inst.get<double>();
    if (schema.contains("minimum") && v < schema["minimum"].get<double>())
      throw ValidationError("below minimum: " + path);
    if (schema.contains("maximum") && v > schema["maximum"].get<double>())
      throw ValidationError("above maximum: " + path);
  }
  if (inst.is_string()) {
    auto len = inst.get_ref<const std::string&>().size();
    if (schema.contains("minLength") && len < schema["minLength"].get<size_t>())
      throw ValidationError("string too short: " + path);
    if (schema.contains("maxLength") && len > schema["maxLength"].get<size_t>())
      throw ValidationError("string too long: " + path);
  }
  if (inst.is_object()) validate_object(schema, inst, path);
  if (inst.is_array()) validate_array(schema, inst, path);
}

void validate(const Json& schema, const Json& instance) {
  validate_at(schema, instance, "arguments");
}

Json apply_defaults(const Json& schema, const Json& instance) {
  if (!schema.is_object() || !instance.is_object()) return instance;
  if (!schema.contains("properties") || !schema["properties"].is_object()) return instance;

  Json out = instance;
  for (auto& [name, subschema] : schema["properties"].items()) {
    if (!subschema.is_object()) continue;
    if (!out.contains(name)) {
      if (subschema.contains("default")) out[name] = subschema["default"];
    } else if (out[name].is_object()) {
      out[name] = apply_defaults(subschema, out[name]);
    }
  }
  return out;
}

} // namespace mcpgate::util::schema
