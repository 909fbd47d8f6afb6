#pragma once
#include "mcpgate/exceptions.hpp"
#include "mcpgate/types.hpp"

namespace mcpgate::util::schema
{

// Minimal JSON Schema v7-like validator supporting:
// - type: object, array, string, number, integer, boolean, null (or a list of these)
// - required, properties, additionalProperties: false
// - items, enum, const
// - minimum/maximum, minLength/maxLength, minItems/maxItems
// Throws ValidationError naming the offending path ("arguments.steps").

void validate(const Json& schema, const Json& instance);

// Returns a copy of instance with "default" values filled in for absent
// object properties, recursively.
Json apply_defaults(const Json& schema, const Json& instance);

} // namespace mcpgate::util::schema
