#pragma once
#include "schemacast/exceptions.hpp"
#include "schemacast/schema.hpp"
#include "schemacast/value.hpp"

#include <optional>
#include <string>

namespace schemacast
{

/// Check a value (normally the output of cast) against a schema's constraints.
/// Returns std::nullopt when the value is valid, otherwise one message whose
/// lines are prefixed with the JSON-pointer-like location ("#/user/name: ...").
/// Nested property and allOf violations are all reported, one per line.
///
/// Raw ISO strings are accepted where the schema expects a date or date-time,
/// as are the Date and DateTime values cast produces.
std::optional<std::string> validate(const Schema& schema, const Value& value,
                                    const Components& components);
std::optional<std::string> validate(const SchemaRef& schema, const Value& value,
                                    const Components& components);

/// Same as validate, throwing ValidationError with the message on failure.
void validate_or_throw(const SchemaRef& schema, const Value& value, const Components& components);

} // namespace schemacast
