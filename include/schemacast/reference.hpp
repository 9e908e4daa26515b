#pragma once

#include <memory>
#include <optional>
#include <string>

namespace schemacast
{

struct Schema;
class Components;

constexpr const char* SCHEMA_REF_PREFIX = "#/components/schemas/";

/// Named pointer into a components registry (`{"$ref": "#/components/schemas/Pet"}`).
struct Reference
{
    std::string ref;
};

inline bool operator==(const Reference& a, const Reference& b)
{
    return a.ref == b.ref;
}

/// Reference to `#/components/schemas/<name>`.
Reference schema_reference(const std::string& name);

/// Name part of a components schema reference, nullopt for any other pointer.
std::optional<std::string> schema_name(const Reference& reference);

/// Look the referenced schema up in the registry. Returns nullptr when the
/// pointer is not a components schema pointer or the name is not registered.
std::shared_ptr<const Schema> resolve_schema(const Reference& reference,
                                             const Components& components);

} // namespace schemacast
