#include "schemacast/reference.hpp"

#include "schemacast/schema.hpp"

#include <cstring>

namespace schemacast
{

Reference schema_reference(const std::string& name)
{
    return Reference{SCHEMA_REF_PREFIX + name};
}

std::optional<std::string> schema_name(const Reference& reference)
{
    const std::size_t prefix_len = std::strlen(SCHEMA_REF_PREFIX);
    if (reference.ref.compare(0, prefix_len, SCHEMA_REF_PREFIX) != 0)
        return std::nullopt;
    return reference.ref.substr(prefix_len);
}

std::shared_ptr<const Schema> resolve_schema(const Reference& reference,
                                             const Components& components)
{
    auto name = schema_name(reference);
    if (!name)
        return nullptr;
    return components.find(*name);
}

SchemaPtr resolve(const SchemaRef& ref, const Components& components)
{
    if (const auto* ptr = std::get_if<SchemaPtr>(&ref))
        return *ptr;
    return resolve_schema(std::get<Reference>(ref), components);
}

} // namespace schemacast
