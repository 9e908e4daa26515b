#pragma once

#include "schemacast/cast.hpp"

#include <string>
#include <utility>
#include <vector>

namespace schemacast::detail
{

/// State threaded through one cast call: the registry, the location of the
/// current value, and the properties of the current value that an enclosing
/// discriminator pass has already cast.
struct CastContext
{
    const Components& components;
    Path path;
    std::vector<std::string> cast_fields;

    CastContext child(PathSegment segment) const
    {
        CastContext c{components, path, {}};
        c.path.push_back(std::move(segment));
        return c;
    }

    CastError error(CastReason reason, const Value& value) const
    {
        CastError e;
        e.reason = reason;
        e.path = path;
        e.value = value;
        return e;
    }

    bool already_cast(const std::string& field) const
    {
        for (const auto& f : cast_fields)
            if (f == field)
                return true;
        return false;
    }
};

CastResult cast_value(const SchemaRef& schema, const Value& value, const CastContext& ctx);
CastResult cast_node(const Schema& schema, const Value& value, const CastContext& ctx);
CastResult cast_object(const Schema& schema, const Value& value, const CastContext& ctx);
CastResult cast_discriminator(const Schema& schema, const Value& value, const CastContext& ctx);
CastResult cast_all_of(const Schema& schema, const Value& value, const CastContext& ctx);

CastResult invalid_type(const CastContext& ctx, const Value& value, const std::string& expected);

} // namespace schemacast::detail
