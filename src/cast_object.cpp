#include "schemacast/cast.hpp"

#include "internal/cast_context.hpp"

#include <algorithm>

namespace schemacast::detail
{

namespace
{

const Value* find_field(const Value::object_t& object, const std::string& key)
{
    for (const auto& [name, value] : object)
        if (name == key)
            return &value;
    return nullptr;
}

Value materialize(const Schema& schema, Value::object_t fields)
{
    if (!schema.target_type)
        return fields;

    const auto& target = *schema.target_type;
    Record record{target.name, {}};
    if (target.fields.empty())
    {
        record.fields = std::move(fields);
        return record;
    }
    for (const auto& name : target.fields)
        if (const auto* field = find_field(fields, name))
            record.fields.emplace_back(name, *field);
    return record;
}

CastResult property_count_error(const CastContext& ctx, const Value& value, CastReason reason,
                                std::size_t limit, std::size_t count)
{
    auto err = ctx.error(reason, value);
    err.limit = limit;
    err.count = count;
    return CastResult::failure(std::move(err));
}

void add_unique(std::vector<std::string>& names, const std::string& name)
{
    if (std::find(names.begin(), names.end(), name) == names.end())
        names.push_back(name);
}

// Merge one allOf branch (and, recursively, its own allOf list) into the
// synthetic schema. Returns the unresolvable reference, if any.
std::optional<std::string> merge_branch(Schema& merged, Properties& props, bool& has_props,
                                        const SchemaRef& branch, const Components& components)
{
    auto node = resolve(branch, components);
    if (!node)
    {
        if (const auto* ref = std::get_if<Reference>(&branch))
            return ref->ref;
        return std::string("allOf");
    }

    if (node->properties)
    {
        has_props = true;
        for (const auto& entry : *node->properties)
        {
            const std::string& name = entry.first;
            auto declared = std::find_if(props.begin(), props.end(),
                                         [&name](const auto& p) { return p.first == name; });
            if (declared == props.end())
                props.push_back(entry);
        }
    }
    for (const auto& name : node->required)
        add_unique(merged.required, name);

    if (!merged.type && node->type)
    {
        merged.type = node->type;
        merged.format = node->format;
    }
    if (!merged.discriminator && node->discriminator)
        merged.discriminator = node->discriminator;

    for (const auto& nested : node->all_of)
        if (auto missing = merge_branch(merged, props, has_props, nested, components))
            return missing;
    return std::nullopt;
}

} // namespace

CastResult cast_object(const Schema& schema, const Value& value, const CastContext& ctx)
{
    if (!value.is_object())
        return invalid_type(ctx, value, "object");
    if (!schema.properties)
        return CastResult::success(value);

    const auto& input = *value.fields();

    if (!schema.allows_additional_properties())
    {
        for (const auto& [key, _] : input)
        {
            if (schema.property(key))
                continue;
            auto err = ctx.child(key).error(CastReason::UnexpectedField, value);
            err.name = key;
            return CastResult::failure(std::move(err));
        }
    }

    Value::object_t present;
    for (const auto& [key, field] : input)
        if (schema.property(key))
            present.emplace_back(key, field);

    std::vector<CastError> missing;
    for (const auto& name : schema.required)
    {
        if (find_field(present, name))
            continue;
        auto err = ctx.child(name).error(CastReason::MissingField, value);
        err.name = name;
        missing.push_back(std::move(err));
    }
    if (!missing.empty())
        return CastResult::failure(std::move(missing));

    if (schema.max_properties && present.size() > *schema.max_properties)
        return property_count_error(ctx, value, CastReason::MaxProperties, *schema.max_properties,
                                    present.size());
    if (schema.min_properties && present.size() < *schema.min_properties)
        return property_count_error(ctx, value, CastReason::MinProperties, *schema.min_properties,
                                    present.size());

    Value::object_t out;
    out.reserve(present.size());
    for (const auto& [key, field] : present)
    {
        auto result = cast_value(*schema.property(key), field, ctx.child(key));
        if (!result)
            return result;
        out.emplace_back(key, std::move(result).take_value());
    }

    for (const auto& [name, prop] : *schema.properties)
    {
        if (find_field(out, name) ||
            std::find(schema.required.begin(), schema.required.end(), name) !=
                schema.required.end())
            continue;
        auto node = resolve(prop, ctx.components);
        if (node && node->default_value)
            out.emplace_back(name, *node->default_value);
    }

    return CastResult::success(materialize(schema, std::move(out)));
}

CastResult cast_discriminator(const Schema& schema, const Value& value, const CastContext& ctx)
{
    const auto& discriminator = *schema.discriminator;
    if (!value.is_object())
        return invalid_type(ctx, value, "object");

    // Cast the properties this node declares; the rest is left to the derived schema.
    Value::object_t partial;
    std::vector<std::string> cast_fields = ctx.cast_fields;
    for (const auto& [key, field] : *value.fields())
    {
        const auto* prop = schema.property(key);
        if (!prop || ctx.already_cast(key))
        {
            partial.emplace_back(key, field);
            continue;
        }
        auto result = cast_value(*prop, field, ctx.child(key));
        if (!result)
            return result;
        partial.emplace_back(key, std::move(result).take_value());
        cast_fields.push_back(key);
    }

    const auto& property = discriminator.property_name;
    const Value* tag = find_field(partial, property);
    if (!tag)
    {
        auto err = ctx.child(property).error(CastReason::MissingField, value);
        err.name = property;
        return CastResult::failure(std::move(err));
    }
    if (!tag->is_string())
        return invalid_type(ctx.child(property), *tag, "string");

    std::string target = tag->as<std::string>();
    if (discriminator.mapping)
    {
        auto it = discriminator.mapping->find(target);
        if (it != discriminator.mapping->end())
            target = it->second;
    }
    SchemaPtr derived = target.rfind("#", 0) == 0
                            ? resolve_schema(Reference{target}, ctx.components)
                            : ctx.components.find(target);
    if (!derived)
    {
        auto err = ctx.child(property).error(CastReason::UnresolvedReference, *tag);
        err.name = target;
        return CastResult::failure(std::move(err));
    }

    add_unique(cast_fields, property);
    CastContext next{ctx.components, ctx.path, std::move(cast_fields)};
    return cast_node(*derived, Value(std::move(partial)), next);
}

CastResult cast_all_of(const Schema& schema, const Value& value, const CastContext& ctx)
{
    Schema merged = schema;
    merged.all_of.clear();

    Properties props = schema.properties.value_or(Properties{});
    bool has_props = schema.properties.has_value();
    for (const auto& branch : schema.all_of)
    {
        if (auto missing = merge_branch(merged, props, has_props, branch, ctx.components))
        {
            auto err = ctx.error(CastReason::UnresolvedReference, value);
            err.name = *missing;
            return CastResult::failure(std::move(err));
        }
    }
    if (has_props)
    {
        merged.properties = std::move(props);
        if (!merged.type)
            merged.type = DataType::Object;
    }
    return cast_node(merged, value, ctx);
}

} // namespace schemacast::detail
