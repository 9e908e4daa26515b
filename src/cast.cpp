#include "schemacast/cast.hpp"

#include "internal/cast_context.hpp"

#include <cctype>
#include <stdexcept>

namespace schemacast
{
namespace detail
{

namespace
{

// End of the run of digits starting at pos; npos when there is none.
std::size_t scan_digits(const std::string& s, std::size_t pos)
{
    const std::size_t start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
        ++pos;
    return pos == start ? std::string::npos : pos;
}

bool is_integer_text(const std::string& s)
{
    std::size_t pos = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
    return scan_digits(s, pos) == s.size();
}

// [+-]digits[.digits]; no exponent, no leading or trailing dot.
bool is_decimal_text(const std::string& s)
{
    std::size_t pos = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
    pos = scan_digits(s, pos);
    if (pos == std::string::npos)
        return false;
    if (pos == s.size())
        return true;
    if (s[pos] != '.')
        return false;
    return scan_digits(s, pos + 1) == s.size();
}

bool wants_float(const Schema& schema)
{
    return schema.format && (*schema.format == "float" || *schema.format == "double");
}

CastResult cast_boolean(const Value& value, const CastContext& ctx)
{
    if (value.is_bool())
        return CastResult::success(value);
    if (value.is_string())
    {
        const auto& s = value.as<std::string>();
        if (s == "true")
            return CastResult::success(true);
        if (s == "false")
            return CastResult::success(false);
    }
    return invalid_type(ctx, value, "boolean");
}

CastResult cast_integer(const Value& value, const CastContext& ctx)
{
    if (value.is_integer())
        return CastResult::success(value);
    if (value.is_string())
    {
        const auto& s = value.as<std::string>();
        if (is_integer_text(s))
        {
            try
            {
                std::size_t idx = 0;
                const long long parsed = std::stoll(s, &idx);
                if (idx == s.size())
                    return CastResult::success(static_cast<std::int64_t>(parsed));
            }
            catch (const std::out_of_range&)
            {
                return invalid_type(ctx, value, "integer");
            }
        }
    }
    return invalid_type(ctx, value, "integer");
}

CastResult cast_number(const Schema& schema, const Value& value, const CastContext& ctx)
{
    if (value.is_integer())
    {
        if (wants_float(schema))
            return CastResult::success(value.as_double());
        return CastResult::success(value);
    }
    if (value.is_float())
        return CastResult::success(value);
    if (value.is_string())
    {
        const auto& s = value.as<std::string>();
        if (is_decimal_text(s))
        {
            try
            {
                std::size_t idx = 0;
                const double parsed = std::stod(s, &idx);
                if (idx == s.size())
                    return CastResult::success(parsed);
            }
            catch (const std::out_of_range&)
            {
                return invalid_type(ctx, value, "number");
            }
        }
    }
    return invalid_type(ctx, value, "number");
}

CastResult cast_string(const Schema& schema, const Value& value, const CastContext& ctx)
{
    const std::string format = schema.format.value_or("");
    if (format == "date")
    {
        if (value.is_date())
            return CastResult::success(value);
        if (!value.is_string())
            return invalid_type(ctx, value, "string");
        if (auto date = Date::parse(value.as<std::string>()))
            return CastResult::success(*date);
        auto err = ctx.error(CastReason::InvalidDate, value);
        err.expected = "date";
        return CastResult::failure(std::move(err));
    }
    if (format == "date-time")
    {
        if (value.is_date_time())
            return CastResult::success(value);
        if (!value.is_string())
            return invalid_type(ctx, value, "string");
        if (auto dt = DateTime::parse(value.as<std::string>()))
            return CastResult::success(*dt);
        auto err = ctx.error(CastReason::InvalidDateTime, value);
        err.expected = "date-time";
        return CastResult::failure(std::move(err));
    }
    if (value.is_string())
        return CastResult::success(value);
    return invalid_type(ctx, value, "string");
}

CastResult cast_array(const Schema& schema, const Value& value, const CastContext& ctx)
{
    if (!value.is_array())
        return invalid_type(ctx, value, "array");
    if (!schema.items)
        return CastResult::success(value);

    const auto& input = value.as<Value::array_t>();
    Value::array_t out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        auto item = cast_value(*schema.items, input[i], ctx.child(i));
        if (!item)
            return item;
        out.push_back(std::move(item).take_value());
    }
    return CastResult::success(std::move(out));
}

// First branch that casts wins; otherwise the last branch's errors are reported.
CastResult cast_first_match(const std::vector<SchemaRef>& branches, const Value& value,
                            const CastContext& ctx)
{
    std::vector<CastError> last_errors;
    for (const auto& branch : branches)
    {
        auto result = cast_value(branch, value, ctx);
        if (result)
            return result;
        last_errors = result.errors();
    }
    return CastResult::failure(std::move(last_errors));
}

} // namespace

CastResult invalid_type(const CastContext& ctx, const Value& value, const std::string& expected)
{
    auto err = ctx.error(CastReason::InvalidType, value);
    err.expected = expected;
    return CastResult::failure(std::move(err));
}

CastResult cast_value(const SchemaRef& schema, const Value& value, const CastContext& ctx)
{
    auto node = resolve(schema, ctx.components);
    if (!node)
    {
        auto err = ctx.error(CastReason::UnresolvedReference, value);
        if (const auto* ref = std::get_if<Reference>(&schema))
            err.name = ref->ref;
        return CastResult::failure(std::move(err));
    }
    return cast_node(*node, value, ctx);
}

CastResult cast_node(const Schema& schema, const Value& value, const CastContext& ctx)
{
    if (value.is_null() && schema.nullable)
        return CastResult::success(nullptr);

    if (schema.discriminator && !ctx.already_cast(schema.discriminator->property_name))
        return cast_discriminator(schema, value, ctx);
    if (!schema.all_of.empty())
        return cast_all_of(schema, value, ctx);
    if (!schema.one_of.empty())
        return cast_first_match(schema.one_of, value, ctx);
    if (!schema.any_of.empty())
        return cast_first_match(schema.any_of, value, ctx);

    if (!schema.type)
        return CastResult::success(value);

    switch (*schema.type)
    {
    case DataType::Boolean:
        return cast_boolean(value, ctx);
    case DataType::Integer:
        return cast_integer(value, ctx);
    case DataType::Number:
        return cast_number(schema, value, ctx);
    case DataType::String:
        return cast_string(schema, value, ctx);
    case DataType::Array:
        return cast_array(schema, value, ctx);
    case DataType::Object:
        return cast_object(schema, value, ctx);
    }
    return CastResult::success(value);
}

} // namespace detail

CastResult cast(const Schema& schema, const Value& value, const Components& components)
{
    detail::CastContext ctx{components, {}, {}};
    return detail::cast_node(schema, value, ctx);
}

CastResult cast(const SchemaRef& schema, const Value& value, const Components& components)
{
    detail::CastContext ctx{components, {}, {}};
    return detail::cast_value(schema, value, ctx);
}

Value cast_or_throw(const SchemaRef& schema, const Value& value, const Components& components)
{
    auto result = cast(schema, value, components);
    if (!result)
        throw CastFailure(result.errors());
    return std::move(result).take_value();
}

} // namespace schemacast
