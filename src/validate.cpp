#include "schemacast/validate.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <regex>
#include <vector>

namespace schemacast
{

namespace
{

using Result = std::optional<std::string>;

Result validate_ref(const SchemaRef& ref, const Value& value, const std::string& path,
                    const Components& components);
Result validate_node(const Schema& schema, const Value& value, const std::string& path,
                     const Components& components);

std::string fail(const std::string& path, const std::string& message)
{
    return path + ": " + message;
}

std::string join(const std::vector<std::string>& messages)
{
    std::string out;
    for (const auto& m : messages)
    {
        if (!out.empty())
            out += '\n';
        out += m;
    }
    return out;
}

std::string show(const Value& value)
{
    return value_to_json(value).dump();
}

std::string show_number(double d)
{
    if (std::floor(d) == d && std::fabs(d) < 1e15)
        return std::to_string(static_cast<long long>(d));
    return Json(d).dump();
}

std::size_t utf8_length(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++n;
    return n;
}

bool has_space(const std::string& s)
{
    return std::any_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// local@domain with a dot inside the domain, no whitespace and a single '@'.
bool is_email(const std::string& s)
{
    const auto at = s.find('@');
    if (at == std::string::npos || at == 0 || s.find('@', at + 1) != std::string::npos ||
        has_space(s))
        return false;
    const std::string domain = s.substr(at + 1);
    const auto dot = domain.find('.', 1);
    return dot != std::string::npos && dot + 1 < domain.size();
}

// scheme://rest, the scheme starting with a letter.
bool is_uri(const std::string& s)
{
    const auto sep = s.find("://");
    if (sep == std::string::npos || sep == 0 || sep + 3 >= s.size())
        return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])))
        return false;
    for (std::size_t i = 1; i < sep; ++i)
    {
        const auto c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '.' && c != '-')
            return false;
    }
    return s.find_first_of("\r\n", sep + 3) == std::string::npos;
}

bool matches_type(DataType type, const Schema& schema, const Value& value)
{
    switch (type)
    {
    case DataType::String:
    {
        if (value.is_string())
            return true;
        const std::string format = schema.format.value_or("");
        return (format == "date" && value.is_date()) ||
               (format == "date-time" && value.is_date_time());
    }
    case DataType::Number:
        return value.is_number();
    case DataType::Integer:
        return value.is_integer();
    case DataType::Boolean:
        return value.is_bool();
    case DataType::Array:
        return value.is_array();
    case DataType::Object:
        return value.is_object();
    }
    return true;
}

Result validate_number(const Schema& schema, const Value& value, const std::string& path)
{
    const double num = value.as_double();
    const std::string shown = show(value);

    if (schema.minimum)
    {
        const double minv = *schema.minimum;
        if (schema.exclusive_minimum && num <= minv)
            return fail(path, shown + " is smaller than or equal to exclusive minimum " +
                                  show_number(minv));
        if (num < minv)
            return fail(path, shown + " is smaller than minimum " + show_number(minv));
    }
    if (schema.maximum)
    {
        const double maxv = *schema.maximum;
        if (schema.exclusive_maximum && num >= maxv)
            return fail(path, shown + " is larger than or equal to exclusive maximum " +
                                  show_number(maxv));
        if (num > maxv)
            return fail(path, shown + " is larger than maximum " + show_number(maxv));
    }
    if (schema.multiple_of && *schema.multiple_of != 0.0)
    {
        const double step = *schema.multiple_of;
        bool multiple = false;
        // 2^63 is the first double above the int64 range
        if (value.is_integer() && std::floor(step) == step && step >= 1.0 &&
            step < 9223372036854775808.0)
            multiple = value.as<std::int64_t>() % static_cast<std::int64_t>(step) == 0;
        else
        {
            const double div = num / step;
            const double nearest = std::round(div);
            multiple = std::fabs(div - nearest) <= 1e-9 && (nearest != 0.0 || num == 0.0);
        }
        if (!multiple)
            return fail(path, shown + " is not a multiple of " + show_number(step));
    }
    if (value.is_integer() && schema.format && *schema.format == "int32")
    {
        const auto i = value.as<std::int64_t>();
        if (i < std::numeric_limits<std::int32_t>::min() ||
            i > std::numeric_limits<std::int32_t>::max())
            return fail(path, shown + " is out of range for format int32");
    }
    return std::nullopt;
}

Result validate_string(const Schema& schema, const std::string& s, const std::string& path)
{
    const std::size_t length = utf8_length(s);
    if (schema.min_length && length < *schema.min_length)
        return fail(path, "String length " + std::to_string(length) + " is smaller than minLength " +
                              std::to_string(*schema.min_length));
    if (schema.max_length && length > *schema.max_length)
        return fail(path, "String length " + std::to_string(length) + " is larger than maxLength " +
                              std::to_string(*schema.max_length));
    if (schema.pattern && !std::regex_match(s, schema.pattern->regex))
        return fail(path, "Value " + Json(s).dump() +
                              " does not match pattern: " + schema.pattern->source);

    if (!schema.format)
        return std::nullopt;
    const std::string& format = *schema.format;
    bool ok = true;
    if (format == "date")
        ok = Date::parse(s).has_value();
    else if (format == "date-time")
        ok = DateTime::parse(s).has_value();
    else if (format == "email")
        ok = is_email(s);
    else if (format == "uri")
        ok = is_uri(s);
    if (!ok)
        return fail(path, "Value " + Json(s).dump() + " is not a valid " + format);
    return std::nullopt;
}

Result validate_array(const Schema& schema, const Value::array_t& items, const std::string& path,
                      const Components& components)
{
    if (schema.min_items && items.size() < *schema.min_items)
        return fail(path, "Array length " + std::to_string(items.size()) +
                              " is smaller than minItems " + std::to_string(*schema.min_items));
    if (schema.max_items && items.size() > *schema.max_items)
        return fail(path, "Array length " + std::to_string(items.size()) +
                              " is larger than maxItems " + std::to_string(*schema.max_items));
    if (schema.unique_items)
    {
        for (std::size_t i = 0; i < items.size(); ++i)
            for (std::size_t j = i + 1; j < items.size(); ++j)
                if (items[i] == items[j])
                    return fail(path, "Array items at " + std::to_string(i) + " and " +
                                          std::to_string(j) + " are not unique");
    }
    if (schema.items)
    {
        for (std::size_t i = 0; i < items.size(); ++i)
            if (auto err = validate_ref(*schema.items, items[i], path + "/" + std::to_string(i),
                                        components))
                return err;
    }
    return std::nullopt;
}

Result validate_object(const Schema& schema, const Value::object_t& fields,
                       const std::string& path, const Components& components)
{
    auto has = [&fields](const std::string& key)
    {
        for (const auto& field : fields)
            if (field.first == key)
                return true;
        return false;
    };

    std::vector<std::string> missing;
    for (const auto& name : schema.required)
        if (!has(name))
            missing.push_back(name);
    if (!missing.empty())
    {
        std::string names;
        for (const auto& name : missing)
            names += (names.empty() ? "" : ", ") + name;
        return fail(path, "Missing required properties: " + names);
    }
    if (schema.max_properties && fields.size() > *schema.max_properties)
        return fail(path, "Object property count " + std::to_string(fields.size()) +
                              " is larger than maxProperties " +
                              std::to_string(*schema.max_properties));
    if (schema.min_properties && fields.size() < *schema.min_properties)
        return fail(path, "Object property count " + std::to_string(fields.size()) +
                              " is smaller than minProperties " +
                              std::to_string(*schema.min_properties));

    std::vector<std::string> errors;
    for (const auto& [key, field] : fields)
    {
        const std::string child = path + "/" + key;
        if (const auto* prop = schema.property(key))
        {
            if (auto err = validate_ref(*prop, field, child, components))
                errors.push_back(*err);
            continue;
        }
        if (!schema.additional_properties)
            continue;
        if (const auto* allowed = std::get_if<bool>(&*schema.additional_properties))
        {
            if (!*allowed)
                errors.push_back(fail(child, "Unexpected property"));
            continue;
        }
        const auto& extra = std::get<SchemaRef>(*schema.additional_properties);
        if (auto err = validate_ref(extra, field, child, components))
            errors.push_back(*err);
    }
    if (!errors.empty())
        return join(errors);
    return std::nullopt;
}

Result validate_combinators(const Schema& schema, const Value& value, const std::string& path,
                            const Components& components)
{
    if (!schema.all_of.empty())
    {
        std::vector<std::string> errors;
        for (const auto& branch : schema.all_of)
            if (auto err = validate_ref(branch, value, path, components))
                errors.push_back(*err);
        if (!errors.empty())
            return join(errors);
    }
    if (!schema.one_of.empty())
    {
        std::size_t matched = 0;
        for (const auto& branch : schema.one_of)
            if (!validate_ref(branch, value, path, components))
                ++matched;
        if (matched == 0)
            return fail(path, "Failed to match any schema in oneOf");
        if (matched > 1)
            return fail(path, "Matched " + std::to_string(matched) +
                                  " schemas in oneOf, expected exactly one");
    }
    if (!schema.any_of.empty())
    {
        bool matched = false;
        for (const auto& branch : schema.any_of)
        {
            if (!validate_ref(branch, value, path, components))
            {
                matched = true;
                break;
            }
        }
        if (!matched)
            return fail(path, "Failed to match any schema in anyOf");
    }
    if (schema.not_schema && !validate_ref(*schema.not_schema, value, path, components))
        return fail(path, "Value " + show(value) + " matches schema in not");
    return std::nullopt;
}

Result validate_node(const Schema& schema, const Value& value, const std::string& path,
                     const Components& components)
{
    if (schema.nullable && value.is_null())
        return std::nullopt;

    if (schema.type && !matches_type(*schema.type, schema, value))
        return fail(path, "Expected " + to_string(*schema.type) + ", got " + type_name(value));

    Result err;
    if (value.is_number())
        err = validate_number(schema, value, path);
    else if (value.is_string())
        err = validate_string(schema, value.as<std::string>(), path);
    else if (value.is_array())
        err = validate_array(schema, value.as<Value::array_t>(), path, components);
    else if (value.is_object())
        err = validate_object(schema, *value.fields(), path, components);
    if (err)
        return err;

    if (schema.enum_values)
    {
        bool found = false;
        for (const auto& allowed : *schema.enum_values)
        {
            if (allowed == value)
            {
                found = true;
                break;
            }
        }
        if (!found)
        {
            Json listed = Json::array();
            for (const auto& allowed : *schema.enum_values)
                listed.push_back(value_to_json(allowed));
            return fail(path, "Value " + show(value) + " is not one of " + listed.dump());
        }
    }

    return validate_combinators(schema, value, path, components);
}

Result validate_ref(const SchemaRef& ref, const Value& value, const std::string& path,
                    const Components& components)
{
    auto node = resolve(ref, components);
    if (!node)
    {
        const auto* reference = std::get_if<Reference>(&ref);
        return fail(path, "Unresolved schema reference: " + (reference ? reference->ref : ""));
    }
    return validate_node(*node, value, path, components);
}

} // namespace

std::optional<std::string> validate(const Schema& schema, const Value& value,
                                    const Components& components)
{
    return validate_node(schema, value, "#", components);
}

std::optional<std::string> validate(const SchemaRef& schema, const Value& value,
                                    const Components& components)
{
    return validate_ref(schema, value, "#", components);
}

void validate_or_throw(const SchemaRef& schema, const Value& value, const Components& components)
{
    if (auto err = validate(schema, value, components))
        throw ValidationError(*err);
}

} // namespace schemacast
