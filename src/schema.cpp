#include "schemacast/schema.hpp"

#include "schemacast/exceptions.hpp"

#include <algorithm>

namespace schemacast
{

std::string to_string(DataType type)
{
    switch (type)
    {
    case DataType::String:
        return "string";
    case DataType::Number:
        return "number";
    case DataType::Integer:
        return "integer";
    case DataType::Boolean:
        return "boolean";
    case DataType::Array:
        return "array";
    case DataType::Object:
        return "object";
    }
    return "object";
}

std::optional<DataType> data_type_from_string(const std::string& s)
{
    if (s == "string")
        return DataType::String;
    if (s == "number")
        return DataType::Number;
    if (s == "integer")
        return DataType::Integer;
    if (s == "boolean")
        return DataType::Boolean;
    if (s == "array")
        return DataType::Array;
    if (s == "object")
        return DataType::Object;
    return std::nullopt;
}

namespace
{

void expect(bool ok, const std::string& keyword, const char* what)
{
    if (!ok)
        throw ValidationError("Schema keyword '" + keyword + "' must be " + what);
}

std::size_t get_size(const Json& j, const std::string& keyword)
{
    const auto& v = j.at(keyword);
    expect(v.is_number_unsigned() || (v.is_number_integer() && v.get<long long>() >= 0), keyword,
           "a non-negative integer");
    return v.get<std::size_t>();
}

double get_number(const Json& j, const std::string& keyword)
{
    const auto& v = j.at(keyword);
    expect(v.is_number(), keyword, "a number");
    return v.get<double>();
}

std::vector<SchemaRef> get_schema_list(const Json& j, const std::string& keyword)
{
    const auto& v = j.at(keyword);
    expect(v.is_array(), keyword, "an array of schemas");
    std::vector<SchemaRef> out;
    for (const auto& item : v)
        out.push_back(schema_ref_from_json(item));
    return out;
}

void apply_type(Schema& s, const Json& t)
{
    if (t.is_string())
    {
        auto type = data_type_from_string(t.get<std::string>());
        if (!type)
            throw ValidationError("Unknown schema type: " + t.get<std::string>());
        s.type = type;
        return;
    }
    expect(t.is_array(), "type", "a string or an array of strings");

    // ["string", "null"] is a nullable string; several concrete types become oneOf.
    std::vector<DataType> types;
    for (const auto& item : t)
    {
        expect(item.is_string(), "type", "a string or an array of strings");
        auto name = item.get<std::string>();
        if (name == "null")
        {
            s.nullable = true;
            continue;
        }
        auto type = data_type_from_string(name);
        if (!type)
            throw ValidationError("Unknown schema type: " + name);
        types.push_back(*type);
    }
    if (types.size() == 1)
    {
        s.type = types.front();
        return;
    }
    for (auto type : types)
    {
        Schema branch;
        branch.type = type;
        s.one_of.push_back(make_schema(std::move(branch)));
    }
}

} // namespace

SchemaRef schema_ref_from_json(const Json& j)
{
    if (j.is_object() && j.contains("$ref"))
    {
        expect(j["$ref"].is_string(), "$ref", "a string");
        return Reference{j["$ref"].get<std::string>()};
    }
    return make_schema(Schema::from_json(j));
}

Schema Schema::from_json(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("Schema must be a JSON object");

    Schema s;
    if (j.contains("title") && j["title"].is_string())
        s.title = j["title"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        s.description = j["description"].get<std::string>();

    if (j.contains("type"))
        apply_type(s, j["type"]);
    if (j.contains("nullable"))
    {
        expect(j["nullable"].is_boolean(), "nullable", "a boolean");
        s.nullable = s.nullable || j["nullable"].get<bool>();
    }
    if (j.contains("format"))
    {
        expect(j["format"].is_string(), "format", "a string");
        s.format = j["format"].get<std::string>();
    }

    if (j.contains("minimum"))
        s.minimum = get_number(j, "minimum");
    if (j.contains("maximum"))
        s.maximum = get_number(j, "maximum");
    // OpenAPI 3.0 uses booleans; a number is a strict bound of its own.
    if (j.contains("exclusiveMinimum"))
    {
        if (j["exclusiveMinimum"].is_boolean())
            s.exclusive_minimum = j["exclusiveMinimum"].get<bool>();
        else
        {
            s.minimum = get_number(j, "exclusiveMinimum");
            s.exclusive_minimum = true;
        }
    }
    if (j.contains("exclusiveMaximum"))
    {
        if (j["exclusiveMaximum"].is_boolean())
            s.exclusive_maximum = j["exclusiveMaximum"].get<bool>();
        else
        {
            s.maximum = get_number(j, "exclusiveMaximum");
            s.exclusive_maximum = true;
        }
    }
    if (j.contains("multipleOf"))
        s.multiple_of = get_number(j, "multipleOf");

    if (j.contains("minLength"))
        s.min_length = get_size(j, "minLength");
    if (j.contains("maxLength"))
        s.max_length = get_size(j, "maxLength");
    if (j.contains("pattern"))
    {
        expect(j["pattern"].is_string(), "pattern", "a string");
        try
        {
            s.pattern.emplace(j["pattern"].get<std::string>());
        }
        catch (const std::regex_error& e)
        {
            throw ValidationError("Invalid pattern '" + j["pattern"].get<std::string>() +
                                  "': " + e.what());
        }
    }

    if (j.contains("items"))
        s.items = schema_ref_from_json(j["items"]);
    if (j.contains("minItems"))
        s.min_items = get_size(j, "minItems");
    if (j.contains("maxItems"))
        s.max_items = get_size(j, "maxItems");
    if (j.contains("uniqueItems"))
    {
        expect(j["uniqueItems"].is_boolean(), "uniqueItems", "a boolean");
        s.unique_items = j["uniqueItems"].get<bool>();
    }

    if (j.contains("properties"))
    {
        expect(j["properties"].is_object(), "properties", "an object");
        Properties props;
        for (const auto& [name, sub] : j["properties"].items())
            props.emplace_back(name, schema_ref_from_json(sub));
        s.properties = std::move(props);
    }
    if (j.contains("required"))
    {
        expect(j["required"].is_array(), "required", "an array of strings");
        for (const auto& r : j["required"])
        {
            expect(r.is_string(), "required", "an array of strings");
            s.required.push_back(r.get<std::string>());
        }
    }
    if (j.contains("additionalProperties"))
    {
        const auto& ap = j["additionalProperties"];
        if (ap.is_boolean())
            s.additional_properties = ap.get<bool>();
        else
            s.additional_properties = schema_ref_from_json(ap);
    }
    if (j.contains("minProperties"))
        s.min_properties = get_size(j, "minProperties");
    if (j.contains("maxProperties"))
        s.max_properties = get_size(j, "maxProperties");

    if (j.contains("allOf"))
        s.all_of = get_schema_list(j, "allOf");
    if (j.contains("oneOf"))
    {
        auto branches = get_schema_list(j, "oneOf");
        s.one_of.insert(s.one_of.end(), branches.begin(), branches.end());
    }
    if (j.contains("anyOf"))
        s.any_of = get_schema_list(j, "anyOf");
    if (j.contains("not"))
        s.not_schema = schema_ref_from_json(j["not"]);

    if (j.contains("discriminator"))
    {
        const auto& d = j["discriminator"];
        expect(d.is_object() && d.contains("propertyName") && d["propertyName"].is_string(),
               "discriminator", "an object with a string propertyName");
        Discriminator disc;
        disc.property_name = d["propertyName"].get<std::string>();
        if (d.contains("mapping"))
        {
            expect(d["mapping"].is_object(), "discriminator.mapping", "an object");
            std::map<std::string, std::string> mapping;
            for (const auto& [key, target] : d["mapping"].items())
            {
                expect(target.is_string(), "discriminator.mapping", "an object of strings");
                mapping[key] = target.get<std::string>();
            }
            disc.mapping = std::move(mapping);
        }
        s.discriminator = std::move(disc);
    }

    if (j.contains("enum"))
    {
        expect(j["enum"].is_array(), "enum", "an array");
        std::vector<Value> values;
        for (const auto& v : j["enum"])
            values.push_back(value_from_json(v));
        s.enum_values = std::move(values);
    }
    if (j.contains("default"))
        s.default_value = value_from_json(j["default"]);

    if (j.contains("x-struct"))
    {
        const auto& xs = j["x-struct"];
        TargetType target;
        if (xs.is_string())
            target.name = xs.get<std::string>();
        else
        {
            expect(xs.is_object() && xs.contains("name") && xs["name"].is_string(), "x-struct",
                   "a type name or an object with a name");
            target.name = xs["name"].get<std::string>();
            if (xs.contains("fields"))
            {
                expect(xs["fields"].is_array(), "x-struct.fields", "an array of strings");
                for (const auto& f : xs["fields"])
                {
                    expect(f.is_string(), "x-struct.fields", "an array of strings");
                    target.fields.push_back(f.get<std::string>());
                }
            }
        }
        s.target_type = std::move(target);
    }
    return s;
}

bool Schema::allows_additional_properties() const
{
    if (!additional_properties)
        return false;
    const auto* flag = std::get_if<bool>(&*additional_properties);
    return flag && *flag;
}

const SchemaRef* Schema::property(const std::string& name) const
{
    if (!properties)
        return nullptr;
    for (const auto& [prop, schema] : *properties)
        if (prop == name)
            return &schema;
    return nullptr;
}

std::vector<std::string> Schema::property_names(const Components& components) const
{
    std::vector<std::string> names;
    auto add = [&names](const std::string& n)
    {
        if (std::find(names.begin(), names.end(), n) == names.end())
            names.push_back(n);
    };
    if (properties)
        for (const auto& [name, _] : *properties)
            add(name);
    for (const auto& branch : all_of)
    {
        auto resolved = resolve(branch, components);
        if (!resolved)
            continue;
        for (const auto& name : resolved->property_names(components))
            add(name);
    }
    return names;
}

Components& Components::add(const std::string& name, Schema schema)
{
    schemas_[name] = std::make_shared<const Schema>(std::move(schema));
    return *this;
}

Components& Components::add(const std::string& name, SchemaPtr schema)
{
    schemas_[name] = std::move(schema);
    return *this;
}

SchemaPtr Components::find(const std::string& name) const
{
    auto it = schemas_.find(name);
    if (it == schemas_.end())
        return nullptr;
    return it->second;
}

const Schema& Components::at(const std::string& name) const
{
    auto it = schemas_.find(name);
    if (it == schemas_.end() || !it->second)
        throw NotFoundError("Schema not found in components: " + name);
    return *it->second;
}

std::vector<std::string> Components::names() const
{
    std::vector<std::string> out;
    out.reserve(schemas_.size());
    for (const auto& [name, _] : schemas_)
        out.push_back(name);
    return out;
}

Components Components::from_json(const Json& schemas)
{
    if (!schemas.is_object())
        throw ValidationError("components.schemas must be a JSON object");
    Components components;
    for (const auto& [name, schema] : schemas.items())
        components.add(name, Schema::from_json(schema));
    return components;
}

Components Components::from_openapi(const Json& document)
{
    if (!document.is_object())
        throw ValidationError("OpenAPI document must be a JSON object");
    if (!document.contains("components") || !document["components"].is_object() ||
        !document["components"].contains("schemas"))
        return Components{};
    return from_json(document["components"]["schemas"]);
}

} // namespace schemacast
