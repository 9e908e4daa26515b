#include "schemacast/parameters.hpp"

#include "schemacast/exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace schemacast
{

std::string to_string(ParameterLocation location)
{
    switch (location)
    {
    case ParameterLocation::Path:
        return "path";
    case ParameterLocation::Query:
        return "query";
    case ParameterLocation::Header:
        return "header";
    case ParameterLocation::Cookie:
        return "cookie";
    }
    return "query";
}

std::optional<ParameterLocation> parameter_location_from_string(const std::string& s)
{
    if (s == "path")
        return ParameterLocation::Path;
    if (s == "query")
        return ParameterLocation::Query;
    if (s == "header")
        return ParameterLocation::Header;
    if (s == "cookie")
        return ParameterLocation::Cookie;
    return std::nullopt;
}

Parameter Parameter::from_json(const Json& j)
{
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string())
        throw ValidationError("Parameter must be an object with a string name");
    if (!j.contains("in") || !j["in"].is_string())
        throw ValidationError("Parameter '" + j["name"].get<std::string>() + "' is missing 'in'");

    Parameter p;
    p.name = j["name"].get<std::string>();
    auto location = parameter_location_from_string(j["in"].get<std::string>());
    if (!location)
        throw ValidationError("Unknown parameter location: " + j["in"].get<std::string>());
    p.location = *location;
    if (j.contains("required"))
    {
        if (!j["required"].is_boolean())
            throw ValidationError("Parameter '" + p.name +
                                  "' keyword 'required' must be a boolean");
        p.required = j["required"].get<bool>();
    }
    if (j.contains("schema"))
        p.schema = schema_ref_from_json(j["schema"]);
    if (j.contains("description") && j["description"].is_string())
        p.description = j["description"].get<std::string>();
    return p;
}

namespace
{

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Only the declared headers, renamed to their declared spelling.
Json select_headers(const Json& raw, const std::vector<Parameter>& parameters)
{
    Json out = Json::object();
    if (!raw.is_object())
        return out;
    for (const auto& [key, value] : raw.items())
    {
        const std::string lowered = to_lower(key);
        for (const auto& p : parameters)
        {
            if (to_lower(p.name) == lowered)
            {
                out[p.name] = value;
                break;
            }
        }
    }
    return out;
}

} // namespace

Schema location_schema(const std::vector<Parameter>& parameters, const Components& components)
{
    Schema schema;
    schema.type = DataType::Object;
    schema.additional_properties = false;

    Properties props;
    std::vector<std::variant<bool, SchemaRef>> declared_additional;
    for (const auto& p : parameters)
    {
        SchemaRef prop = p.schema;
        if (auto resolved = resolve(p.schema, components))
        {
            prop = resolved;
            if (resolved->additional_properties)
            {
                const auto* flag = std::get_if<bool>(&*resolved->additional_properties);
                if (!flag || *flag)
                    declared_additional.push_back(*resolved->additional_properties);
            }
        }
        props.emplace_back(p.name, std::move(prop));
        if (p.required)
            schema.required.push_back(p.name);
    }
    schema.properties = std::move(props);

    if (declared_additional.size() == 1)
        schema.additional_properties = declared_additional.front();
    return schema;
}

CastResult cast_parameters(const ParameterValues& values, const std::vector<Parameter>& parameters,
                           const Components& components, const Logger* logger)
{
    std::map<ParameterLocation, std::vector<Parameter>> by_location;
    for (const auto& p : parameters)
        by_location[p.location].push_back(p);

    Value::object_t merged;
    for (const auto& [location, declared] : by_location)
    {
        Json raw = Json::object();
        auto it = values.find(location);
        if (it != values.end())
            raw = location == ParameterLocation::Header ? select_headers(it->second, declared)
                                                        : it->second;

        if (logger)
            logger->debug("casting " + std::to_string(declared.size()) + " " +
                          to_string(location) + " parameter(s)");

        auto result = cast(location_schema(declared, components), raw, components);
        if (!result)
        {
            if (logger)
                logger->debug(to_string(location) +
                              " parameters failed: " + result.errors().front().message());
            return result;
        }

        const auto* fields = result.value().fields();
        if (!fields)
            continue;
        for (const auto& field : *fields)
        {
            const std::string& key = field.first;
            auto existing = std::find_if(merged.begin(), merged.end(),
                                         [&key](const auto& entry) { return entry.first == key; });
            if (existing != merged.end())
                existing->second = field.second;
            else
                merged.push_back(field);
        }
    }
    return CastResult::success(std::move(merged));
}

} // namespace schemacast
