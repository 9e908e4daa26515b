#pragma once
#include "schemacast/cast.hpp"
#include "schemacast/logging.hpp"
#include "schemacast/schema.hpp"
#include "schemacast/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace schemacast
{

enum class ParameterLocation
{
    Path,
    Query,
    Header,
    Cookie
};

std::string to_string(ParameterLocation location);
std::optional<ParameterLocation> parameter_location_from_string(const std::string& s);

/// A declared operation parameter.
struct Parameter
{
    std::string name;
    ParameterLocation location{ParameterLocation::Query};
    SchemaRef schema{make_schema(Schema{})};
    bool required{false};
    std::optional<std::string> description;

    /// Build from an OpenAPI parameter object (`name`, `in`, `required`, `schema`).
    static Parameter from_json(const Json& j);
};

/// Raw values extracted from a request, per location: an object of parameter
/// name to string (or array of strings).
using ParameterValues = std::map<ParameterLocation, Json>;

/// Synthetic object schema for the parameters of one location.
/// `additionalProperties` is false unless exactly one parameter schema declares
/// a non-false `additionalProperties`, whose value is then used.
Schema location_schema(const std::vector<Parameter>& parameters, const Components& components);

/// Cast every location's raw values against its synthetic schema and merge the
/// results into one mapping. Fails with the errors of the first failing location.
/// Header names are matched case-insensitively and only declared headers are kept.
CastResult cast_parameters(const ParameterValues& values, const std::vector<Parameter>& parameters,
                           const Components& components, const Logger* logger = nullptr);

} // namespace schemacast
