#pragma once
#include "schemacast/reference.hpp"
#include "schemacast/types.hpp"
#include "schemacast/value.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemacast
{

/// The basic data types of an OpenAPI schema.
enum class DataType
{
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object
};

std::string to_string(DataType type);
std::optional<DataType> data_type_from_string(const std::string& s);

struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

/// A child schema: either an inline node or a reference into the registry.
using SchemaRef = std::variant<SchemaPtr, Reference>;

using Properties = std::vector<std::pair<std::string, SchemaRef>>;

/// Selects the concrete schema of a polymorphic object from one of its properties.
struct Discriminator
{
    std::string property_name;
    /// Discriminator value -> schema name or `#/components/schemas/` reference.
    /// Without a mapping the value itself is the schema name.
    std::optional<std::map<std::string, std::string>> mapping;
};

/// Concrete structured type an object cast materialises into (`x-struct`).
struct TargetType
{
    std::string name;
    /// Declared fields. Empty means every cast property becomes a field.
    std::vector<std::string> fields;
};

/// Regular expression compiled once, when the schema is built.
struct Pattern
{
    std::string source;
    std::regex regex;

    explicit Pattern(std::string src) : source(std::move(src)), regex(source, std::regex::ECMAScript)
    {
    }
};

/// One node of the schema tree. All fields are optional and orthogonal: a node
/// can be an object, carry a discriminator and list allOf schemas at once.
/// Nodes are never modified by cast or validate.
struct Schema
{
    std::optional<std::string> title;
    std::optional<std::string> description;

    std::optional<DataType> type;
    bool nullable{false};
    std::optional<std::string> format;

    // numbers
    std::optional<double> minimum;
    std::optional<double> maximum;
    bool exclusive_minimum{false};
    bool exclusive_maximum{false};
    std::optional<double> multiple_of;

    // strings
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<Pattern> pattern;

    // arrays
    std::optional<SchemaRef> items;
    std::optional<std::size_t> min_items;
    std::optional<std::size_t> max_items;
    bool unique_items{false};

    // objects
    std::optional<Properties> properties;
    std::vector<std::string> required;
    std::optional<std::variant<bool, SchemaRef>> additional_properties;
    std::optional<std::size_t> min_properties;
    std::optional<std::size_t> max_properties;

    // combinators
    std::vector<SchemaRef> all_of;
    std::vector<SchemaRef> one_of;
    std::vector<SchemaRef> any_of;
    std::optional<SchemaRef> not_schema;
    std::optional<Discriminator> discriminator;

    std::optional<std::vector<Value>> enum_values;
    std::optional<Value> default_value;
    std::optional<TargetType> target_type;

    bool has_combinators() const
    {
        return !all_of.empty() || !one_of.empty() || !any_of.empty() || not_schema.has_value() ||
               discriminator.has_value();
    }

    /// `additionalProperties: true`, the only setting that lets object casting
    /// accept undeclared keys.
    bool allows_additional_properties() const;

    /// Declared schema of a property, nullptr when not declared on this node.
    const SchemaRef* property(const std::string& name) const;

    /// Names of all declared properties, including those contributed through
    /// allOf (first occurrence wins, declaration order kept).
    std::vector<std::string> property_names(const Components& components) const;

    /// Build a node from an OpenAPI schema object. Throws ValidationError when a
    /// keyword has the wrong JSON type.
    static Schema from_json(const Json& j);
};

inline SchemaRef make_schema(Schema schema)
{
    return std::make_shared<const Schema>(std::move(schema));
}

/// Parse a child position: `{"$ref": ...}` becomes a Reference.
SchemaRef schema_ref_from_json(const Json& j);

/// Registry of named schemas (`components.schemas`). Owned by the caller and
/// read-only while a cast or validate call runs.
class Components
{
  public:
    Components() = default;

    Components& add(const std::string& name, Schema schema);
    Components& add(const std::string& name, SchemaPtr schema);

    /// nullptr when absent.
    SchemaPtr find(const std::string& name) const;
    /// Throws NotFoundError when absent.
    const Schema& at(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return schemas_.count(name) > 0;
    }
    std::size_t size() const
    {
        return schemas_.size();
    }
    std::vector<std::string> names() const;

    /// Build from a `components.schemas` object.
    static Components from_json(const Json& schemas);
    /// Build from a whole OpenAPI document.
    static Components from_openapi(const Json& document);

  private:
    std::map<std::string, SchemaPtr> schemas_;
};

/// Resolve a child position to a node; nullptr for an unresolvable reference.
SchemaPtr resolve(const SchemaRef& ref, const Components& components);

} // namespace schemacast
