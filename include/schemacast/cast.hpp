#pragma once
#include "schemacast/exceptions.hpp"
#include "schemacast/schema.hpp"
#include "schemacast/types.hpp"
#include "schemacast/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace schemacast
{

enum class CastReason
{
    InvalidType,
    UnexpectedField,
    MissingField,
    MaxProperties,
    MinProperties,
    InvalidDate,
    InvalidDateTime,
    UnresolvedReference
};

/// Snake-case tag ("invalid_type", "missing_field", ...).
std::string to_string(CastReason reason);

/// Property name or array index.
using PathSegment = std::variant<std::string, std::size_t>;
using Path = std::vector<PathSegment>;

/// "/user/addresses/0/city"; the empty path renders as "/".
std::string path_to_string(const Path& path);

/// One structured cast failure.
struct CastError
{
    CastReason reason{CastReason::InvalidType};
    Path path;                           ///< From the root of the cast value
    Value value;                         ///< Offending input
    std::optional<std::string> name;     ///< Field or schema name involved
    std::optional<std::string> expected; ///< Expected type or format
    std::optional<std::size_t> limit;    ///< Bound for max/min properties
    std::optional<std::size_t> count;    ///< Actual count for max/min properties

    std::string path_string() const
    {
        return path_to_string(path);
    }
    std::string message() const;
    Json to_json() const;
};

/// Outcome of a cast: a typed value or at least one CastError.
class CastResult
{
  public:
    static CastResult success(Value value);
    static CastResult failure(CastError error);
    static CastResult failure(std::vector<CastError> errors);

    bool ok() const
    {
        return errors_.empty();
    }
    explicit operator bool() const
    {
        return ok();
    }

    /// Throws CastFailure when the cast failed.
    const Value& value() const;
    Value take_value() &&;

    const std::vector<CastError>& errors() const
    {
        return errors_;
    }

  private:
    CastResult() = default;

    Value value_;
    std::vector<CastError> errors_;
};

/// Thrown by cast_or_throw and CastResult::value() on failure.
class CastFailure : public ValidationError
{
  public:
    explicit CastFailure(std::vector<CastError> errors);

    const std::vector<CastError>& errors() const
    {
        return errors_;
    }

  private:
    std::vector<CastError> errors_;
};

/// Cast an untyped value against a schema. Pure: neither the schema nor the
/// registry is modified, and concurrent calls are safe.
CastResult cast(const Schema& schema, const Value& value, const Components& components);
CastResult cast(const SchemaRef& schema, const Value& value, const Components& components);

/// Same as cast, throwing CastFailure instead of returning errors.
Value cast_or_throw(const SchemaRef& schema, const Value& value, const Components& components);

} // namespace schemacast
