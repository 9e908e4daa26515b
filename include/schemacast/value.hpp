#pragma once
#include "schemacast/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemacast
{

/// Calendar date produced by casting a `format: date` string.
struct Date
{
    int year{1970};
    unsigned month{1};
    unsigned day{1};

    /// Parses ISO-8601 `YYYY-MM-DD` with exact field widths and a valid day of month.
    static std::optional<Date> parse(const std::string& text);
    std::string to_iso8601() const;
};

/// UTC instant produced by casting a `format: date-time` string.
struct DateTime
{
    std::int64_t seconds{0}; ///< Seconds since the Unix epoch
    std::uint32_t microsecond{0};

    /// Parses an RFC-3339 timestamp. The offset (`Z` or `+HH:MM`) is mandatory
    /// and the result is normalised to UTC.
    static std::optional<DateTime> parse(const std::string& text);
    std::string to_iso8601() const;
};

inline bool operator==(const Date& a, const Date& b)
{
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b)
{
    return !(a == b);
}
inline bool operator==(const DateTime& a, const DateTime& b)
{
    return a.seconds == b.seconds && a.microsecond == b.microsecond;
}
inline bool operator!=(const DateTime& a, const DateTime& b)
{
    return !(a == b);
}

struct Value;

/// Instance of a target type materialised by object casting (`x-struct`).
struct Record
{
    std::string type_name;
    std::vector<std::pair<std::string, Value>> fields;
};

Value value_from_json(const Json& j);

/// Typed value produced by casting. Also the input of both engines, so that
/// already cast values (dates, records) can be cast or validated again.
struct Value
{
    using array_t = std::vector<Value>;
    using object_t = std::vector<std::pair<std::string, Value>>;
    using variant_t = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Date,
                                   DateTime, array_t, object_t, Record>;

    variant_t value;

    Value() : value(nullptr) {}
    Value(std::nullptr_t v) : value(v) {}
    Value(bool v) : value(v) {}
    Value(std::int64_t v) : value(v) {}
    Value(int v) : value(static_cast<std::int64_t>(v)) {}
    Value(double v) : value(v) {}
    Value(const std::string& v) : value(v) {}
    Value(std::string&& v) : value(std::move(v)) {}
    Value(const char* v) : value(std::string(v)) {}
    Value(const Date& v) : value(v) {}
    Value(const DateTime& v) : value(v) {}
    Value(const array_t& v) : value(v) {}
    Value(array_t&& v) : value(std::move(v)) {}
    Value(const object_t& v) : value(v) {}
    Value(object_t&& v) : value(std::move(v)) {}
    Value(const Record& v) : value(v) {}
    Value(Record&& v) : value(std::move(v)) {}
    Value(const Json& j) : Value(value_from_json(j)) {}

    bool is_null() const
    {
        return std::holds_alternative<std::nullptr_t>(value);
    }
    bool is_bool() const
    {
        return std::holds_alternative<bool>(value);
    }
    bool is_integer() const
    {
        return std::holds_alternative<std::int64_t>(value);
    }
    bool is_float() const
    {
        return std::holds_alternative<double>(value);
    }
    bool is_number() const
    {
        return is_integer() || is_float();
    }
    bool is_string() const
    {
        return std::holds_alternative<std::string>(value);
    }
    bool is_date() const
    {
        return std::holds_alternative<Date>(value);
    }
    bool is_date_time() const
    {
        return std::holds_alternative<DateTime>(value);
    }
    bool is_array() const
    {
        return std::holds_alternative<array_t>(value);
    }
    bool is_record() const
    {
        return std::holds_alternative<Record>(value);
    }
    /// Plain mappings and records both count as objects.
    bool is_object() const
    {
        return std::holds_alternative<object_t>(value) || is_record();
    }

    template <typename T>
    const T& as() const
    {
        return std::get<T>(value);
    }

    /// Numeric value as a double; only meaningful when is_number().
    double as_double() const;

    /// Key/value pairs of a mapping or record, nullptr for anything else.
    const object_t* fields() const;

    /// Field lookup on a mapping or record.
    const Value* find(const std::string& key) const;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b)
{
    return !(a == b);
}
bool operator==(const Record& a, const Record& b);

/// Short runtime type name used in error messages ("integer", "date-time", ...).
std::string type_name(const Value& value);

/// Convert a Value back to Json. Dates render as ISO-8601 strings and records
/// as plain objects.
Json value_to_json(const Value& value);

/// Bind a value to a concrete C++ type through nlohmann::json's from_json.
template <typename T>
T get_as(const Value& value)
{
    return value_to_json(value).get<T>();
}

} // namespace schemacast
