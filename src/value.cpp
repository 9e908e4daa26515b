#include "schemacast/value.hpp"

#include <limits>

namespace schemacast
{

double Value::as_double() const
{
    if (is_integer())
        return static_cast<double>(as<std::int64_t>());
    return as<double>();
}

const Value::object_t* Value::fields() const
{
    if (auto obj = std::get_if<object_t>(&value))
        return obj;
    if (auto rec = std::get_if<Record>(&value))
        return &rec->fields;
    return nullptr;
}

const Value* Value::find(const std::string& key) const
{
    const auto* obj = fields();
    if (!obj)
        return nullptr;
    for (const auto& [name, field] : *obj)
        if (name == key)
            return &field;
    return nullptr;
}

bool operator==(const Value& a, const Value& b)
{
    return a.value == b.value;
}

bool operator==(const Record& a, const Record& b)
{
    return a.type_name == b.type_name && a.fields == b.fields;
}

std::string type_name(const Value& value)
{
    struct Visitor
    {
        std::string operator()(std::nullptr_t) const { return "null"; }
        std::string operator()(bool) const { return "boolean"; }
        std::string operator()(std::int64_t) const { return "integer"; }
        std::string operator()(double) const { return "number"; }
        std::string operator()(const std::string&) const { return "string"; }
        std::string operator()(const Date&) const { return "date"; }
        std::string operator()(const DateTime&) const { return "date-time"; }
        std::string operator()(const Value::array_t&) const { return "array"; }
        std::string operator()(const Value::object_t&) const { return "object"; }
        std::string operator()(const Record& r) const { return r.type_name; }
    };
    return std::visit(Visitor{}, value.value);
}

Value value_from_json(const Json& j)
{
    switch (j.type())
    {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return nullptr;
    case Json::value_t::boolean:
        return j.get<bool>();
    case Json::value_t::number_integer:
        return j.get<std::int64_t>();
    case Json::value_t::number_unsigned:
    {
        auto u = j.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return static_cast<std::int64_t>(u);
        return static_cast<double>(u);
    }
    case Json::value_t::number_float:
        return j.get<double>();
    case Json::value_t::string:
        return j.get<std::string>();
    case Json::value_t::array:
    {
        Value::array_t arr;
        arr.reserve(j.size());
        for (const auto& item : j)
            arr.push_back(value_from_json(item));
        return arr;
    }
    case Json::value_t::object:
    {
        Value::object_t obj;
        obj.reserve(j.size());
        for (const auto& [key, item] : j.items())
            obj.emplace_back(key, value_from_json(item));
        return obj;
    }
    case Json::value_t::binary:
        break;
    }
    return j.dump();
}

Json value_to_json(const Value& value)
{
    struct Visitor
    {
        Json operator()(std::nullptr_t) const { return nullptr; }
        Json operator()(bool b) const { return b; }
        Json operator()(std::int64_t i) const { return i; }
        Json operator()(double d) const { return d; }
        Json operator()(const std::string& s) const { return s; }
        Json operator()(const Date& d) const { return d.to_iso8601(); }
        Json operator()(const DateTime& dt) const { return dt.to_iso8601(); }
        Json operator()(const Value::array_t& arr) const
        {
            Json j = Json::array();
            for (const auto& v : arr)
                j.push_back(value_to_json(v));
            return j;
        }
        Json operator()(const Value::object_t& obj) const
        {
            Json j = Json::object();
            for (const auto& [k, v] : obj)
                j[k] = value_to_json(v);
            return j;
        }
        Json operator()(const Record& r) const
        {
            return (*this)(r.fields);
        }
    };
    return std::visit(Visitor{}, value.value);
}

} // namespace schemacast
