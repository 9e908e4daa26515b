#include "fixtures.hpp"
#include "schemacast/cast.hpp"

#include <cassert>
#include <iostream>

using namespace schemacast;
using schemacast::test::api_components;
using schemacast::test::schema_of;

namespace
{

const Components kNoComponents;

} // namespace

void test_cast_user_request()
{
    std::cout << "test_cast_user_request...\n";
    auto components = api_components();
    auto input = Json::parse(R"({
      "user": {
        "id": 123,
        "name": "asdf",
        "email": "foo@bar.com",
        "updated_at": "2017-09-12T14:44:55Z"
      }
    })");

    auto output = cast(components.at("UserRequest"), input, components).value();
    assert(output.is_record());
    const auto& request = output.as<Record>();
    assert(request.type_name == "UserRequest");
    assert(request.fields.size() == 1);

    const auto* user = output.find("user");
    assert(user && user->is_record());
    assert(user->as<Record>().type_name == "User");
    assert(*user->find("id") == Value(123));
    assert(*user->find("name") == Value("asdf"));
    assert(*user->find("email") == Value("foo@bar.com"));
    assert(user->find("updated_at")->is_date_time());
    assert(user->find("updated_at")->as<DateTime>().seconds == 1505227495);
    std::cout << "  [PASS]\n";
}

void test_unexpected_type_for_object()
{
    std::cout << "test_unexpected_type_for_object...\n";
    auto components = api_components();
    const auto& request = components.at("UserRequest");

    assert(!cast(request, Json::array(), components));

    auto nested = cast(request, Json::parse(R"({"user": []})"), components);
    assert(!nested);
    assert(nested.errors()[0].reason == CastReason::InvalidType);
    assert(nested.errors()[0].path_string() == "/user");

    auto nested_array =
        cast(components.at("UsersResponse"), Json::parse(R"({"data": {}})"), components);
    assert(!nested_array);
    assert(nested_array.errors()[0].path_string() == "/data");
    assert(nested_array.errors()[0].expected == std::optional<std::string>("array"));
    std::cout << "  [PASS]\n";
}

void test_unexpected_field()
{
    std::cout << "test_unexpected_field...\n";
    auto components = api_components();
    auto input = Json::parse(R"({
      "user": {
        "id": 123,
        "name": "asdf",
        "email": "foo@bar.com",
        "updated_at": "2017-09-12T14:44:55Z",
        "unexpected_field": "unexpected value"
      }
    })");
    auto result = cast(components.at("UserRequest"), input, components);
    assert(!result);
    assert(result.errors().size() == 1);
    const auto& err = result.errors()[0];
    assert(err.reason == CastReason::UnexpectedField);
    assert(err.name == std::optional<std::string>("unexpected_field"));
    assert(err.path == (Path{std::string("user"), std::string("unexpected_field")}));
    std::cout << "  [PASS]\n";
}

void test_missing_fields_reported_together()
{
    std::cout << "test_missing_fields_reported_together...\n";
    auto s = schema_of(R"({
      "type": "object",
      "properties": {"a": {"type": "string"}, "b": {"type": "string"}, "c": {"type": "string"}},
      "required": ["b", "a"]
    })");
    auto result = cast(s, Json::parse(R"({"c": "x"})"), kNoComponents);
    assert(!result);
    assert(result.errors().size() == 2);
    assert(result.errors()[0].reason == CastReason::MissingField);
    assert(result.errors()[0].name == std::optional<std::string>("b"));
    assert(result.errors()[0].path_string() == "/b");
    assert(result.errors()[1].name == std::optional<std::string>("a"));
    assert(result.errors()[1].message() == "Missing field: a at /a");
    std::cout << "  [PASS]\n";
}

void test_unexpected_field_checked_before_required()
{
    std::cout << "test_unexpected_field_checked_before_required...\n";
    auto s = schema_of(R"({
      "type": "object",
      "properties": {"a": {"type": "string"}},
      "required": ["a"]
    })");
    auto result = cast(s, Json::parse(R"({"x": 1})"), kNoComponents);
    assert(result.errors().size() == 1);
    assert(result.errors()[0].reason == CastReason::UnexpectedField);
    std::cout << "  [PASS]\n";
}

void test_first_unexpected_field_in_input_order()
{
    std::cout << "test_first_unexpected_field_in_input_order...\n";
    auto s = schema_of(R"({"type": "object", "properties": {"a": {"type": "string"}}})");
    auto result = cast(s, Json::parse(R"({"z": 1, "y": 1})"), kNoComponents);
    assert(!result);
    assert(result.errors().size() == 1);
    assert(result.errors()[0].reason == CastReason::UnexpectedField);
    assert(result.errors()[0].name == std::optional<std::string>("z"));
    assert(result.errors()[0].path_string() == "/z");
    std::cout << "  [PASS]\n";
}

void test_property_errors_follow_input_order()
{
    std::cout << "test_property_errors_follow_input_order...\n";
    auto s = schema_of(R"({
      "type": "object",
      "properties": {"a": {"type": "integer"}, "b": {"type": "integer"}}
    })");
    auto result = cast(s, Json::parse(R"({"b": "x", "a": "y"})"), kNoComponents);
    assert(!result);
    assert(result.errors().size() == 1);
    assert(result.errors()[0].reason == CastReason::InvalidType);
    assert(result.errors()[0].path_string() == "/b");
    std::cout << "  [PASS]\n";
}

void test_additional_properties_true_keeps_extra_keys()
{
    std::cout << "test_additional_properties_true_keeps_extra_keys...\n";
    auto open = schema_of(R"({
      "type": "object",
      "properties": {"a": {"type": "integer"}},
      "additionalProperties": true
    })");
    auto out = cast(open, Json::parse(R"({"a": "1", "extra": "kept?"})"), kNoComponents).value();
    // only declared properties are carried into the output
    assert(out.fields()->size() == 1);
    assert(*out.find("a") == Value(1));

    // a schema-valued additionalProperties does not open the object for casting
    auto typed_extra = schema_of(R"({
      "type": "object",
      "properties": {"a": {"type": "integer"}},
      "additionalProperties": {"type": "string"}
    })");
    assert(!cast(typed_extra, Json::parse(R"({"a": 1, "extra": "x"})"), kNoComponents));
    std::cout << "  [PASS]\n";
}

void test_property_count_limits()
{
    std::cout << "test_property_count_limits...\n";
    auto s = schema_of(R"({
      "type": "object",
      "properties": {"a": {"type": "integer"}, "b": {"type": "integer"}, "c": {"type": "integer"}},
      "minProperties": 2,
      "maxProperties": 2
    })");

    auto too_many = cast(s, Json::parse(R"({"a": 1, "b": 2, "c": 3})"), kNoComponents);
    assert(too_many.errors().size() == 1);
    assert(too_many.errors()[0].reason == CastReason::MaxProperties);
    assert(too_many.errors()[0].limit == std::optional<std::size_t>(2));
    assert(too_many.errors()[0].count == std::optional<std::size_t>(3));

    auto too_few = cast(s, Json::parse(R"({"a": 1})"), kNoComponents);
    assert(too_few.errors()[0].reason == CastReason::MinProperties);
    assert(too_few.errors()[0].count == std::optional<std::size_t>(1));

    assert(cast(s, Json::parse(R"({"a": 1, "c": "3"})"), kNoComponents));
    std::cout << "  [PASS]\n";
}

void test_nested_property_error_path()
{
    std::cout << "test_nested_property_error_path...\n";
    auto s = schema_of(R"({
      "type": "object",
      "properties": {
        "user": {
          "type": "object",
          "properties": {
            "addresses": {
              "type": "array",
              "items": {"type": "object", "properties": {"zip": {"type": "integer"}}}
            }
          }
        }
      }
    })");
    auto input = Json::parse(R"({"user": {"addresses": [{"zip": "123"}, {"zip": "abc"}]}})");
    auto result = cast(s, input, kNoComponents);
    assert(!result);
    assert(result.errors()[0].path_string() == "/user/addresses/1/zip");
    assert(result.errors()[0].value == Value("abc"));
    std::cout << "  [PASS]\n";
}

void test_defaults_fill_absent_properties()
{
    std::cout << "test_defaults_fill_absent_properties...\n";
    auto s = schema_of(R"({
      "type": "object",
      "properties": {
        "limit": {"type": "integer", "default": 20},
        "includeInactive": {"type": "boolean", "default": false},
        "name": {"type": "string"}
      }
    })");

    auto out = cast(s, Json::parse(R"({"limit": "5"})"), kNoComponents).value();
    assert(*out.find("limit") == Value(5));
    assert(*out.find("includeInactive") == Value(false));
    assert(out.find("name") == nullptr);

    auto empty = cast(s, Json::object(), kNoComponents).value();
    assert(*empty.find("limit") == Value(20));
    std::cout << "  [PASS]\n";
}

void test_object_without_properties_passes_through()
{
    std::cout << "test_object_without_properties_passes_through...\n";
    auto s = schema_of(R"({"type": "object"})");
    auto input = Value(Json::parse(R"({"anything": [1, 2], "goes": null})"));
    assert(cast(s, input, kNoComponents).value() == input);
    std::cout << "  [PASS]\n";
}

void test_target_type_fields()
{
    std::cout << "test_target_type_fields...\n";
    auto s = schema_of(R"({
      "type": "object",
      "x-struct": {"name": "Point", "fields": ["y", "x", "z"]},
      "properties": {"x": {"type": "number"}, "y": {"type": "number"}, "z": {"type": "number"}}
    })");
    auto out = cast(s, Json::parse(R"({"x": 1.5, "y": "2.5"})"), kNoComponents).value();
    const auto& point = out.as<Record>();
    assert(point.type_name == "Point");
    // declared field order, absent fields left out
    assert(point.fields.size() == 2);
    assert(point.fields[0].first == "y");
    assert(point.fields[0].second == Value(2.5));
    assert(point.fields[1].first == "x");

    assert(value_to_json(out) == Json::parse(R"({"y": 2.5, "x": 1.5})"));
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "=== TestCastObject ===\n";
    test_cast_user_request();
    test_unexpected_type_for_object();
    test_unexpected_field();
    test_missing_fields_reported_together();
    test_unexpected_field_checked_before_required();
    test_first_unexpected_field_in_input_order();
    test_property_errors_follow_input_order();
    test_additional_properties_true_keeps_extra_keys();
    test_property_count_limits();
    test_nested_property_error_path();

    std::cout << "\n=== TestCastObjectOutput ===\n";
    test_defaults_fill_absent_properties();
    test_object_without_properties_passes_through();
    test_target_type_fields();

    std::cout << "\n[OK] All object cast tests passed! (13 tests)\n";
    return 0;
}
