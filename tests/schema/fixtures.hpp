#pragma once
#include "schemacast/schema.hpp"

namespace schemacast::test
{

/// Components used across the cast and validate tests: users plus a
/// discriminated Pet hierarchy.
inline Components api_components()
{
    return Components::from_openapi(Json::parse(R"({
      "openapi": "3.0.0",
      "info": {"title": "Test API", "version": "1.0"},
      "components": {
        "schemas": {
          "User": {
            "type": "object",
            "x-struct": "User",
            "properties": {
              "id": {"type": "integer", "format": "int64"},
              "name": {"type": "string", "pattern": "^[a-zA-Z][a-zA-Z0-9_]+$"},
              "email": {"type": "string", "format": "email"},
              "updated_at": {"type": "string", "format": "date-time"}
            },
            "required": ["name", "email"]
          },
          "UserRequest": {
            "type": "object",
            "x-struct": "UserRequest",
            "properties": {"user": {"$ref": "#/components/schemas/User"}}
          },
          "UsersResponse": {
            "type": "object",
            "properties": {
              "data": {"type": "array", "items": {"$ref": "#/components/schemas/User"}}
            }
          },
          "Pet": {
            "type": "object",
            "required": ["pet_type"],
            "properties": {"pet_type": {"type": "string"}},
            "discriminator": {"propertyName": "pet_type"}
          },
          "Cat": {
            "x-struct": "Cat",
            "allOf": [
              {"$ref": "#/components/schemas/Pet"},
              {"type": "object", "properties": {"meow": {"type": "string"}}, "required": ["meow"]}
            ]
          },
          "Dog": {
            "x-struct": "Dog",
            "allOf": [
              {"$ref": "#/components/schemas/Pet"},
              {"type": "object", "properties": {"bark": {"type": "string"}}, "required": ["bark"]}
            ]
          },
          "CatOrDog": {
            "oneOf": [
              {"$ref": "#/components/schemas/Cat"},
              {"$ref": "#/components/schemas/Dog"}
            ]
          }
        }
      }
    })"));
}

inline Schema schema_of(const char* json)
{
    return Schema::from_json(Json::parse(json));
}

} // namespace schemacast::test
