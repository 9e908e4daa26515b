#include "schemacast.hpp"

#include <iostream>

int main()
{
    using namespace schemacast;

    Json document = Json::object();
    document["openapi"] = "3.0.3";
    document["info"] = Json{{"title", "Pet Store"}, {"version", "1.0.0"}};
    document["components"]["schemas"]["Pet"] =
        Json{{"type", "object"},
             {"required", Json::array({"pet_type"})},
             {"properties", Json{{"pet_type", Json{{"type", "string"}}}}},
             {"discriminator", Json{{"propertyName", "pet_type"}}}};
    document["components"]["schemas"]["Cat"] = Json{
        {"x-struct", "Cat"},
        {"allOf",
         Json::array({Json{{"$ref", "#/components/schemas/Pet"}},
                      Json{{"type", "object"},
                           {"properties", Json{{"lives", Json{{"type", "integer"},
                                                             {"minimum", 1},
                                                             {"maximum", 9}}}}}}})}};

    auto components = Components::from_openapi(document);
    auto pet = schema_reference("Pet");

    for (const char* body : {R"({"pet_type": "Cat", "lives": "7"})",
                             R"({"pet_type": "Cat", "lives": "12"})",
                             R"({"pet_type": "Cat", "lives": "many"})"})
    {
        std::cout << body << "\n";
        auto result = cast(pet, Json::parse(body), components);
        if (!result)
        {
            for (const auto& err : result.errors())
                std::cout << "  cast error: " << err.message() << "\n";
            continue;
        }
        std::cout << "  cast to " << type_name(result.value()) << ": "
                  << value_to_json(result.value()).dump() << "\n";
        auto concrete = schema_reference(type_name(result.value()));
        if (auto msg = validate(concrete, result.value(), components))
            std::cout << "  invalid: " << *msg << "\n";
    }
    return 0;
}
