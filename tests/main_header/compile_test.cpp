/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main schemacast.hpp header
///
/// This test verifies that including just <schemacast.hpp> gives access to
/// the schema tree, both engines and the parameter adapter.

#include "schemacast.hpp"

#include <cassert>
#include <iostream>

using namespace schemacast;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_cast_and_validate_accessible..." << std::endl;
    {
        Components components;
        Schema age;
        age.type = DataType::Integer;
        age.minimum = 0;
        components.add("Age", age);

        auto ref = schema_reference("Age");
        auto result = cast(ref, "42", components);
        assert(result);
        assert(!validate(ref, result.value(), components));
        assert(validate(ref, -1, components));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_parameter_types_accessible..." << std::endl;
    {
        Parameter p;
        p.name = "q";
        assert(p.location == ParameterLocation::Query);
        (void)sizeof(ParameterValues);
        (void)sizeof(Settings);
        (void)sizeof(Logger);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All main header tests passed ===" << std::endl;
    return 0;
}
