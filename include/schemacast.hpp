#pragma once

/// @file schemacast.hpp
/// @brief Main header for schemacast - includes the schema tree and both engines
///
/// Usage:
/// @code
/// #include <schemacast.hpp>
///
/// int main() {
///     auto components = schemacast::Components::from_openapi(document);
///     auto pet = schemacast::schema_reference("Pet");
///
///     auto result = schemacast::cast(pet, raw_json, components);
///     if (!result)
///         for (const auto& err : result.errors())
///             std::cerr << err.message() << "\n";
///
///     if (auto msg = schemacast::validate(pet, result.value(), components))
///         std::cerr << *msg << "\n";
/// }
/// @endcode

// Core types and exceptions
#include "schemacast/types.hpp"
#include "schemacast/exceptions.hpp"
#include "schemacast/value.hpp"
#include "schemacast/settings.hpp"
#include "schemacast/logging.hpp"

// Schema tree and references
#include "schemacast/reference.hpp"
#include "schemacast/schema.hpp"

// Engines
#include "schemacast/cast.hpp"
#include "schemacast/validate.hpp"

// Request parameters
#include "schemacast/parameters.hpp"
