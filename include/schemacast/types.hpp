#pragma once
#include <nlohmann/json.hpp>

namespace schemacast
{

/// Raw, untyped input. Ordered so that object keys keep their input order,
/// which both engines rely on for deterministic error reporting.
using Json = nlohmann::ordered_json;

} // namespace schemacast
