#pragma once
#include "schemacast/logging.hpp"
#include "schemacast/types.hpp"

#include <string>

namespace schemacast
{

struct Settings
{
    std::string log_level{"INFO"};
    bool pretty_output{false};

    LogLevel level() const
    {
        return log_level_from_string(log_level);
    }

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace schemacast
