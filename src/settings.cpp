#include "schemacast/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace schemacast
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool is_truthy(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("SCHEMACAST_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.pretty_output = is_truthy(getenv_str("SCHEMACAST_PRETTY_OUTPUT", "0"));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("pretty_output"))
        s.pretty_output = j.at("pretty_output").get<bool>();
    return s;
}

} // namespace schemacast
