#include "schemacast.hpp"
#include "schemacast/version.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "schemacast " << schemacast::VERSION_MAJOR << "." << schemacast::VERSION_MINOR
              << "." << schemacast::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  schemacast --help\n";
    std::cout << "  schemacast --version\n";
    std::cout << "  schemacast cast     <openapi.json> <schema-name> <value.json|-> [--pretty]\n";
    std::cout << "  schemacast validate <openapi.json> <schema-name> <value.json|-> [--pretty]\n";
    std::cout << "  schemacast check    <openapi.json> <schema-name> <value.json|-> [--pretty]\n";
    std::cout << "\n";
    std::cout << "  cast      coerce the value and print the typed result or the cast errors\n";
    std::cout << "  validate  check the value as given against the schema constraints\n";
    std::cout << "  check     cast, then validate the cast result\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  SCHEMACAST_LOG_LEVEL      DEBUG, INFO, WARNING or ERROR (default INFO)\n";
    std::cout << "  SCHEMACAST_PRETTY_OUTPUT  1 to pretty-print JSON output\n";
    return exit_code;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static schemacast::Json read_json(const std::string& path)
{
    std::ostringstream ss;
    if (path == "-")
    {
        ss << std::cin.rdbuf();
    }
    else
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw schemacast::ValidationError("Unable to open file: " + path);
        ss << in.rdbuf();
    }
    try
    {
        return schemacast::Json::parse(ss.str());
    }
    catch (const schemacast::Json::parse_error& e)
    {
        throw schemacast::ValidationError("Invalid JSON in " + path + ": " + e.what());
    }
}

static std::string dump(const schemacast::Json& j, bool pretty)
{
    return pretty ? j.dump(2) : j.dump();
}

static schemacast::Json errors_to_json(const std::vector<schemacast::CastError>& errors)
{
    schemacast::Json out = schemacast::Json::array();
    for (const auto& err : errors)
        out.push_back(err.to_json());
    return out;
}

static int run(const std::string& command, std::vector<std::string> args,
               const schemacast::Settings& settings, const schemacast::Logger& logger)
{
    const bool pretty = consume_flag(args, "--pretty") || settings.pretty_output;
    if (args.size() != 3)
        return usage(2);

    auto document = read_json(args[0]);
    auto components = schemacast::Components::from_openapi(document);
    logger.debug("loaded " + std::to_string(components.size()) + " component schema(s) from " +
                 args[0]);

    const std::string& name = args[1];
    if (!components.contains(name))
    {
        logger.error("schema not found in components: " + name);
        return 1;
    }
    auto schema = schemacast::schema_reference(name);
    schemacast::Value value = read_json(args[2]);

    if (command == "cast" || command == "check")
    {
        auto result = schemacast::cast(schema, value, components);
        if (!result)
        {
            logger.info("cast against " + name + " failed with " +
                        std::to_string(result.errors().size()) + " error(s)");
            std::cout << dump(schemacast::Json{{"errors", errors_to_json(result.errors())}},
                              pretty)
                      << "\n";
            return 1;
        }
        value = result.value();
        if (command == "cast")
        {
            std::cout << dump(schemacast::value_to_json(value), pretty) << "\n";
            return 0;
        }
    }

    if (auto err = schemacast::validate(schema, value, components))
    {
        logger.info("validation against " + name + " failed");
        std::cout << dump(schemacast::Json{{"error", *err}}, pretty) << "\n";
        return 1;
    }
    std::cout << dump(schemacast::value_to_json(value), pretty) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty())
        return usage(2);
    if (args[0] == "--help" || args[0] == "-h")
        return usage(0);
    if (args[0] == "--version")
    {
        std::cout << schemacast::VERSION_MAJOR << "." << schemacast::VERSION_MINOR << "."
                  << schemacast::VERSION_PATCH << "\n";
        return 0;
    }

    const auto settings = schemacast::Settings::from_env();
    const schemacast::Logger logger(settings.level());

    const std::string command = args[0];
    if (command != "cast" && command != "validate" && command != "check")
    {
        std::cerr << "Unknown command: " << command << "\n";
        return usage(2);
    }

    try
    {
        return run(command, std::vector<std::string>(args.begin() + 1, args.end()), settings,
                   logger);
    }
    catch (const schemacast::Error& e)
    {
        logger.error(e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        logger.error(std::string("unexpected failure: ") + e.what());
        return 1;
    }
}
