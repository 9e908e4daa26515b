#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>
#include "schemacast/logging.hpp"
#include "schemacast/settings.hpp"

static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

int main() {
  using namespace schemacast;
  // Defaults
  Settings d;
  assert(d.log_level == "INFO");
  assert(d.level() == LogLevel::Info);
  assert(!d.pretty_output);

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level","DEBUG"},{"pretty_output",true}});
  assert(s.level() == LogLevel::Debug);
  assert(s.pretty_output == true);

  // Env parse (set locally)
  set_env("SCHEMACAST_LOG_LEVEL","warn");
  set_env("SCHEMACAST_PRETTY_OUTPUT","1");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.level() == LogLevel::Warning);
  assert(e.pretty_output == true);

  assert(log_level_from_string("bogus") == LogLevel::Info);
  assert(to_string(LogLevel::Error) == "ERROR");

  // Threshold filtering
  std::vector<std::string> seen;
  Logger logger(LogLevel::Warning, [&seen](LogLevel level, const std::string& msg) {
    seen.push_back(to_string(level) + " " + msg);
  });
  logger.debug("hidden");
  logger.info("hidden");
  logger.warning("shown");
  logger.error("shown too");
  assert(seen.size() == 2);
  assert(seen[0] == "WARNING shown");
  assert(seen[1] == "ERROR shown too");
  assert(logger.threshold() == LogLevel::Warning);
  return 0;
}
