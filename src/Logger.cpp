#include "datamodel-schema/Logger.hpp"

namespace dmschema {

// DLL-safe singleton implementation
SchemaLogger &SchemaLogger::instance() {
  static SchemaLogger logger;
  return logger;
}

bool parse_log_level(const std::string &name,
                     spdlog::level::level_enum &level) {
  if (name == "trace")
    level = spdlog::level::trace;
  else if (name == "debug")
    level = spdlog::level::debug;
  else if (name == "info")
    level = spdlog::level::info;
  else if (name == "warn")
    level = spdlog::level::warn;
  else if (name == "error")
    level = spdlog::level::err;
  else if (name == "off")
    level = spdlog::level::off;
  else
    return false;
  return true;
}

} // namespace dmschema
