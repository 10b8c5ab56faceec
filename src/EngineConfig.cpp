#include "datamodel-schema/EngineConfig.hpp"
#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/Logger.hpp"

#include <filesystem>

namespace dmschema {

static bool read_bool(const YAML::Node &node, const std::string &key,
                      const std::string &origin) {
  bool value = false;
  if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
    throw ConfigError(origin, "'" + key + "' must be a boolean");
  }
  return value;
}

static std::string read_string(const YAML::Node &node, const std::string &key,
                               const std::string &origin) {
  if (!node.IsScalar()) {
    throw ConfigError(origin, "'" + key + "' must be a string");
  }
  return node.Scalar();
}

EngineConfig EngineConfig::from_yaml(const YAML::Node &node,
                                     const std::string &origin,
                                     const std::string &base_dir) {
  EngineConfig config;
  if (!node || node.IsNull()) {
    return config;
  }
  if (!node.IsMap()) {
    throw ConfigError(origin, "configuration must be a mapping");
  }

  if (node["search_paths"]) {
    const auto &paths = node["search_paths"];
    if (!paths.IsSequence()) {
      throw ConfigError(origin, "'search_paths' must be a sequence");
    }
    for (const auto &entry : paths) {
      std::filesystem::path p(read_string(entry, "search_paths", origin));
      if (p.is_relative() && !base_dir.empty()) {
        p = std::filesystem::path(base_dir) / p;
      }
      config.search_paths.push_back(p.lexically_normal().string());
    }
  }

  if (node["preload"]) {
    config.preload = read_bool(node["preload"], "preload", origin);
  }

  if (node["log_file"]) {
    config.log_file = read_string(node["log_file"], "log_file", origin);
  }

  if (node["log_level"]) {
    auto level = read_string(node["log_level"], "log_level", origin);
    if (!parse_log_level(level, config.log_level)) {
      throw ConfigError(origin, "unknown log_level '" + level +
                                    "' (expected trace, debug, info, warn, "
                                    "error or off)");
    }
  }

  if (node["composition"]) {
    const auto &composition = node["composition"];
    if (!composition.IsMap()) {
      throw ConfigError(origin, "'composition' must be a mapping");
    }
    if (composition["allow_scalar_datatype_override"]) {
      config.composition.allow_scalar_datatype_override =
          read_bool(composition["allow_scalar_datatype_override"],
                    "composition.allow_scalar_datatype_override", origin);
    }
  }

  return config;
}

EngineConfig EngineConfig::load(const std::string &path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError(path, std::string("YAML parse error: ") + e.what());
  }

  auto base_dir = std::filesystem::path(path).parent_path().string();
  return from_yaml(doc, path, base_dir);
}

} // namespace dmschema
