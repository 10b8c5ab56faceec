#pragma once

#include "datamodel-schema/Composer.hpp"
#include "datamodel-schema/export.h"

#include <spdlog/common.h>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace dmschema {

/// Engine settings, normally read from a YAML file:
///
///   search_paths: [schemas]
///   preload: true
///   log_file: datamodel_schema.log
///   log_level: info
///   composition:
///     allow_scalar_datatype_override: true
struct DATAMODEL_SCHEMA_API EngineConfig {
  std::vector<std::string> search_paths;
  bool preload{true}; // load every fragment on the search paths at startup
  std::string log_file{"datamodel_schema.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  CompositionPolicy composition;

  /// Throws ConfigError on unreadable files or invalid values. Relative
  /// search paths are resolved against the config file's directory.
  static EngineConfig load(const std::string &path);

  static EngineConfig from_yaml(const YAML::Node &node,
                                const std::string &origin = "<inline>",
                                const std::string &base_dir = "");
};

} // namespace dmschema
