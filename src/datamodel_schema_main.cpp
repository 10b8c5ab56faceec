#include "datamodel-schema/Conversions.hpp"
#include "datamodel-schema/EngineConfig.hpp"
#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/Logger.hpp"
#include "datamodel-schema/engine/SchemaEngine.hpp"
#include "datamodel-schema/registry/FragmentRegistry.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

using namespace dmschema;

void print_usage() {
  std::cout << "Usage: datamodel-schema <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout
      << "  compose <schema>                   Print the effective schema\n";
  std::cout << "  bindings <schema>                  Print field -> extension "
               "bindings\n";
  std::cout << "  validate <schema> <data.yaml>      Validate a data object\n";
  std::cout << "  check <schema> [schema...]         Load, resolve and compose "
               "schemas\n";
  std::cout << "\n<schema> is a fragment file, a fragment name "
               "(cube.schema.yaml) or a model name (cube).\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <path>        Engine configuration (YAML)\n";
  std::cout << "  --search-path <dir>    Fragment directory (repeatable)\n";
  std::cout << "  --log-level <level>    trace, debug, info, warn, error, off\n";
  std::cout << "  --log-file <path>      Log file ('' disables)\n";
  std::cout << "\nData documents describe arrays with the !array tag:\n";
  std::cout << "  data: !array {datatype: float32, shape: [4, 32, 32]}\n";
}

struct CliOptions {
  std::string command;
  std::vector<std::string> args;
  std::string config_path;
  std::vector<std::string> search_paths;
  std::string log_level;
  std::optional<std::string> log_file;
};

static bool parse_args(int argc, char *argv[], CliOptions &opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "--search-path" ||
         arg == "--log-level" || arg == "--log-file") &&
        i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << "\n";
      return false;
    }
    if (arg == "--config") {
      opts.config_path = argv[++i];
    } else if (arg == "--search-path") {
      opts.search_paths.push_back(argv[++i]);
    } else if (arg == "--log-level") {
      opts.log_level = argv[++i];
    } else if (arg == "--log-file") {
      opts.log_file = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      return false;
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.args.push_back(arg);
    }
  }
  return !opts.command.empty();
}

// A schema argument naming an existing file is loaded into the registry;
// anything else is looked up by name.
static std::string register_schema_arg(registry::FragmentRegistry &registry,
                                       const std::string &arg) {
  if (std::filesystem::is_regular_file(arg)) {
    return registry.load_file(arg)->id;
  }
  return arg;
}

static int cmd_compose(engine::SchemaEngine &engine,
                       registry::FragmentRegistry &registry,
                       const CliOptions &opts) {
  if (opts.args.size() != 1) {
    std::cerr << "Usage: datamodel-schema compose <schema>\n";
    return 1;
  }
  auto name = register_schema_arg(registry, opts.args[0]);
  auto schema = engine.effective_schema(name);
  std::cout << schema->to_json().dump(2) << "\n";
  return 0;
}

static int cmd_bindings(engine::SchemaEngine &engine,
                        registry::FragmentRegistry &registry,
                        const CliOptions &opts) {
  if (opts.args.size() != 1) {
    std::cerr << "Usage: datamodel-schema bindings <schema>\n";
    return 1;
  }
  auto table = engine.bindings(register_schema_arg(registry, opts.args[0]));
  std::cout << table.to_json().dump(2) << "\n";
  return 0;
}

static int cmd_validate(engine::SchemaEngine &engine,
                        registry::FragmentRegistry &registry,
                        const CliOptions &opts) {
  if (opts.args.size() != 2) {
    std::cerr << "Usage: datamodel-schema validate <schema> <data.yaml>\n";
    return 1;
  }
  auto name = register_schema_arg(registry, opts.args[0]);

  DataObject object;
  try {
    object = data_object_from_yaml(YAML::LoadFile(opts.args[1]));
  } catch (const YAML::Exception &e) {
    std::cerr << "Cannot read data document " << opts.args[1] << ": "
              << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid data document " << opts.args[1] << ": " << e.what()
              << "\n";
    return 1;
  }

  auto outcome = engine.validate(name, object);

  nlohmann::json out = outcome.report.to_json();
  out["object"] = data_object_to_json(outcome.validated.object);
  out["synthesized"] = outcome.validated.synthesized;
  std::cout << out.dump(2) << "\n";

  if (outcome.report.empty()) {
    std::cerr << "Validation succeeded.\n";
    return 0;
  }
  std::cerr << "Validation failed:\n";
  for (const auto &issue : outcome.report.issues) {
    std::cerr << "  - " << issue.field << ": " << issue.detail << "\n";
  }
  return 2;
}

static int cmd_check(engine::SchemaEngine &engine,
                     registry::FragmentRegistry &registry,
                     const CliOptions &opts) {
  if (opts.args.empty()) {
    std::cerr << "Usage: datamodel-schema check <schema> [schema...]\n";
    return 1;
  }
  int failures = 0;
  for (const auto &arg : opts.args) {
    try {
      auto name = register_schema_arg(registry, arg);
      auto schema = engine.effective_schema(name);
      std::cout << arg << ": OK (" << schema->fields.size() << " fields from "
                << schema->contributors.size() << " fragments)\n";
    } catch (const SchemaError &e) {
      std::cout << arg << ": FAILED\n  - " << e.what() << "\n";
      ++failures;
    }
  }
  return failures == 0 ? 0 : 2;
}

int main(int argc, char *argv[]) {
  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage();
    return 1;
  }

  EngineConfig config;
  try {
    if (!opts.config_path.empty()) {
      config = EngineConfig::load(opts.config_path);
    }
  } catch (const ConfigError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  for (const auto &path : opts.search_paths) {
    config.search_paths.push_back(path);
  }
  if (!opts.log_level.empty() &&
      !parse_log_level(opts.log_level, config.log_level)) {
    std::cerr << "Unknown log level: " << opts.log_level << "\n";
    return 1;
  }
  if (opts.log_file) {
    config.log_file = *opts.log_file;
  }

  SchemaLogger::instance().init(config.log_file, config.log_level);
  LOG_DEBUG("MAIN", "STARTUP", "Command '{}' with {} search paths",
            opts.command, config.search_paths.size());

  registry::FragmentRegistry registry(config.search_paths);
  engine::SchemaEngine engine(registry, config.composition);

  try {
    if (config.preload) {
      for (const auto &dir : config.search_paths) {
        if (std::filesystem::is_directory(dir)) {
          registry.load_directory(dir);
        } else {
          LOG_WARN("MAIN", "STARTUP", "Search path is not a directory: {}",
                   dir);
        }
      }
    }

    if (opts.command == "compose") {
      return cmd_compose(engine, registry, opts);
    } else if (opts.command == "bindings") {
      return cmd_bindings(engine, registry, opts);
    } else if (opts.command == "validate") {
      return cmd_validate(engine, registry, opts);
    } else if (opts.command == "check") {
      return cmd_check(engine, registry, opts);
    }
  } catch (const SchemaError &e) {
    LOG_ERROR("MAIN", opts.command, "{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception &e) {
    LOG_ERROR("MAIN", opts.command, "{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << opts.command << "\n";
  print_usage();
  return 1;
}
