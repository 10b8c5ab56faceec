#pragma once

#include "datamodel-schema/DataObject.hpp"
#include "datamodel-schema/export.h"

#include <nlohmann/json.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

namespace dmschema {

/// Decode a YAML node into a JSON document. Plain scalars become integers,
/// floats or booleans where they parse as such; quoted scalars stay strings.
DATAMODEL_SCHEMA_API nlohmann::json yaml_to_json(const YAML::Node &node);

/// Convert a decoded default value into a field value. Arrays of numbers are
/// not representable as a DataValue and are rejected with
/// std::invalid_argument.
DATAMODEL_SCHEMA_API DataValue json_to_data_value(const nlohmann::json &j);

DATAMODEL_SCHEMA_API nlohmann::json data_value_to_json(const DataValue &value);

DATAMODEL_SCHEMA_API nlohmann::json data_object_to_json(const DataObject &obj);

/// Build a data object from a YAML description. Arrays are written with the
/// local tag `!array`:
///
///   data: !array {datatype: float32, shape: [4, 32, 32]}
///   meta:
///     exposure: {nints: 4}
///
/// Throws std::invalid_argument on a malformed `!array` entry.
DATAMODEL_SCHEMA_API DataObject data_object_from_yaml(const YAML::Node &node);

} // namespace dmschema
