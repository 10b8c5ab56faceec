#pragma once

#include "datamodel-schema/export.h"
#include "datamodel-schema/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

namespace dmschema {

/// Parses schema documents into SchemaFragments.
///
/// Recognized keys on a field-set: allOf, properties, required, $ref,
/// $schema, id. Recognized keys on a field: title, fits_hdu, ndim, max_ndim,
/// datatype, default, type, properties, required. Other keys are ignored.
///
/// All parse failures throw MalformedSchemaError naming the fragment and the
/// offending document path.
class DATAMODEL_SCHEMA_API FragmentLoader {
public:
  /// Parse an already-decoded document. `name` becomes the fragment id; when
  /// empty the document's own `id` key is used.
  static SchemaFragment load(const nlohmann::json &document,
                             const std::string &name,
                             const std::string &source_path = "");

  static SchemaFragment load_yaml(const YAML::Node &document,
                                  const std::string &name);

  /// Read and parse a YAML file; the fragment is named after the file name
  static SchemaFragment load_file(const std::string &path);

  /// Normalize a $ref value: strips a file:// scheme and any '#' anchor
  static std::string normalize_reference(const std::string &ref);
};

} // namespace dmschema
