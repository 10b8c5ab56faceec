#pragma once

#include "datamodel-schema/export.h"
#include <optional>
#include <string>
#include <vector>

namespace dmschema {
namespace registry {

/// Locate the file behind a $ref. Tries, in order:
///  - the reference itself when it is an absolute path
///  - the directory of the referring fragment's source file
///  - each search path, in order
///
/// A file:// scheme is stripped first. Returns the canonical path of the
/// first existing candidate, or nullopt when none exists.
DATAMODEL_SCHEMA_API std::optional<std::string>
resolve_fragment_path(const std::string &ref,
                      const std::string &referrer_source,
                      const std::vector<std::string> &search_paths);

} // namespace registry
} // namespace dmschema
