#pragma once

#include "datamodel-schema/export.h"
#include "datamodel-schema/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dmschema {

/// Field path -> extension name, for the container I/O layer
struct DATAMODEL_SCHEMA_API StorageBindingTable {
  std::map<std::string, std::string> slots;

  std::optional<std::string> slot_for(const std::string &field) const;

  /// Fields bound to `slot` (several fields may share one extension)
  std::vector<std::string> fields_in(const std::string &slot) const;

  bool empty() const { return slots.empty(); }
  size_t size() const { return slots.size(); }

  nlohmann::json to_json() const;
};

/// Project the storage slot of every field that declares one. Nested fields
/// appear under their dotted path; fields without a slot are omitted.
DATAMODEL_SCHEMA_API StorageBindingTable
bindings(const EffectiveSchema &schema);

} // namespace dmschema
