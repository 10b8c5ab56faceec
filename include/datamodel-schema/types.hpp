#pragma once

#include "datamodel-schema/Datatype.hpp"
#include "datamodel-schema/export.h"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dmschema {

/// Description of one data field as declared by a fragment. Every attribute
/// is optional so that composition can tell "not declared" from "declared".
struct FieldSpec {
  std::optional<std::string> title;
  std::optional<std::string> storage_slot; // fits_hdu
  std::optional<int> rank;                 // ndim
  std::optional<int> max_rank;             // max_ndim
  std::optional<Datatype> datatype;
  std::optional<nlohmann::json> default_value;
  std::optional<std::string> type; // "object" for nested field-sets

  // Nested field-set for object fields
  std::map<std::string, FieldSpec> properties;
  std::vector<std::string> required;

  bool is_object() const {
    return (type && *type == "object") || !properties.empty();
  }
  bool declares_array_shape() const { return rank || max_rank; }

  bool operator==(const FieldSpec &other) const;
  bool operator!=(const FieldSpec &other) const { return !(*this == other); }

  nlohmann::json to_json() const;
};

/// Inline `properties` block inside an allOf list
struct InlineFieldSet {
  std::string origin; // fragment that authored the set
  std::map<std::string, FieldSpec> properties;
  std::vector<std::string> required;

  bool operator==(const InlineFieldSet &other) const;
  bool operator!=(const InlineFieldSet &other) const {
    return !(*this == other);
  }
};

/// `$ref` entry inside an allOf list
struct Reference {
  std::string target;
  std::string referrer;

  bool operator==(const Reference &other) const {
    return target == other.target && referrer == other.referrer;
  }
  bool operator!=(const Reference &other) const { return !(*this == other); }
};

using CompositionMember = std::variant<InlineFieldSet, Reference>;

/// One parsed schema document. Immutable once the loader returns it.
struct SchemaFragment {
  std::string id;
  std::optional<std::string> schema_uri; // $schema, provenance only
  std::string source_path;               // empty when not loaded from disk

  std::vector<CompositionMember> composition;
  std::map<std::string, FieldSpec> fields; // top-level properties
  std::vector<std::string> required;

  /// True when the composition list holds no references
  bool is_resolved() const;

  /// Names of directly referenced fragments, in order
  std::vector<std::string> references() const;

  bool operator==(const SchemaFragment &other) const;
  bool operator!=(const SchemaFragment &other) const {
    return !(*this == other);
  }
};

/// A fragment whose composition holds inline field-sets only
using ResolvedFragment = SchemaFragment;

/// Merged schema for one top-level model
struct EffectiveSchema {
  std::string model;
  std::optional<std::string> schema_uri;
  std::map<std::string, FieldSpec> fields;
  std::vector<std::string> required;

  // Fragments that contributed at least one field-set, in merge order
  std::vector<std::string> contributors;
  // Dotted field path -> fragments that declared it, in merge order
  std::map<std::string, std::vector<std::string>> provenance;

  /// Look up a field by dotted path ("meta.exposure.type")
  const FieldSpec *find_field(const std::string &path) const;

  nlohmann::json to_json() const;
};

} // namespace dmschema
