#pragma once

#include "datamodel-schema/export.h"
#include "datamodel-schema/types.hpp"

#include <string>

namespace dmschema {

struct CompositionPolicy {
  // A later member may change the datatype of a rank-less field to another
  // type of the same category (float32 -> float64, int16 -> int32, ...)
  bool allow_scalar_datatype_override{true};
};

/// Merges the ordered field-sets of a resolved fragment into one schema.
///
/// Fields merge by name, attribute by attribute: a later field-set replaces
/// only the attributes it declares. Nested object fields merge recursively
/// and `required` lists are unioned. The root fragment's own properties are
/// merged last.
///
/// Throws ConflictingDatatypeError when two field-sets declare different
/// ranks for a field, incompatible datatypes, or an object and an array for
/// the same name.
class DATAMODEL_SCHEMA_API Composer {
public:
  static EffectiveSchema compose(const ResolvedFragment &resolved,
                                 const CompositionPolicy &policy = {});

  /// "cube.schema.yaml" -> "cube"
  static std::string model_name(const std::string &fragment_id);
};

} // namespace dmschema
