#pragma once
#include "datamodel-schema/export.h"

#include <optional>
#include <string>

namespace dmschema {

/// Primitive element types a field may declare
enum class Datatype {
  Int8,
  Int16,
  Int32,
  Int64,
  UInt8,
  UInt16,
  UInt32,
  UInt64,
  Float16,
  Float32,
  Float64,
  Complex64,
  Complex128,
  Bool8,
};

enum class DatatypeCategory {
  SignedInteger,
  UnsignedInteger,
  Floating,
  Complex,
  Boolean,
};

/// Parse a schema token such as "float32". Returns nullopt for unknown tokens.
DATAMODEL_SCHEMA_API std::optional<Datatype>
parse_datatype(const std::string &token);

/// Schema token for a datatype ("uint32", ...)
DATAMODEL_SCHEMA_API std::string datatype_name(Datatype type);

DATAMODEL_SCHEMA_API DatatypeCategory datatype_category(Datatype type);

/// Element size in bytes
DATAMODEL_SCHEMA_API size_t datatype_size(Datatype type);

} // namespace dmschema
