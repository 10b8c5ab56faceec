#include "datamodel-schema/Datatype.hpp"

#include <array>
#include <utility>

namespace dmschema {

namespace {

struct DatatypeEntry {
  Datatype type;
  const char *token;
  DatatypeCategory category;
  size_t size;
};

constexpr std::array<DatatypeEntry, 14> DATATYPES = {{
    {Datatype::Int8, "int8", DatatypeCategory::SignedInteger, 1},
    {Datatype::Int16, "int16", DatatypeCategory::SignedInteger, 2},
    {Datatype::Int32, "int32", DatatypeCategory::SignedInteger, 4},
    {Datatype::Int64, "int64", DatatypeCategory::SignedInteger, 8},
    {Datatype::UInt8, "uint8", DatatypeCategory::UnsignedInteger, 1},
    {Datatype::UInt16, "uint16", DatatypeCategory::UnsignedInteger, 2},
    {Datatype::UInt32, "uint32", DatatypeCategory::UnsignedInteger, 4},
    {Datatype::UInt64, "uint64", DatatypeCategory::UnsignedInteger, 8},
    {Datatype::Float16, "float16", DatatypeCategory::Floating, 2},
    {Datatype::Float32, "float32", DatatypeCategory::Floating, 4},
    {Datatype::Float64, "float64", DatatypeCategory::Floating, 8},
    {Datatype::Complex64, "complex64", DatatypeCategory::Complex, 8},
    {Datatype::Complex128, "complex128", DatatypeCategory::Complex, 16},
    {Datatype::Bool8, "bool8", DatatypeCategory::Boolean, 1},
}};

const DatatypeEntry &entry_for(Datatype type) {
  for (const auto &entry : DATATYPES) {
    if (entry.type == type)
      return entry;
  }
  // Every enumerator has a table row
  return DATATYPES.front();
}

} // namespace

std::optional<Datatype> parse_datatype(const std::string &token) {
  for (const auto &entry : DATATYPES) {
    if (token == entry.token)
      return entry.type;
  }
  return std::nullopt;
}

std::string datatype_name(Datatype type) { return entry_for(type).token; }

DatatypeCategory datatype_category(Datatype type) {
  return entry_for(type).category;
}

size_t datatype_size(Datatype type) { return entry_for(type).size; }

} // namespace dmschema
