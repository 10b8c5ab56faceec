#pragma once

#include "datamodel-schema/Datatype.hpp"
#include "datamodel-schema/export.h"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace dmschema {

/// Shape and element type of an array held by a data object. The element
/// buffer itself belongs to the I/O layer and is not described here.
struct ArrayValue {
  Datatype datatype{Datatype::Float32};
  std::vector<size_t> shape;

  size_t rank() const { return shape.size(); }
  size_t element_count() const;
  size_t nbytes() const { return element_count() * datatype_size(datatype); }

  bool operator==(const ArrayValue &other) const {
    return datatype == other.datatype && shape == other.shape;
  }
  bool operator!=(const ArrayValue &other) const { return !(*this == other); }
};

class DataObject;
using DataObjectPtr = std::shared_ptr<const DataObject>;

/// Value of one field: null, scalar, array or nested object
using DataValue = std::variant<std::monostate, bool, int64_t, uint64_t, double,
                               std::string, ArrayValue, DataObjectPtr>;

/// Field name -> value mapping supplied by the caller at validation time
class DATAMODEL_SCHEMA_API DataObject {
public:
  DataObject() = default;
  DataObject(std::initializer_list<std::pair<const std::string, DataValue>>
                 fields)
      : fields_(fields) {}

  void set(const std::string &name, DataValue value);
  bool contains(const std::string &name) const;

  /// Returns nullptr when the field is absent
  const DataValue *get(const std::string &name) const;

  bool erase(const std::string &name);

  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  const std::map<std::string, DataValue> &fields() const { return fields_; }

private:
  std::map<std::string, DataValue> fields_;
};

/// Dimensionality of a value: arrays report their shape length, scalars 0
DATAMODEL_SCHEMA_API size_t value_rank(const DataValue &value);

/// Short kind name used in reports ("float", "array<float32>", "object"...)
DATAMODEL_SCHEMA_API std::string describe_value(const DataValue &value);

/// Output of validation: a fresh object plus the dotted paths whose values
/// were filled from schema defaults rather than supplied by the caller
struct ValidatedDataObject {
  DataObject object;
  std::set<std::string> synthesized;

  bool is_synthesized(const std::string &path) const {
    return synthesized.count(path) > 0;
  }
};

} // namespace dmschema
