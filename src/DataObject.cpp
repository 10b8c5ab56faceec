#include "datamodel-schema/DataObject.hpp"

#include <fmt/format.h>

namespace dmschema {

size_t ArrayValue::element_count() const {
  size_t count = 1;
  for (auto extent : shape) {
    count *= extent;
  }
  return count;
}

void DataObject::set(const std::string &name, DataValue value) {
  fields_[name] = std::move(value);
}

bool DataObject::contains(const std::string &name) const {
  return fields_.count(name) > 0;
}

const DataValue *DataObject::get(const std::string &name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool DataObject::erase(const std::string &name) {
  return fields_.erase(name) > 0;
}

size_t value_rank(const DataValue &value) {
  if (const auto *array = std::get_if<ArrayValue>(&value)) {
    return array->rank();
  }
  return 0;
}

std::string describe_value(const DataValue &value) {
  struct Describer {
    std::string operator()(std::monostate) const { return "null"; }
    std::string operator()(bool) const { return "bool"; }
    std::string operator()(int64_t) const { return "integer"; }
    std::string operator()(uint64_t) const { return "unsigned integer"; }
    std::string operator()(double) const { return "float"; }
    std::string operator()(const std::string &) const { return "string"; }
    std::string operator()(const ArrayValue &array) const {
      return fmt::format("array<{}>[{}d]", datatype_name(array.datatype),
                         array.rank());
    }
    std::string operator()(const DataObjectPtr &) const { return "object"; }
  };
  return std::visit(Describer{}, value);
}

} // namespace dmschema
