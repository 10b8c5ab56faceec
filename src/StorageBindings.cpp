#include "datamodel-schema/StorageBindings.hpp"

namespace dmschema {

std::optional<std::string>
StorageBindingTable::slot_for(const std::string &field) const {
  auto it = slots.find(field);
  if (it == slots.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string>
StorageBindingTable::fields_in(const std::string &slot) const {
  std::vector<std::string> out;
  for (const auto &[field, bound] : slots) {
    if (bound == slot)
      out.push_back(field);
  }
  return out;
}

nlohmann::json StorageBindingTable::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[field, slot] : slots) {
    j[field] = slot;
  }
  return j;
}

static void collect(const std::map<std::string, FieldSpec> &fields,
                    const std::string &parent, StorageBindingTable &table) {
  for (const auto &[name, spec] : fields) {
    std::string path = parent.empty() ? name : parent + "." + name;
    if (spec.storage_slot) {
      table.slots[path] = *spec.storage_slot;
    }
    collect(spec.properties, path, table);
  }
}

StorageBindingTable bindings(const EffectiveSchema &schema) {
  StorageBindingTable table;
  collect(schema.fields, "", table);
  return table;
}

} // namespace dmschema
