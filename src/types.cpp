#include "datamodel-schema/types.hpp"

namespace dmschema {

bool FieldSpec::operator==(const FieldSpec &other) const {
  return title == other.title && storage_slot == other.storage_slot &&
         rank == other.rank && max_rank == other.max_rank &&
         datatype == other.datatype && default_value == other.default_value &&
         type == other.type && properties == other.properties &&
         required == other.required;
}

nlohmann::json FieldSpec::to_json() const {
  nlohmann::json j = nlohmann::json::object();

  if (title)
    j["title"] = *title;
  if (storage_slot)
    j["fits_hdu"] = *storage_slot;
  if (rank)
    j["ndim"] = *rank;
  if (max_rank)
    j["max_ndim"] = *max_rank;
  if (datatype)
    j["datatype"] = datatype_name(*datatype);
  if (default_value)
    j["default"] = *default_value;
  if (type)
    j["type"] = *type;

  if (!properties.empty()) {
    nlohmann::json props = nlohmann::json::object();
    for (const auto &[name, spec] : properties) {
      props[name] = spec.to_json();
    }
    j["properties"] = props;
  }
  if (!required.empty()) {
    j["required"] = required;
  }
  return j;
}

bool InlineFieldSet::operator==(const InlineFieldSet &other) const {
  return origin == other.origin && properties == other.properties &&
         required == other.required;
}

bool SchemaFragment::is_resolved() const {
  for (const auto &member : composition) {
    if (std::holds_alternative<Reference>(member))
      return false;
  }
  return true;
}

std::vector<std::string> SchemaFragment::references() const {
  std::vector<std::string> names;
  for (const auto &member : composition) {
    if (const auto *ref = std::get_if<Reference>(&member)) {
      names.push_back(ref->target);
    }
  }
  return names;
}

bool SchemaFragment::operator==(const SchemaFragment &other) const {
  return id == other.id && schema_uri == other.schema_uri &&
         source_path == other.source_path &&
         composition == other.composition && fields == other.fields &&
         required == other.required;
}

const FieldSpec *EffectiveSchema::find_field(const std::string &path) const {
  const std::map<std::string, FieldSpec> *level = &fields;
  const FieldSpec *found = nullptr;

  size_t start = 0;
  while (start <= path.size()) {
    size_t dot = path.find('.', start);
    std::string part = path.substr(
        start, dot == std::string::npos ? std::string::npos : dot - start);

    auto it = level->find(part);
    if (it == level->end())
      return nullptr;
    found = &it->second;

    if (dot == std::string::npos)
      break;
    level = &found->properties;
    start = dot + 1;
  }
  return found;
}

nlohmann::json EffectiveSchema::to_json() const {
  nlohmann::json j;
  j["model"] = model;
  if (schema_uri) {
    j["$schema"] = *schema_uri;
  }

  nlohmann::json props = nlohmann::json::object();
  for (const auto &[name, spec] : fields) {
    props[name] = spec.to_json();
  }
  j["properties"] = props;
  j["required"] = required;
  j["contributors"] = contributors;
  j["provenance"] = provenance;
  return j;
}

} // namespace dmschema
