#include "datamodel-schema/Composer.hpp"
#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <stdexcept>

namespace dmschema {

namespace {

class Merger {
public:
  Merger(EffectiveSchema &schema, const CompositionPolicy &policy)
      : schema_(schema), policy_(policy) {}

  void merge_set(const std::map<std::string, FieldSpec> &properties,
                 const std::vector<std::string> &required,
                 const std::string &origin) {
    if (std::find(schema_.contributors.begin(), schema_.contributors.end(),
                  origin) == schema_.contributors.end()) {
      schema_.contributors.push_back(origin);
    }
    merge_properties(schema_.fields, properties, "", origin);
    merge_required(schema_.required, required);
  }

private:
  static std::string child_path(const std::string &parent,
                                const std::string &name) {
    return parent.empty() ? name : parent + "." + name;
  }

  static void merge_required(std::vector<std::string> &into,
                             const std::vector<std::string> &from) {
    for (const auto &name : from) {
      if (std::find(into.begin(), into.end(), name) == into.end()) {
        into.push_back(name);
      }
    }
  }

  void merge_properties(std::map<std::string, FieldSpec> &into,
                        const std::map<std::string, FieldSpec> &from,
                        const std::string &parent, const std::string &origin) {
    for (const auto &[name, spec] : from) {
      std::string path = child_path(parent, name);

      auto &sources = schema_.provenance[path];
      if (sources.empty() || sources.back() != origin) {
        sources.push_back(origin);
      }

      auto it = into.find(name);
      if (it == into.end()) {
        it = into.emplace(name, FieldSpec{}).first;
      }
      merge_field(it->second, spec, path, origin);
    }
  }

  const std::string &origin_of(const std::string &path,
                               const std::string &attribute) const {
    static const std::string unknown = "<unknown>";
    auto it = attribute_origin_.find(path + "#" + attribute);
    return it == attribute_origin_.end() ? unknown : it->second;
  }

  void record(const std::string &path, const std::string &attribute,
              const std::string &origin) {
    attribute_origin_[path + "#" + attribute] = origin;
  }

  [[noreturn]] void conflict(const std::string &path,
                             const std::string &attribute,
                             const std::string &earlier_attribute,
                             const std::string &origin,
                             const std::string &earlier_value,
                             const std::string &later_value) const {
    LOG_ERROR("COMPOSER", "MERGE", "Conflicting {} for '{}' in model '{}'",
              attribute, path, schema_.model);
    throw ConflictingDatatypeError(path, origin_of(path, earlier_attribute),
                                   origin, attribute, earlier_value,
                                   later_value);
  }

  void check_kinds(const FieldSpec &into, const FieldSpec &from,
                   const std::string &path, const std::string &origin) const {
    bool into_array = into.declares_array_shape() || into.datatype;
    bool from_array = from.declares_array_shape() || from.datatype;
    if (into.is_object() && from_array) {
      conflict(path, "kind", "kind", origin, "object", "array");
    }
    if (into_array && from.is_object()) {
      conflict(path, "kind", "kind", origin, "array", "object");
    }
  }

  void merge_rank(FieldSpec &into, const FieldSpec &from,
                  const std::string &path, const std::string &origin) {
    if (from.rank) {
      if (into.rank && *into.rank != *from.rank) {
        conflict(path, "ndim", "ndim", origin, std::to_string(*into.rank),
                 std::to_string(*from.rank));
      }
      into.rank = from.rank;
      record(path, "ndim", origin);
    }
    if (from.max_rank) {
      into.max_rank = from.max_rank;
      record(path, "max_ndim", origin);
    }
    if (into.rank && into.max_rank && *into.rank > *into.max_rank) {
      std::string rank_text = "ndim " + std::to_string(*into.rank);
      std::string max_text = "max_ndim " + std::to_string(*into.max_rank);
      if (from.rank) {
        conflict(path, "ndim", "max_ndim", origin, max_text, rank_text);
      }
      conflict(path, "ndim", "ndim", origin, rank_text, max_text);
    }
  }

  void merge_datatype(FieldSpec &into, const FieldSpec &from,
                      const std::string &path, const std::string &origin) {
    if (!from.datatype)
      return;

    if (into.datatype && *into.datatype != *from.datatype) {
      bool scalar = !into.declares_array_shape();
      bool same_category = datatype_category(*into.datatype) ==
                           datatype_category(*from.datatype);
      if (!(policy_.allow_scalar_datatype_override && scalar &&
            same_category)) {
        conflict(path, "datatype", "datatype", origin,
                 datatype_name(*into.datatype), datatype_name(*from.datatype));
      }
      LOG_DEBUG("COMPOSER", "MERGE",
                "'{}' overrides datatype of '{}': {} -> {}", origin, path,
                datatype_name(*into.datatype), datatype_name(*from.datatype));
    }
    into.datatype = from.datatype;
    record(path, "datatype", origin);
  }

  void merge_field(FieldSpec &into, const FieldSpec &from,
                   const std::string &path, const std::string &origin) {
    check_kinds(into, from, path, origin);
    record_kind(into, from, path, origin);
    merge_rank(into, from, path, origin);
    merge_datatype(into, from, path, origin);

    if (from.title) {
      into.title = from.title;
    }
    if (from.storage_slot) {
      if (into.storage_slot && *into.storage_slot != *from.storage_slot) {
        LOG_DEBUG("COMPOSER", "MERGE",
                  "'{}' rebinds '{}' from extension {} to {}", origin, path,
                  *into.storage_slot, *from.storage_slot);
      }
      into.storage_slot = from.storage_slot;
    }
    if (from.default_value) {
      into.default_value = from.default_value;
    }
    if (from.type) {
      into.type = from.type;
    }

    merge_properties(into.properties, from.properties, path, origin);
    merge_required(into.required, from.required);
  }

  void record_kind(const FieldSpec &into, const FieldSpec &from,
                   const std::string &path, const std::string &origin) {
    if (!into.is_object() && !into.declares_array_shape() && !into.datatype) {
      if (from.is_object() || from.declares_array_shape() || from.datatype) {
        record(path, "kind", origin);
      }
    }
  }

  EffectiveSchema &schema_;
  const CompositionPolicy &policy_;
  std::map<std::string, std::string> attribute_origin_;
};

} // namespace

std::string Composer::model_name(const std::string &fragment_id) {
  std::string name = std::filesystem::path(fragment_id).filename().string();
  for (const std::string suffix : {".yaml", ".yml", ".json", ".schema"}) {
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) ==
            0) {
      name.erase(name.size() - suffix.size());
    }
  }
  return name;
}

EffectiveSchema Composer::compose(const ResolvedFragment &resolved,
                                  const CompositionPolicy &policy) {
  if (!resolved.is_resolved()) {
    throw std::invalid_argument("Fragment '" + resolved.id +
                                "' must be resolved before composition");
  }

  EffectiveSchema schema;
  schema.model = model_name(resolved.id);
  schema.schema_uri = resolved.schema_uri;

  Merger merger(schema, policy);
  for (const auto &member : resolved.composition) {
    const auto &set = std::get<InlineFieldSet>(member);
    merger.merge_set(set.properties, set.required, set.origin);
  }
  if (!resolved.fields.empty() || !resolved.required.empty()) {
    merger.merge_set(resolved.fields, resolved.required, resolved.id);
  }

  LOG_DEBUG("COMPOSER", "COMPOSE",
            "Composed model '{}': {} fields from {} fragments", schema.model,
            schema.fields.size(), schema.contributors.size());
  return schema;
}

} // namespace dmschema
