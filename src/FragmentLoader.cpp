#include "datamodel-schema/FragmentLoader.hpp"
#include "datamodel-schema/Conversions.hpp"
#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/Logger.hpp"

#include <filesystem>
#include <limits>

namespace dmschema {

namespace {

struct ParseContext {
  const std::string &fragment;

  [[noreturn]] void fail(const std::string &path,
                         const std::string &message) const {
    throw MalformedSchemaError(fragment, path, message);
  }
};

std::string join_path(const std::string &base, const std::string &key) {
  return base + "/" + key;
}

std::string valid_datatype_tokens() {
  return "int8, int16, int32, int64, uint8, uint16, uint32, uint64, "
         "float16, float32, float64, complex64, complex128, bool8";
}

int parse_rank(const ParseContext &ctx, const nlohmann::json &value,
               const std::string &path) {
  constexpr auto max_rank = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    auto n = value.get<uint64_t>();
    if (n > static_cast<uint64_t>(max_rank)) {
      ctx.fail(path, "rank out of range, got " + std::to_string(n));
    }
    return static_cast<int>(n);
  }
  if (value.is_number_integer()) {
    auto n = value.get<int64_t>();
    if (n < 0) {
      ctx.fail(path, "rank must be non-negative, got " + std::to_string(n));
    }
    if (n > max_rank) {
      ctx.fail(path, "rank out of range, got " + std::to_string(n));
    }
    return static_cast<int>(n);
  }
  ctx.fail(path, "rank must be an integer, got " + value.dump());
}

// Defaults become data values, which hold no sequences at any depth.
void check_default(const ParseContext &ctx, const nlohmann::json &value,
                   const std::string &path) {
  if (value.is_array() || value.is_binary()) {
    ctx.fail(path, "default must be a scalar or a mapping");
  }
  if (value.is_object()) {
    for (const auto &[key, entry] : value.items()) {
      check_default(ctx, entry, join_path(path, key));
    }
  }
}

std::vector<std::string> parse_required(const ParseContext &ctx,
                                        const nlohmann::json &value,
                                        const std::string &path) {
  if (!value.is_array()) {
    ctx.fail(path, "required must be a sequence of field names");
  }
  std::vector<std::string> names;
  for (const auto &entry : value) {
    if (!entry.is_string()) {
      ctx.fail(path, "required entries must be strings");
    }
    names.push_back(entry.get<std::string>());
  }
  return names;
}

std::map<std::string, FieldSpec> parse_properties(const ParseContext &ctx,
                                                  const nlohmann::json &value,
                                                  const std::string &path);

FieldSpec parse_field(const ParseContext &ctx, const nlohmann::json &value,
                      const std::string &path) {
  if (!value.is_object()) {
    ctx.fail(path, "field definition must be a mapping");
  }
  if (value.contains("allOf") || value.contains("$ref")) {
    ctx.fail(path, "composition is only supported on field-sets, not inside "
                   "a field definition");
  }

  FieldSpec spec;

  if (value.contains("title")) {
    if (!value["title"].is_string()) {
      ctx.fail(join_path(path, "title"), "title must be a string");
    }
    spec.title = value["title"].get<std::string>();
  }

  if (value.contains("fits_hdu")) {
    if (!value["fits_hdu"].is_string()) {
      ctx.fail(join_path(path, "fits_hdu"), "fits_hdu must be a string");
    }
    spec.storage_slot = value["fits_hdu"].get<std::string>();
  }

  if (value.contains("ndim")) {
    spec.rank = parse_rank(ctx, value["ndim"], join_path(path, "ndim"));
  }
  if (value.contains("max_ndim")) {
    spec.max_rank =
        parse_rank(ctx, value["max_ndim"], join_path(path, "max_ndim"));
  }
  if (spec.rank && spec.max_rank && *spec.rank > *spec.max_rank) {
    ctx.fail(path, "ndim exceeds max_ndim");
  }

  if (value.contains("datatype")) {
    const auto &token = value["datatype"];
    if (!token.is_string()) {
      ctx.fail(join_path(path, "datatype"),
               "unsupported datatype " + token.dump());
    }
    auto parsed = parse_datatype(token.get<std::string>());
    if (!parsed) {
      ctx.fail(join_path(path, "datatype"),
               "unrecognized datatype '" + token.get<std::string>() +
                   "' (expected one of: " + valid_datatype_tokens() + ")");
    }
    spec.datatype = *parsed;
  }

  if (value.contains("default")) {
    const auto &def = value["default"];
    check_default(ctx, def, join_path(path, "default"));
    spec.default_value = def;
  }

  if (value.contains("type")) {
    if (!value["type"].is_string()) {
      ctx.fail(join_path(path, "type"), "type must be a string");
    }
    spec.type = value["type"].get<std::string>();
  }

  if (value.contains("properties")) {
    spec.properties = parse_properties(ctx, value["properties"],
                                       join_path(path, "properties"));
  }
  if (value.contains("required")) {
    spec.required =
        parse_required(ctx, value["required"], join_path(path, "required"));
  }

  if (spec.is_object() && spec.declares_array_shape()) {
    ctx.fail(path, "object fields cannot declare ndim or max_ndim");
  }
  return spec;
}

std::map<std::string, FieldSpec> parse_properties(const ParseContext &ctx,
                                                  const nlohmann::json &value,
                                                  const std::string &path) {
  if (!value.is_object()) {
    ctx.fail(path, "properties must be a mapping");
  }
  std::map<std::string, FieldSpec> fields;
  for (const auto &[name, field] : value.items()) {
    fields[name] = parse_field(ctx, field, join_path(path, name));
  }
  return fields;
}

bool is_field_set(const nlohmann::json &member) {
  return member.contains("properties") || member.contains("allOf") ||
         member.contains("required");
}

void parse_composition(const ParseContext &ctx, const nlohmann::json &value,
                       const std::string &path,
                       std::vector<CompositionMember> &out);

// An inline allOf member; nested allOf members are flattened ahead of the
// member's own properties so that the member's properties refine them.
void parse_inline_member(const ParseContext &ctx, const nlohmann::json &member,
                         const std::string &path,
                         std::vector<CompositionMember> &out) {
  if (member.contains("allOf")) {
    parse_composition(ctx, member["allOf"], join_path(path, "allOf"), out);
  }

  InlineFieldSet set;
  set.origin = ctx.fragment;
  if (member.contains("properties")) {
    set.properties = parse_properties(ctx, member["properties"],
                                      join_path(path, "properties"));
  }
  if (member.contains("required")) {
    set.required =
        parse_required(ctx, member["required"], join_path(path, "required"));
  }
  if (!set.properties.empty() || !set.required.empty()) {
    out.emplace_back(std::move(set));
  }
}

void parse_composition(const ParseContext &ctx, const nlohmann::json &value,
                       const std::string &path,
                       std::vector<CompositionMember> &out) {
  if (!value.is_array()) {
    ctx.fail(path, "allOf must be a sequence");
  }

  for (size_t i = 0; i < value.size(); ++i) {
    const auto &member = value[i];
    std::string member_path = join_path(path, std::to_string(i));

    if (!member.is_object()) {
      ctx.fail(member_path,
               "composition member is neither a reference nor an inline "
               "field-set");
    }

    if (member.contains("$ref")) {
      if (is_field_set(member)) {
        ctx.fail(member_path,
                 "composition member mixes $ref with inline properties");
      }
      if (!member["$ref"].is_string() ||
          member["$ref"].get<std::string>().empty()) {
        ctx.fail(join_path(member_path, "$ref"),
                 "$ref must be a non-empty string");
      }
      out.emplace_back(Reference{FragmentLoader::normalize_reference(
                                     member["$ref"].get<std::string>()),
                                 ctx.fragment});
    } else if (is_field_set(member)) {
      parse_inline_member(ctx, member, member_path, out);
    } else {
      ctx.fail(member_path,
               "composition member is neither a reference nor an inline "
               "field-set");
    }
  }
}

} // namespace

std::string FragmentLoader::normalize_reference(const std::string &ref) {
  std::string out = ref;
  const std::string file_scheme = "file://";
  if (out.rfind(file_scheme, 0) == 0) {
    out = out.substr(file_scheme.size());
  }
  auto hash = out.find('#');
  if (hash != std::string::npos) {
    out = out.substr(0, hash);
  }
  return out;
}

SchemaFragment FragmentLoader::load(const nlohmann::json &document,
                                    const std::string &name,
                                    const std::string &source_path) {
  std::string id = name;
  if (id.empty() && document.is_object() && document.contains("id") &&
      document["id"].is_string()) {
    id = document["id"].get<std::string>();
  }
  if (id.empty()) {
    throw MalformedSchemaError("<unnamed>", "",
                               "fragment has neither a name nor an id");
  }

  ParseContext ctx{id};
  if (!document.is_object()) {
    ctx.fail("", "schema document must be a mapping");
  }

  SchemaFragment fragment;
  fragment.id = id;
  fragment.source_path = source_path;

  if (document.contains("$schema")) {
    if (!document["$schema"].is_string()) {
      ctx.fail("/$schema", "$schema must be a string");
    }
    fragment.schema_uri = document["$schema"].get<std::string>();
  }

  if (document.contains("$ref")) {
    // A document that is itself a single reference
    nlohmann::json member = nlohmann::json::object();
    member["$ref"] = document["$ref"];
    nlohmann::json members = nlohmann::json::array();
    members.push_back(member);
    parse_composition(ctx, members, "/$ref", fragment.composition);
  }
  if (document.contains("allOf")) {
    parse_composition(ctx, document["allOf"], "/allOf", fragment.composition);
  }
  if (document.contains("properties")) {
    fragment.fields =
        parse_properties(ctx, document["properties"], "/properties");
  }
  if (document.contains("required")) {
    fragment.required =
        parse_required(ctx, document["required"], "/required");
  }

  LOG_DEBUG("LOADER", "LOAD",
            "Loaded fragment '{}': {} composition members, {} fields", id,
            fragment.composition.size(), fragment.fields.size());
  return fragment;
}

SchemaFragment FragmentLoader::load_yaml(const YAML::Node &document,
                                         const std::string &name) {
  return load(yaml_to_json(document), name);
}

SchemaFragment FragmentLoader::load_file(const std::string &path) {
  std::filesystem::path p(path);
  std::string name = p.filename().string();

  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw MalformedSchemaError(name, "",
                               std::string("YAML parse error: ") + e.what());
  }

  std::string source = std::filesystem::weakly_canonical(p).string();
  LOG_DEBUG("LOADER", "LOAD_FILE", "Reading fragment '{}' from {}", name,
            source);
  return load(yaml_to_json(doc), name, source);
}

} // namespace dmschema
