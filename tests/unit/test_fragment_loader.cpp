#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/FragmentLoader.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace dmschema;

static SchemaFragment load_text(const std::string &name,
                                const std::string &text) {
  return FragmentLoader::load_yaml(YAML::Load(text), name);
}

TEST(FragmentLoader, ParsesReferencesAndInlineFieldSets) {
  auto fragment = load_text("cube.schema.yaml", R"(
allOf:
- $ref: core.schema.yaml
- type: object
  properties:
    data:
      title: The science data
      fits_hdu: SCI
      default: 0.0
      ndim: 3
      datatype: float32
- $ref: variance.schema.yaml
$schema: http://stsci.edu/schemas/fits-schema/fits-schema
)");

  EXPECT_EQ(fragment.id, "cube.schema.yaml");
  ASSERT_TRUE(fragment.schema_uri.has_value());
  EXPECT_EQ(*fragment.schema_uri,
            "http://stsci.edu/schemas/fits-schema/fits-schema");
  ASSERT_EQ(fragment.composition.size(), 3);
  EXPECT_FALSE(fragment.is_resolved());

  const auto &core = std::get<Reference>(fragment.composition[0]);
  EXPECT_EQ(core.target, "core.schema.yaml");
  EXPECT_EQ(core.referrer, "cube.schema.yaml");

  const auto &set = std::get<InlineFieldSet>(fragment.composition[1]);
  EXPECT_EQ(set.origin, "cube.schema.yaml");
  ASSERT_EQ(set.properties.count("data"), 1);
  const auto &data = set.properties.at("data");
  EXPECT_EQ(data.title, "The science data");
  EXPECT_EQ(data.storage_slot, "SCI");
  EXPECT_EQ(data.rank, 3);
  EXPECT_EQ(data.datatype, Datatype::Float32);
  ASSERT_TRUE(data.default_value.has_value());
  EXPECT_DOUBLE_EQ(data.default_value->get<double>(), 0.0);

  EXPECT_EQ(fragment.references(),
            (std::vector<std::string>{"core.schema.yaml",
                                      "variance.schema.yaml"}));
}

TEST(FragmentLoader, AttributesAreOptional) {
  auto fragment = load_text("dq.schema.yaml", R"(
properties:
  dq:
    title: Data quality array
    fits_hdu: DQ
)");

  ASSERT_EQ(fragment.fields.count("dq"), 1);
  const auto &dq = fragment.fields.at("dq");
  EXPECT_FALSE(dq.rank.has_value());
  EXPECT_FALSE(dq.max_rank.has_value());
  EXPECT_FALSE(dq.datatype.has_value());
  EXPECT_FALSE(dq.default_value.has_value());
  EXPECT_TRUE(fragment.is_resolved());
}

TEST(FragmentLoader, ParsesNestedObjectFields) {
  auto fragment = load_text("core.schema.yaml", R"(
properties:
  meta:
    type: object
    required: [filename]
    properties:
      filename:
        type: string
      exposure:
        type: object
        properties:
          nints:
            datatype: int32
)");

  const auto &meta = fragment.fields.at("meta");
  EXPECT_TRUE(meta.is_object());
  EXPECT_EQ(meta.required, std::vector<std::string>{"filename"});
  ASSERT_EQ(meta.properties.count("exposure"), 1);
  EXPECT_EQ(meta.properties.at("exposure").properties.at("nints").datatype,
            Datatype::Int32);
}

TEST(FragmentLoader, NestedAllOfIsFlattenedAheadOfOwnProperties) {
  auto fragment = load_text("nested.schema.yaml", R"(
allOf:
- allOf:
  - $ref: base.schema.yaml
  - properties:
      a: {title: first}
  properties:
    b: {title: second}
)");

  ASSERT_EQ(fragment.composition.size(), 3);
  EXPECT_EQ(std::get<Reference>(fragment.composition[0]).target,
            "base.schema.yaml");
  EXPECT_EQ(std::get<InlineFieldSet>(fragment.composition[1])
                .properties.count("a"),
            1);
  EXPECT_EQ(std::get<InlineFieldSet>(fragment.composition[2])
                .properties.count("b"),
            1);
}

TEST(FragmentLoader, DocumentLevelRefBecomesSingleMember) {
  auto fragment = load_text("alias.schema.yaml", "$ref: cube.schema.yaml\n");
  ASSERT_EQ(fragment.composition.size(), 1);
  EXPECT_EQ(std::get<Reference>(fragment.composition[0]).target,
            "cube.schema.yaml");
}

TEST(FragmentLoader, NormalizesReferences) {
  EXPECT_EQ(FragmentLoader::normalize_reference(
                "file://core.schema.yaml#/definitions/meta"),
            "core.schema.yaml");
  EXPECT_EQ(FragmentLoader::normalize_reference("core.schema.yaml"),
            "core.schema.yaml");
}

TEST(FragmentLoader, UsesDocumentIdWhenUnnamed) {
  nlohmann::json doc = {{"id", "named.schema.yaml"},
                        {"properties", {{"x", {{"title", "X"}}}}}};
  auto fragment = FragmentLoader::load(doc, "");
  EXPECT_EQ(fragment.id, "named.schema.yaml");

  nlohmann::json anonymous = {{"properties", nlohmann::json::object()}};
  EXPECT_THROW(FragmentLoader::load(anonymous, ""), MalformedSchemaError);
}

TEST(FragmentLoader, RejectsUnknownDatatype) {
  try {
    load_text("bad.schema.yaml", R"(
allOf:
- properties:
    data:
      datatype: float128
)");
    FAIL() << "Expected MalformedSchemaError";
  } catch (const MalformedSchemaError &e) {
    EXPECT_EQ(e.fragment(), "bad.schema.yaml");
    EXPECT_EQ(e.path(), "/allOf/0/properties/data/datatype");
    EXPECT_NE(std::string(e.what()).find("float128"), std::string::npos);
  }
}

TEST(FragmentLoader, RejectsInvalidRank) {
  EXPECT_THROW(load_text("r.yaml", "properties: {data: {ndim: -1}}"),
               MalformedSchemaError);
  EXPECT_THROW(load_text("r.yaml", "properties: {data: {ndim: three}}"),
               MalformedSchemaError);
  EXPECT_THROW(load_text("r.yaml", "properties: {data: {ndim: '3'}}"),
               MalformedSchemaError);
  EXPECT_THROW(
      load_text("r.yaml", "properties: {data: {ndim: 3, max_ndim: 2}}"),
      MalformedSchemaError);

  // Ranks that do not fit an int are rejected, not wrapped
  try {
    load_text("r.yaml", "properties: {data: {ndim: 4294967295}}");
    FAIL() << "Expected MalformedSchemaError";
  } catch (const MalformedSchemaError &e) {
    EXPECT_EQ(e.path(), "/properties/data/ndim");
  }
  EXPECT_THROW(
      load_text("r.yaml", "properties: {data: {max_ndim: 2147483648}}"),
      MalformedSchemaError);
  nlohmann::json unsigned_rank = {
      {"properties", {{"data", {{"ndim", uint64_t{4294967295u}}}}}}};
  EXPECT_THROW(FragmentLoader::load(unsigned_rank, "r.yaml"),
               MalformedSchemaError);

  auto widest = load_text("r.yaml", "properties: {data: {ndim: 2147483647}}");
  EXPECT_EQ(widest.fields.at("data").rank, 2147483647);
}

TEST(FragmentLoader, RejectsMalformedCompositionMembers) {
  // Neither a reference nor a field-set
  EXPECT_THROW(load_text("m.yaml", "allOf: [{title: orphan}]"),
               MalformedSchemaError);
  EXPECT_THROW(load_text("m.yaml", "allOf: [42]"), MalformedSchemaError);
  EXPECT_THROW(load_text("m.yaml", "allOf: {properties: {}}"),
               MalformedSchemaError);
  // $ref mixed with inline properties
  EXPECT_THROW(
      load_text("m.yaml",
                "allOf: [{$ref: a.yaml, properties: {x: {title: X}}}]"),
      MalformedSchemaError);
  EXPECT_THROW(load_text("m.yaml", "allOf: [{$ref: ''}]"),
               MalformedSchemaError);
}

TEST(FragmentLoader, RejectsCompositionInsideField) {
  EXPECT_THROW(
      load_text("f.yaml", "properties: {meta: {allOf: [{$ref: a.yaml}]}}"),
      MalformedSchemaError);
}

TEST(FragmentLoader, RejectsArrayDefaults) {
  EXPECT_THROW(load_text("d.yaml", "properties: {x: {default: [1, 2]}}"),
               MalformedSchemaError);

  // A sequence anywhere inside a mapping default is rejected too
  try {
    load_text("d.yaml",
              "properties: {meta: {default: {optics: {filters: [1, 2]}}}}");
    FAIL() << "Expected MalformedSchemaError";
  } catch (const MalformedSchemaError &e) {
    EXPECT_EQ(e.path(), "/properties/meta/default/optics/filters");
  }

  auto nested = load_text(
      "d.yaml", "properties: {meta: {default: {telescope: JWST, nints: 4}}}");
  EXPECT_TRUE(nested.fields.at("meta").default_value->is_object());
}

TEST(FragmentLoader, RejectsShapeOnObjectFields) {
  EXPECT_THROW(
      load_text("o.yaml",
                "properties: {meta: {type: object, ndim: 2, properties: {}}}"),
      MalformedSchemaError);
}

TEST(FragmentLoader, MissingFileIsMalformed) {
  EXPECT_THROW(FragmentLoader::load_file("/nonexistent/dir/x.schema.yaml"),
               MalformedSchemaError);
}
