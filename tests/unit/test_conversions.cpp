#include "datamodel-schema/Conversions.hpp"

#include <gtest/gtest.h>

using namespace dmschema;

TEST(YamlToJson, DecodesPlainScalarsByValue) {
  auto j = yaml_to_json(YAML::Load(R"(
count: 3
ratio: 2.5
flag: true
name: float32
nothing: ~
)"));

  EXPECT_TRUE(j["count"].is_number_integer());
  EXPECT_EQ(j["count"].get<int64_t>(), 3);
  EXPECT_TRUE(j["ratio"].is_number_float());
  EXPECT_DOUBLE_EQ(j["ratio"].get<double>(), 2.5);
  EXPECT_TRUE(j["flag"].is_boolean());
  EXPECT_EQ(j["name"], "float32");
  EXPECT_TRUE(j["nothing"].is_null());
}

TEST(YamlToJson, QuotedScalarsStayStrings) {
  auto j = yaml_to_json(YAML::Load("ndim: '3'\nflag: \"true\"\n"));
  EXPECT_TRUE(j["ndim"].is_string());
  EXPECT_EQ(j["ndim"], "3");
  EXPECT_TRUE(j["flag"].is_string());
}

TEST(YamlToJson, PreservesSequencesAndMappings) {
  auto j = yaml_to_json(YAML::Load("allOf: [{$ref: core.schema.yaml}, 4]"));
  ASSERT_TRUE(j["allOf"].is_array());
  ASSERT_EQ(j["allOf"].size(), 2);
  EXPECT_EQ(j["allOf"][0]["$ref"], "core.schema.yaml");
  EXPECT_EQ(j["allOf"][1], 4);
}

TEST(JsonToDataValue, MapsScalarsAndObjects) {
  EXPECT_TRUE(std::holds_alternative<std::monostate>(
      json_to_data_value(nullptr)));
  EXPECT_EQ(std::get<bool>(json_to_data_value(true)), true);
  EXPECT_EQ(std::get<int64_t>(json_to_data_value(-4)), -4);
  EXPECT_DOUBLE_EQ(std::get<double>(json_to_data_value(0.5)), 0.5);
  EXPECT_EQ(std::get<std::string>(json_to_data_value("JWST")), "JWST");

  auto value = json_to_data_value(nlohmann::json{{"telescope", "JWST"}});
  const auto &obj = std::get<DataObjectPtr>(value);
  ASSERT_NE(obj, nullptr);
  EXPECT_EQ(std::get<std::string>(*obj->get("telescope")), "JWST");
}

TEST(JsonToDataValue, RejectsArrays) {
  EXPECT_THROW(json_to_data_value(nlohmann::json::array({1, 2})),
               std::invalid_argument);
}

TEST(DataObjectFromYaml, ReadsArraysScalarsAndNestedObjects) {
  auto obj = data_object_from_yaml(YAML::Load(R"(
data: !array {datatype: float32, shape: [4, 32, 32]}
dq: !array {datatype: uint32, shape: [32, 32]}
meta:
  telescope: JWST
  exposure: {nints: 4}
)"));

  ASSERT_EQ(obj.size(), 3);
  const auto &data = std::get<ArrayValue>(*obj.get("data"));
  EXPECT_EQ(data.datatype, Datatype::Float32);
  EXPECT_EQ(data.shape, (std::vector<size_t>{4, 32, 32}));
  EXPECT_EQ(data.element_count(), 4096);
  EXPECT_EQ(data.nbytes(), 4096 * 4);
  EXPECT_EQ(value_rank(*obj.get("dq")), 2);

  const auto &meta = std::get<DataObjectPtr>(*obj.get("meta"));
  EXPECT_EQ(std::get<std::string>(*meta->get("telescope")), "JWST");
  const auto &exposure = std::get<DataObjectPtr>(*meta->get("exposure"));
  EXPECT_EQ(std::get<int64_t>(*exposure->get("nints")), 4);
}

TEST(DataObjectFromYaml, RejectsMalformedArrays) {
  EXPECT_THROW(data_object_from_yaml(YAML::Load("data: !array {shape: [2]}")),
               std::invalid_argument);
  EXPECT_THROW(data_object_from_yaml(YAML::Load(
                   "data: !array {datatype: float128, shape: [2]}")),
               std::invalid_argument);
  EXPECT_THROW(data_object_from_yaml(YAML::Load(
                   "data: !array {datatype: float32, shape: 2}")),
               std::invalid_argument);
  EXPECT_THROW(data_object_from_yaml(YAML::Load(
                   "data: !array {datatype: float32, shape: [-1]}")),
               std::invalid_argument);
  EXPECT_THROW(data_object_from_yaml(YAML::Load("[1, 2]")),
               std::invalid_argument);
}

TEST(DataObjectToJson, DescribesArraysByShape) {
  DataObject obj{{"data", ArrayValue{Datatype::Float32, {2, 3}}},
                 {"exptime", 10.0}};
  auto j = data_object_to_json(obj);
  EXPECT_EQ(j["data"]["datatype"], "float32");
  EXPECT_EQ(j["data"]["shape"], nlohmann::json({2, 3}));
  EXPECT_DOUBLE_EQ(j["exptime"].get<double>(), 10.0);
}
