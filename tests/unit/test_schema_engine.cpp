#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/FragmentLoader.hpp"
#include "datamodel-schema/engine/SchemaEngine.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <yaml-cpp/yaml.h>

using namespace dmschema;

namespace fs = std::filesystem;

class SchemaEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    tmp_ = fs::temp_directory_path() /
           ("dmschema_engine_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    fs::remove_all(tmp_);
    fs::create_directories(tmp_);

    write("core.schema.yaml", R"(
properties:
  meta:
    type: object
    properties:
      telescope: {type: string, default: JWST}
)");
    write("cube.schema.yaml", R"(
allOf:
- $ref: core.schema.yaml
- properties:
    data: {fits_hdu: SCI, ndim: 3, datatype: float32, default: 0.0}
    err: {fits_hdu: ERR, datatype: float32, default: 0.0}
)");
    registry_.set_search_paths({tmp_.string()});
  }

  void TearDown() override { fs::remove_all(tmp_); }

  void write(const std::string &name, const std::string &contents) {
    std::ofstream ofs(tmp_ / name);
    ofs << contents;
  }

  fs::path tmp_;
  registry::FragmentRegistry registry_;
};

TEST_F(SchemaEngineTest, ComposesOnFirstUseAndCaches) {
  engine::SchemaEngine engine(registry_);
  EXPECT_EQ(engine.cached_count(), 0);

  auto first = engine.effective_schema("cube.schema.yaml");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->model, "cube");
  EXPECT_NE(first->find_field("meta.telescope"), nullptr);
  EXPECT_EQ(engine.cached_count(), 1);

  auto second = engine.effective_schema("cube.schema.yaml");
  EXPECT_EQ(first, second);
}

TEST_F(SchemaEngineTest, AcceptsModelNames) {
  engine::SchemaEngine engine(registry_);
  auto schema = engine.effective_schema("cube");
  EXPECT_EQ(schema->model, "cube");
  EXPECT_NE(schema->find_field("data"), nullptr);
}

TEST_F(SchemaEngineTest, UnknownModelIsUnresolved) {
  engine::SchemaEngine engine(registry_);
  EXPECT_THROW(engine.effective_schema("ramp"), UnresolvedReferenceError);
  EXPECT_EQ(engine.cached_count(), 0);
}

TEST_F(SchemaEngineTest, CompositionErrorsAreNotCached) {
  write("broken.schema.yaml", "allOf: [{$ref: nowhere.schema.yaml}]\n");
  engine::SchemaEngine engine(registry_);
  EXPECT_THROW(engine.effective_schema("broken"), UnresolvedReferenceError);
  EXPECT_EQ(engine.cached_count(), 0);
}

TEST_F(SchemaEngineTest, RefreshOfReferencedFragmentInvalidatesDependents) {
  engine::SchemaEngine engine(registry_);
  auto before = engine.effective_schema("cube");
  auto telescope_default = [](const EffectiveSchema &schema) {
    const auto *field = schema.find_field("meta.telescope");
    return field->default_value->get<std::string>();
  };
  ASSERT_EQ(telescope_default(*before), "JWST");

  write("core.schema.yaml", R"(
properties:
  meta:
    type: object
    properties:
      telescope: {type: string, default: HST}
)");
  engine.refresh("core.schema.yaml");
  EXPECT_EQ(engine.cached_count(), 0);

  auto after = engine.effective_schema("cube");
  EXPECT_NE(before, after);
  EXPECT_EQ(telescope_default(*after), "HST");
  // Earlier holders keep the schema they were given
  EXPECT_EQ(telescope_default(*before), "JWST");
}

TEST_F(SchemaEngineTest, ReplacingAFragmentMakesCachedSchemasStale) {
  engine::SchemaEngine engine(registry_);
  auto before = engine.effective_schema("cube");

  registry_.add(FragmentLoader::load_yaml(
      YAML::Load("properties: {meta: {type: object}}"), "core.schema.yaml"));

  auto after = engine.effective_schema("cube");
  EXPECT_NE(before, after);
  EXPECT_EQ(after->find_field("meta.telescope"), nullptr);
}

TEST_F(SchemaEngineTest, InvalidateDropsEverything) {
  engine::SchemaEngine engine(registry_);
  engine.effective_schema("cube");
  engine.effective_schema("core");
  EXPECT_EQ(engine.cached_count(), 2);
  engine.invalidate();
  EXPECT_EQ(engine.cached_count(), 0);
}

TEST_F(SchemaEngineTest, ValidateAndBindingsDelegate) {
  engine::SchemaEngine engine(registry_);

  DataObject input{{"data", ArrayValue{Datatype::Float32, {2, 8, 8}}}};
  auto outcome = engine.validate("cube", input);
  EXPECT_TRUE(outcome.report.empty());
  EXPECT_TRUE(outcome.validated.is_synthesized("err"));
  EXPECT_TRUE(outcome.validated.is_synthesized("meta.telescope"));

  auto table = engine.bindings("cube");
  EXPECT_EQ(table.slot_for("data"), "SCI");
  EXPECT_EQ(table.slot_for("err"), "ERR");
}

TEST_F(SchemaEngineTest, StrictPolicyIsApplied) {
  write("override.schema.yaml", R"(
allOf:
- properties:
    exptime: {datatype: float32}
- properties:
    exptime: {datatype: float64}
)");

  CompositionPolicy strict;
  strict.allow_scalar_datatype_override = false;
  engine::SchemaEngine strict_engine(registry_, strict);
  EXPECT_THROW(strict_engine.effective_schema("override"),
               ConflictingDatatypeError);

  engine::SchemaEngine lenient_engine(registry_);
  EXPECT_EQ(lenient_engine.effective_schema("override")
                ->find_field("exptime")
                ->datatype,
            Datatype::Float64);
}

TEST_F(SchemaEngineTest, ConcurrentReadersShareOneSchema) {
  registry_.load_directory(tmp_.string());
  engine::SchemaEngine engine(registry_);
  auto expected = engine.effective_schema("cube");

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      for (int j = 0; j < 100; ++j) {
        if (engine.effective_schema("cube") != expected) {
          ++mismatches;
        }
        DataObject input{{"err", ArrayValue{Datatype::Float32, {8, 8}}}};
        if (!engine.validate("cube", input).report.empty()) {
          ++mismatches;
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}
