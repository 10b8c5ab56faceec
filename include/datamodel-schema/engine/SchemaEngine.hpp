#pragma once
#include "datamodel-schema/Composer.hpp"
#include "datamodel-schema/SchemaValidator.hpp"
#include "datamodel-schema/StorageBindings.hpp"
#include "datamodel-schema/export.h"
#include "datamodel-schema/registry/FragmentRegistry.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace dmschema {
namespace engine {

/// Resolves, composes and caches effective schemas on top of a registry.
///
/// Cached schemas remember the registry generation they were built from and
/// are discarded as soon as any fragment is replaced. A schema computed
/// while a refresh is in flight is returned to its caller but never cached.
class DATAMODEL_SCHEMA_API SchemaEngine {
public:
  explicit SchemaEngine(registry::FragmentRegistry &registry,
                        CompositionPolicy policy = {});

  SchemaEngine(const SchemaEngine &) = delete;
  SchemaEngine &operator=(const SchemaEngine &) = delete;

  /// Effective schema for a top-level fragment. `name` may be the fragment
  /// name ("cube.schema.yaml") or the model name ("cube").
  std::shared_ptr<const EffectiveSchema>
  effective_schema(const std::string &name);

  ValidationOutcome validate(const std::string &name, const DataObject &object);

  StorageBindingTable bindings(const std::string &name);

  /// Reload a fragment from disk and drop every cached schema
  void refresh(const std::string &fragment_name);

  /// Drop every cached schema
  void invalidate();

  size_t cached_count() const;

private:
  struct CacheEntry {
    std::shared_ptr<const EffectiveSchema> schema;
    uint64_t generation;
  };

  static registry::FragmentRegistry::FragmentPtr
  find_fragment(const registry::FragmentRegistry::View &fragments,
                const std::string &name);

  registry::FragmentRegistry &registry_;
  CompositionPolicy policy_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, CacheEntry> cache_;
};

} // namespace engine
} // namespace dmschema
