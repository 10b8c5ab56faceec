#include "datamodel-schema/engine/SchemaEngine.hpp"
#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/Logger.hpp"
#include "datamodel-schema/ReferenceResolver.hpp"

#include <mutex>

namespace dmschema {
namespace engine {

SchemaEngine::SchemaEngine(registry::FragmentRegistry &registry,
                           CompositionPolicy policy)
    : registry_(registry), policy_(policy) {}

registry::FragmentRegistry::FragmentPtr
SchemaEngine::find_fragment(const registry::FragmentRegistry::View &fragments,
                            const std::string &name) {
  if (auto fragment = fragments.find(name)) {
    return fragment;
  }
  // Model names map onto the conventional fragment file name
  if (auto fragment = fragments.find(name + ".schema.yaml")) {
    return fragment;
  }
  return nullptr;
}

std::shared_ptr<const EffectiveSchema>
SchemaEngine::effective_schema(const std::string &name) {
  {
    std::shared_lock lock(mutex_);
    auto it = cache_.find(name);
    if (it != cache_.end() &&
        it->second.generation == registry_.generation()) {
      return it->second.schema;
    }
  }

  // One snapshot serves the root and every reference below it
  auto fragments = registry_.pin();
  uint64_t generation = fragments.generation();

  auto fragment = find_fragment(fragments, name);
  if (!fragment) {
    LOG_ERROR("ENGINE", "COMPOSE", "No fragment named '{}'", name);
    throw UnresolvedReferenceError("<engine>", name, {name});
  }

  std::shared_ptr<const EffectiveSchema> schema;
  try {
    auto resolved = ReferenceResolver::resolve(*fragment, fragments);
    schema = std::make_shared<const EffectiveSchema>(
        Composer::compose(resolved, policy_));
  } catch (const SchemaError &e) {
    LOG_ERROR("ENGINE", "COMPOSE", "Failed to build schema '{}': {}", name,
              e.what());
    throw;
  }

  std::unique_lock lock(mutex_);
  if (registry_.generation() == generation) {
    cache_[name] = CacheEntry{schema, generation};
    LOG_INFO("ENGINE", "COMPOSE", "Cached effective schema '{}' ({} fields)",
             schema->model, schema->fields.size());
  } else {
    LOG_DEBUG("ENGINE", "COMPOSE",
              "Registry changed while composing '{}'; not caching", name);
  }
  return schema;
}

ValidationOutcome SchemaEngine::validate(const std::string &name,
                                         const DataObject &object) {
  auto schema = effective_schema(name);
  return SchemaValidator::validate(*schema, object);
}

StorageBindingTable SchemaEngine::bindings(const std::string &name) {
  return dmschema::bindings(*effective_schema(name));
}

void SchemaEngine::refresh(const std::string &fragment_name) {
  std::unique_lock lock(mutex_);
  registry_.reload(fragment_name);
  cache_.clear();
  LOG_INFO("ENGINE", "REFRESH",
           "Reloaded '{}'; effective schema cache cleared", fragment_name);
}

void SchemaEngine::invalidate() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

size_t SchemaEngine::cached_count() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace engine
} // namespace dmschema
