#pragma once
#include "datamodel-schema/export.h"
#include "datamodel-schema/types.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dmschema {
namespace registry {

/// Process-scoped store of loaded fragments, keyed by fragment name.
///
/// Populate it during an explicit init phase (add / load_file /
/// load_directory); afterwards lookups are lock-shared and cheap. Writes
/// replace the whole snapshot, so readers never observe a half-updated map.
/// The generation counter advances whenever an existing fragment is
/// replaced, which is what dependent caches key their validity on.
class DATAMODEL_SCHEMA_API FragmentRegistry {
public:
  using FragmentPtr = std::shared_ptr<const SchemaFragment>;

private:
  using Snapshot = std::map<std::string, FragmentPtr>;

public:
  /// Lookups pinned to the registry contents at one point in time.
  /// Fragments registered then are always served from that snapshot, so a
  /// concurrent reload never mixes versions within one resolution. Names
  /// absent from the snapshot still load lazily through the registry.
  class DATAMODEL_SCHEMA_API View {
  public:
    FragmentPtr find(const std::string &name,
                     const std::string &referrer_source = "") const;

    /// Registry generation the snapshot belongs to
    uint64_t generation() const { return generation_; }

  private:
    friend class FragmentRegistry;
    View(FragmentRegistry &registry, std::shared_ptr<const Snapshot> fragments,
         uint64_t generation);

    FragmentRegistry *registry_;
    std::shared_ptr<const Snapshot> fragments_;
    uint64_t generation_;
  };

  FragmentRegistry();
  explicit FragmentRegistry(std::vector<std::string> search_paths);

  FragmentRegistry(const FragmentRegistry &) = delete;
  FragmentRegistry &operator=(const FragmentRegistry &) = delete;

  /// Register a fragment under its id, replacing any previous version
  FragmentPtr add(SchemaFragment fragment);

  /// Load a YAML file and register it under its file name
  FragmentPtr load_file(const std::string &path);

  /// Load every *.yaml / *.yml file in a directory (non-recursive).
  /// Returns the number of fragments registered.
  size_t load_directory(const std::string &dir);

  /// Look up a fragment. When it is not registered yet, try to load it from
  /// disk next to `referrer_source` or on the search paths. Returns nullptr
  /// when no such fragment exists anywhere.
  FragmentPtr find(const std::string &name,
                   const std::string &referrer_source = "");

  /// Pin the current contents for a multi-fragment lookup
  View pin();

  /// Look up without touching the filesystem
  FragmentPtr get(const std::string &name) const;

  /// Re-read a registered fragment from its source file.
  /// Throws std::runtime_error if the fragment is unknown or was not loaded
  /// from disk.
  FragmentPtr reload(const std::string &name);

  bool contains(const std::string &name) const;
  std::vector<std::string> names() const;
  size_t size() const;

  uint64_t generation() const { return generation_.load(); }

  void set_search_paths(std::vector<std::string> search_paths);
  std::vector<std::string> search_paths() const;

private:
  std::shared_ptr<const Snapshot> snapshot() const;
  static FragmentPtr lookup(const Snapshot &fragments,
                            const std::string &name);

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const Snapshot> fragments_;
  std::vector<std::string> search_paths_;
  std::atomic<uint64_t> generation_{0};
};

} // namespace registry
} // namespace dmschema
