#include "datamodel-schema/registry/FragmentRegistry.hpp"
#include "datamodel-schema/FragmentLoader.hpp"
#include "datamodel-schema/Logger.hpp"
#include "datamodel-schema/registry/FragmentPathResolver.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace dmschema {
namespace registry {

FragmentRegistry::FragmentRegistry()
    : fragments_(std::make_shared<const Snapshot>()) {}

FragmentRegistry::FragmentRegistry(std::vector<std::string> search_paths)
    : fragments_(std::make_shared<const Snapshot>()),
      search_paths_(std::move(search_paths)) {}

std::shared_ptr<const FragmentRegistry::Snapshot>
FragmentRegistry::snapshot() const {
  std::shared_lock lock(mutex_);
  return fragments_;
}

FragmentRegistry::FragmentPtr
FragmentRegistry::lookup(const Snapshot &fragments, const std::string &name) {
  auto it = fragments.find(name);
  if (it != fragments.end()) {
    return it->second;
  }

  // "schemas/core.schema.yaml" also matches a fragment named by file name
  std::string base = std::filesystem::path(name).filename().string();
  if (base != name) {
    it = fragments.find(base);
    if (it != fragments.end()) {
      return it->second;
    }
  }
  return nullptr;
}

FragmentRegistry::FragmentPtr FragmentRegistry::add(SchemaFragment fragment) {
  auto ptr = std::make_shared<const SchemaFragment>(std::move(fragment));

  std::unique_lock lock(mutex_);
  auto next = std::make_shared<Snapshot>(*fragments_);
  bool replaced = next->count(ptr->id) > 0;
  (*next)[ptr->id] = ptr;
  fragments_ = std::move(next);

  if (replaced) {
    ++generation_;
    LOG_INFO("REGISTRY", "ADD", "Replaced fragment '{}' (generation {})",
             ptr->id, generation_.load());
  } else {
    LOG_DEBUG("REGISTRY", "ADD", "Registered fragment '{}'", ptr->id);
  }
  return ptr;
}

FragmentRegistry::FragmentPtr
FragmentRegistry::load_file(const std::string &path) {
  return add(FragmentLoader::load_file(path));
}

size_t FragmentRegistry::load_directory(const std::string &dir) {
  if (!std::filesystem::is_directory(dir)) {
    throw std::runtime_error("Schema directory not found: " + dir);
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    auto ext = entry.path().extension().string();
    if (ext == ".yaml" || ext == ".yml") {
      files.push_back(entry.path());
    }
  }
  // Deterministic load order regardless of directory iteration order
  std::sort(files.begin(), files.end());

  for (const auto &file : files) {
    load_file(file.string());
  }

  LOG_INFO("REGISTRY", "LOAD_DIR", "Loaded {} fragments from {}", files.size(),
           dir);
  return files.size();
}

FragmentRegistry::FragmentPtr
FragmentRegistry::find(const std::string &name,
                       const std::string &referrer_source) {
  if (auto found = lookup(*snapshot(), name)) {
    return found;
  }

  auto path = resolve_fragment_path(name, referrer_source, search_paths());
  if (!path) {
    LOG_DEBUG("REGISTRY", "FIND", "Fragment '{}' not found", name);
    return nullptr;
  }

  LOG_INFO("REGISTRY", "FIND", "Lazily loading fragment '{}' from {}", name,
           *path);
  auto fragment = FragmentLoader::load_file(*path);

  std::unique_lock lock(mutex_);
  // Another thread may have loaded it while we were reading the file
  if (auto existing = lookup(*fragments_, fragment.id)) {
    return existing;
  }
  auto ptr = std::make_shared<const SchemaFragment>(std::move(fragment));
  auto next = std::make_shared<Snapshot>(*fragments_);
  (*next)[ptr->id] = ptr;
  fragments_ = std::move(next);
  return ptr;
}

FragmentRegistry::View FragmentRegistry::pin() {
  std::shared_lock lock(mutex_);
  // generation_ only advances under the exclusive lock
  return View(*this, fragments_, generation_.load());
}

FragmentRegistry::View::View(FragmentRegistry &registry,
                             std::shared_ptr<const Snapshot> fragments,
                             uint64_t generation)
    : registry_(&registry), fragments_(std::move(fragments)),
      generation_(generation) {}

FragmentRegistry::FragmentPtr
FragmentRegistry::View::find(const std::string &name,
                             const std::string &referrer_source) const {
  if (auto found = lookup(*fragments_, name)) {
    return found;
  }
  return registry_->find(name, referrer_source);
}

FragmentRegistry::FragmentPtr
FragmentRegistry::get(const std::string &name) const {
  return lookup(*snapshot(), name);
}

FragmentRegistry::FragmentPtr
FragmentRegistry::reload(const std::string &name) {
  auto current = get(name);
  if (!current) {
    throw std::runtime_error("Cannot reload unknown fragment: " + name);
  }
  if (current->source_path.empty()) {
    throw std::runtime_error("Fragment '" + name +
                             "' was not loaded from a file");
  }

  LOG_INFO("REGISTRY", "RELOAD", "Reloading fragment '{}' from {}", name,
           current->source_path);
  return add(FragmentLoader::load_file(current->source_path));
}

bool FragmentRegistry::contains(const std::string &name) const {
  return get(name) != nullptr;
}

std::vector<std::string> FragmentRegistry::names() const {
  auto fragments = snapshot();
  std::vector<std::string> out;
  out.reserve(fragments->size());
  for (const auto &[name, _] : *fragments) {
    out.push_back(name);
  }
  return out;
}

size_t FragmentRegistry::size() const { return snapshot()->size(); }

void FragmentRegistry::set_search_paths(std::vector<std::string> search_paths) {
  std::unique_lock lock(mutex_);
  search_paths_ = std::move(search_paths);
}

std::vector<std::string> FragmentRegistry::search_paths() const {
  std::shared_lock lock(mutex_);
  return search_paths_;
}

} // namespace registry
} // namespace dmschema
