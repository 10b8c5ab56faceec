#include "datamodel-schema/ReferenceResolver.hpp"
#include "datamodel-schema/Errors.hpp"
#include "datamodel-schema/Logger.hpp"

#include <unordered_map>

namespace dmschema {

namespace {

using FieldSets = std::vector<InlineFieldSet>;

struct ResolutionState {
  const registry::FragmentRegistry::View &fragments;

  // Active resolution stack and the index of each name on it
  std::vector<std::string> chain;
  std::unordered_map<std::string, size_t> on_chain;

  // Fully expanded field-sets of fragments finished during this call
  std::unordered_map<std::string, FieldSets> expanded;
};

[[noreturn]] void throw_cycle(const ResolutionState &state,
                              const std::string &name) {
  size_t start = state.on_chain.at(name);
  std::vector<std::string> cycle(state.chain.begin() + start,
                                 state.chain.end());
  cycle.push_back(name);
  throw CyclicReferenceError(state.chain.front(), std::move(cycle));
}

FieldSets expand_members(const SchemaFragment &fragment,
                         ResolutionState &state);

const FieldSets &expand_reference(const SchemaFragment &referrer,
                                  const Reference &ref,
                                  ResolutionState &state) {
  auto target = state.fragments.find(ref.target, referrer.source_path);
  if (!target) {
    auto chain = state.chain;
    chain.push_back(ref.target);
    throw UnresolvedReferenceError(referrer.id, ref.target, std::move(chain));
  }

  if (state.on_chain.count(target->id)) {
    throw_cycle(state, target->id);
  }

  auto done = state.expanded.find(target->id);
  if (done != state.expanded.end()) {
    return done->second;
  }

  FieldSets sets = expand_members(*target, state);
  if (!target->fields.empty() || !target->required.empty()) {
    sets.push_back(
        InlineFieldSet{target->id, target->fields, target->required});
  }
  return state.expanded.emplace(target->id, std::move(sets)).first->second;
}

FieldSets expand_members(const SchemaFragment &fragment,
                         ResolutionState &state) {
  state.on_chain[fragment.id] = state.chain.size();
  state.chain.push_back(fragment.id);

  FieldSets out;
  for (const auto &member : fragment.composition) {
    if (const auto *inline_set = std::get_if<InlineFieldSet>(&member)) {
      out.push_back(*inline_set);
    } else {
      const auto &sets =
          expand_reference(fragment, std::get<Reference>(member), state);
      out.insert(out.end(), sets.begin(), sets.end());
    }
  }

  state.chain.pop_back();
  state.on_chain.erase(fragment.id);
  return out;
}

} // namespace

ResolvedFragment
ReferenceResolver::resolve(const SchemaFragment &fragment,
                           registry::FragmentRegistry &registry) {
  return resolve(fragment, registry.pin());
}

ResolvedFragment
ReferenceResolver::resolve(const SchemaFragment &fragment,
                           const registry::FragmentRegistry::View &fragments) {
  if (fragment.is_resolved()) {
    LOG_TRACE("RESOLVER", "RESOLVE", "Fragment '{}' has no references",
              fragment.id);
    return fragment;
  }

  ResolutionState state{fragments, {}, {}, {}};
  FieldSets sets = expand_members(fragment, state);

  ResolvedFragment resolved;
  resolved.id = fragment.id;
  resolved.schema_uri = fragment.schema_uri;
  resolved.source_path = fragment.source_path;
  resolved.fields = fragment.fields;
  resolved.required = fragment.required;
  resolved.composition.reserve(sets.size());
  for (auto &set : sets) {
    resolved.composition.emplace_back(std::move(set));
  }

  LOG_DEBUG("RESOLVER", "RESOLVE",
            "Resolved '{}' into {} field-sets ({} fragments expanded)",
            fragment.id, resolved.composition.size(), state.expanded.size());
  return resolved;
}

} // namespace dmschema
