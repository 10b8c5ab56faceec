#pragma once

#include "datamodel-schema/export.h"
#include "datamodel-schema/registry/FragmentRegistry.hpp"
#include "datamodel-schema/types.hpp"

namespace dmschema {

/// Expands every $ref in a fragment's composition list into the referenced
/// fragment's own (recursively resolved) field-sets, left to right.
///
/// Referenced fragments contribute their composition members followed by
/// their own top-level properties as one field-set. The root fragment's
/// top-level properties stay in `fields`.
///
/// Throws UnresolvedReferenceError when the registry cannot supply a target
/// and CyclicReferenceError when a fragment is reached again while it is
/// still being expanded. Nothing is returned on failure.
class DATAMODEL_SCHEMA_API ReferenceResolver {
public:
  static ResolvedFragment resolve(const SchemaFragment &fragment,
                                  registry::FragmentRegistry &registry);

  /// Resolve against a pinned registry view; every reference sees the
  /// fragment versions of that one snapshot.
  static ResolvedFragment
  resolve(const SchemaFragment &fragment,
          const registry::FragmentRegistry::View &fragments);
};

} // namespace dmschema
