#include "datamodel-schema/Errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace dmschema {

std::string format_chain(const std::vector<std::string> &chain) {
  std::string out;
  for (size_t i = 0; i < chain.size(); ++i) {
    if (i > 0)
      out += " -> ";
    out += chain[i];
  }
  return out;
}

SchemaError::SchemaError(const std::string &fragment,
                         const std::string &message)
    : std::runtime_error(message), fragment_(fragment) {}

MalformedSchemaError::MalformedSchemaError(const std::string &fragment,
                                           const std::string &path,
                                           const std::string &message)
    : SchemaError(fragment, fmt::format("Malformed schema '{}' at {}: {}",
                                        fragment, path.empty() ? "/" : path,
                                        message)),
      path_(path) {}

UnresolvedReferenceError::UnresolvedReferenceError(
    const std::string &referrer, const std::string &target,
    std::vector<std::string> chain)
    : SchemaError(referrer,
                  fmt::format("Unresolved reference '{}' in fragment '{}' "
                              "(chain: {})",
                              target, referrer, format_chain(chain))),
      target_(target), chain_(std::move(chain)) {}

CyclicReferenceError::CyclicReferenceError(const std::string &fragment,
                                           std::vector<std::string> cycle)
    : SchemaError(fragment, fmt::format("Cyclic reference detected: {}",
                                        format_chain(cycle))),
      cycle_(std::move(cycle)) {}

ConflictingDatatypeError::ConflictingDatatypeError(
    const std::string &field, const std::string &earlier_fragment,
    const std::string &later_fragment, const std::string &attribute,
    const std::string &earlier_value, const std::string &later_value)
    : SchemaError(later_fragment,
                  fmt::format("Conflicting {} for field '{}': '{}' declares "
                              "{}, '{}' declares {}",
                              attribute, field, earlier_fragment,
                              earlier_value, later_fragment, later_value)),
      field_(field), earlier_fragment_(earlier_fragment),
      later_fragment_(later_fragment), attribute_(attribute) {}

ConfigError::ConfigError(const std::string &config_path,
                         const std::string &message)
    : SchemaError("", fmt::format("Invalid configuration '{}': {}",
                                  config_path, message)) {}

} // namespace dmschema
