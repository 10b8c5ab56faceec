#pragma once
#include "datamodel-schema/export.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace dmschema {

/// Base of every fatal error raised while loading, resolving or composing
/// schema fragments. Validation problems are never thrown; see
/// ValidationReport.
class DATAMODEL_SCHEMA_API SchemaError : public std::runtime_error {
public:
  SchemaError(const std::string &fragment, const std::string &message);

  /// Name of the fragment the error was detected in (may be empty)
  const std::string &fragment() const { return fragment_; }

private:
  std::string fragment_;
};

/// The fragment document itself is structurally invalid
class DATAMODEL_SCHEMA_API MalformedSchemaError : public SchemaError {
public:
  MalformedSchemaError(const std::string &fragment, const std::string &path,
                       const std::string &message);

  /// Location inside the document, e.g. "/allOf/2/properties/data/ndim"
  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/// A $ref names a fragment the registry cannot supply
class DATAMODEL_SCHEMA_API UnresolvedReferenceError : public SchemaError {
public:
  UnresolvedReferenceError(const std::string &referrer,
                           const std::string &target,
                           std::vector<std::string> chain);

  const std::string &target() const { return target_; }
  const std::vector<std::string> &chain() const { return chain_; }

private:
  std::string target_;
  std::vector<std::string> chain_;
};

/// The reference graph reachable from a fragment contains a cycle
class DATAMODEL_SCHEMA_API CyclicReferenceError : public SchemaError {
public:
  CyclicReferenceError(const std::string &fragment,
                       std::vector<std::string> cycle);

  /// Names along the cycle; first and last entries are the same fragment
  const std::vector<std::string> &cycle() const { return cycle_; }

private:
  std::vector<std::string> cycle_;
};

/// Two composition members disagree on the shape or element type of a field
class DATAMODEL_SCHEMA_API ConflictingDatatypeError : public SchemaError {
public:
  ConflictingDatatypeError(const std::string &field,
                           const std::string &earlier_fragment,
                           const std::string &later_fragment,
                           const std::string &attribute,
                           const std::string &earlier_value,
                           const std::string &later_value);

  const std::string &field() const { return field_; }
  const std::string &earlier_fragment() const { return earlier_fragment_; }
  const std::string &later_fragment() const { return later_fragment_; }
  const std::string &attribute() const { return attribute_; }

private:
  std::string field_;
  std::string earlier_fragment_;
  std::string later_fragment_;
  std::string attribute_;
};

/// Engine configuration file is unreadable or holds invalid values
class DATAMODEL_SCHEMA_API ConfigError : public SchemaError {
public:
  ConfigError(const std::string &config_path, const std::string &message);
};

/// Join a reference chain as "a -> b -> c"
DATAMODEL_SCHEMA_API std::string
format_chain(const std::vector<std::string> &chain);

} // namespace dmschema
