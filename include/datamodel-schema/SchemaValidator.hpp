#pragma once

#include "datamodel-schema/DataObject.hpp"
#include "datamodel-schema/export.h"
#include "datamodel-schema/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dmschema {

enum class IssueKind {
  RankMismatch,
  DatatypeMismatch,
  MissingRequiredField,
  NotAnObject,
};

DATAMODEL_SCHEMA_API std::string issue_kind_name(IssueKind kind);

struct ValidationIssue {
  std::string field; // dotted path
  IssueKind kind;
  std::string detail;
  std::string expected;
  std::string actual;
};

/// Every defect found in one pass. Empty means the object conforms; callers
/// decide how severe a non-empty report is.
struct DATAMODEL_SCHEMA_API ValidationReport {
  std::vector<ValidationIssue> issues;

  bool empty() const { return issues.empty(); }
  size_t size() const { return issues.size(); }

  std::vector<ValidationIssue> issues_for(const std::string &field) const;
  size_t count(IssueKind kind) const;

  nlohmann::json to_json() const;
};

struct ValidationOutcome {
  ValidatedDataObject validated;
  ValidationReport report;
};

class DATAMODEL_SCHEMA_API SchemaValidator {
public:
  /// Check `object` against `schema` without modifying it.
  ///
  /// Present fields are checked for rank and datatype; every mismatch is
  /// reported and checking continues. Absent fields with a declared default
  /// are filled in the returned object and marked synthesized; absent fields
  /// listed in `required` are reported. Fields unknown to the schema pass
  /// through untouched. A null value counts as absent.
  static ValidationOutcome validate(const EffectiveSchema &schema,
                                    const DataObject &object);
};

} // namespace dmschema
