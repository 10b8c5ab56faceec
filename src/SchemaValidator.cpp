#include "datamodel-schema/SchemaValidator.hpp"
#include "datamodel-schema/Conversions.hpp"
#include "datamodel-schema/Logger.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <memory>

namespace dmschema {

std::string issue_kind_name(IssueKind kind) {
  switch (kind) {
  case IssueKind::RankMismatch:
    return "RankMismatch";
  case IssueKind::DatatypeMismatch:
    return "DatatypeMismatch";
  case IssueKind::MissingRequiredField:
    return "MissingRequiredField";
  case IssueKind::NotAnObject:
    return "NotAnObject";
  }
  return "Unknown";
}

std::vector<ValidationIssue>
ValidationReport::issues_for(const std::string &field) const {
  std::vector<ValidationIssue> out;
  for (const auto &issue : issues) {
    if (issue.field == field)
      out.push_back(issue);
  }
  return out;
}

size_t ValidationReport::count(IssueKind kind) const {
  return static_cast<size_t>(std::count_if(
      issues.begin(), issues.end(),
      [kind](const ValidationIssue &issue) { return issue.kind == kind; }));
}

nlohmann::json ValidationReport::to_json() const {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &issue : issues) {
    nlohmann::json entry;
    entry["field"] = issue.field;
    entry["kind"] = issue_kind_name(issue.kind);
    entry["detail"] = issue.detail;
    entry["expected"] = issue.expected;
    entry["actual"] = issue.actual;
    arr.push_back(entry);
  }
  nlohmann::json j;
  j["valid"] = issues.empty();
  j["issues"] = arr;
  return j;
}

namespace {

template <typename T> bool fits(int64_t v) {
  if (std::numeric_limits<T>::is_signed) {
    return v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
           v <= static_cast<int64_t>(std::numeric_limits<T>::max());
  }
  return v >= 0 &&
         static_cast<uint64_t>(v) <=
             static_cast<uint64_t>(std::numeric_limits<T>::max());
}

template <typename T> bool fits(uint64_t v) {
  return v <= static_cast<uint64_t>(std::numeric_limits<T>::max());
}

// Whether an integer scalar can be stored in an element of `type`
template <typename Int> bool integer_fits(Datatype type, Int v) {
  switch (type) {
  case Datatype::Int8:
    return fits<int8_t>(v);
  case Datatype::Int16:
    return fits<int16_t>(v);
  case Datatype::Int32:
    return fits<int32_t>(v);
  case Datatype::Int64:
    return fits<int64_t>(v);
  case Datatype::UInt8:
    return fits<uint8_t>(v);
  case Datatype::UInt16:
    return fits<uint16_t>(v);
  case Datatype::UInt32:
    return fits<uint32_t>(v);
  case Datatype::UInt64:
    return fits<uint64_t>(v);
  case Datatype::Bool8:
    return false;
  default:
    return true; // floating and complex
  }
}

bool scalar_fits(Datatype type, const DataValue &value) {
  auto category = datatype_category(type);
  if (std::holds_alternative<bool>(value)) {
    return category == DatatypeCategory::Boolean;
  }
  if (const auto *i = std::get_if<int64_t>(&value)) {
    return integer_fits(type, *i);
  }
  if (const auto *u = std::get_if<uint64_t>(&value)) {
    return integer_fits(type, *u);
  }
  if (std::holds_alternative<double>(value)) {
    return category == DatatypeCategory::Floating ||
           category == DatatypeCategory::Complex;
  }
  return false;
}

class ObjectValidator {
public:
  ObjectValidator(ValidatedDataObject &validated, ValidationReport &report)
      : validated_(validated), report_(report) {}

  /// Validate `input` against one field-set level and return the output
  /// object for that level. With `check_required` false (absent parent
  /// objects) only defaults are synthesized.
  DataObject validate_level(const std::map<std::string, FieldSpec> &specs,
                            const std::vector<std::string> &required,
                            const DataObject &input, const std::string &parent,
                            bool check_required) {
    DataObject out = input;

    for (const auto &[name, spec] : specs) {
      std::string path = parent.empty() ? name : parent + "." + name;
      const DataValue *value = input.get(name);

      if (value && std::holds_alternative<std::monostate>(*value)) {
        out.erase(name);
        value = nullptr;
      }

      if (value) {
        check_present(spec, *value, path, out, name);
      } else {
        fill_absent(spec, path, out, name);
      }
    }

    if (check_required) {
      for (const auto &name : required) {
        if (!out.contains(name)) {
          std::string path = parent.empty() ? name : parent + "." + name;
          add_issue(path, IssueKind::MissingRequiredField,
                    "Missing required field '" + path + "'", "present",
                    "absent");
        }
      }
    }
    return out;
  }

private:
  void add_issue(const std::string &path, IssueKind kind,
                 const std::string &detail, const std::string &expected,
                 const std::string &actual) {
    report_.issues.push_back({path, kind, detail, expected, actual});
  }

  void check_present(const FieldSpec &spec, const DataValue &value,
                     const std::string &path, DataObject &out,
                     const std::string &name) {
    if (spec.is_object()) {
      const auto *nested = std::get_if<DataObjectPtr>(&value);
      if (!nested || !*nested) {
        add_issue(path, IssueKind::NotAnObject,
                  "Field '" + path + "' must be an object", "object",
                  describe_value(value));
        return;
      }
      auto child = validate_level(spec.properties, spec.required, **nested,
                                  path, true);
      out.set(name, DataObjectPtr(std::make_shared<DataObject>(
                        std::move(child))));
      return;
    }

    check_rank(spec, value, path);
    check_datatype(spec, value, path);
  }

  void check_rank(const FieldSpec &spec, const DataValue &value,
                  const std::string &path) {
    size_t actual = value_rank(value);
    if (spec.rank && actual != static_cast<size_t>(*spec.rank)) {
      add_issue(path, IssueKind::RankMismatch,
                fmt::format("Field '{}' must have {} dimensions, got {}", path,
                            *spec.rank, actual),
                std::to_string(*spec.rank), std::to_string(actual));
    } else if (spec.max_rank && actual > static_cast<size_t>(*spec.max_rank)) {
      add_issue(path, IssueKind::RankMismatch,
                fmt::format("Field '{}' may have at most {} dimensions, got {}",
                            path, *spec.max_rank, actual),
                "<= " + std::to_string(*spec.max_rank), std::to_string(actual));
    }
  }

  void check_datatype(const FieldSpec &spec, const DataValue &value,
                      const std::string &path) {
    if (!spec.datatype)
      return;

    std::string expected = datatype_name(*spec.datatype);
    bool ok = false;
    std::string actual;
    if (const auto *array = std::get_if<ArrayValue>(&value)) {
      ok = array->datatype == *spec.datatype;
      actual = datatype_name(array->datatype);
    } else {
      ok = scalar_fits(*spec.datatype, value);
      actual = describe_value(value);
    }

    if (!ok) {
      add_issue(path, IssueKind::DatatypeMismatch,
                fmt::format("Field '{}' must hold {} elements, got {}", path,
                            expected, actual),
                expected, actual);
    }
  }

  void fill_absent(const FieldSpec &spec, const std::string &path,
                   DataObject &out, const std::string &name) {
    if (spec.default_value) {
      out.set(name, json_to_data_value(*spec.default_value));
      validated_.synthesized.insert(path);
      return;
    }

    if (spec.is_object()) {
      // Materialize an absent object only when something inside it has a
      // default to fill in
      size_t before = validated_.synthesized.size();
      auto child = validate_level(spec.properties, spec.required,
                                  DataObject{}, path, false);
      if (validated_.synthesized.size() > before) {
        out.set(name, DataObjectPtr(std::make_shared<DataObject>(
                          std::move(child))));
        validated_.synthesized.insert(path);
      }
    }
  }

  ValidatedDataObject &validated_;
  ValidationReport &report_;
};

} // namespace

ValidationOutcome SchemaValidator::validate(const EffectiveSchema &schema,
                                            const DataObject &object) {
  ValidationOutcome outcome;
  ObjectValidator validator(outcome.validated, outcome.report);

  outcome.validated.object = validator.validate_level(
      schema.fields, schema.required, object, "", true);

  LOG_DEBUG("VALIDATOR", "VALIDATE",
            "Model '{}': {} fields supplied, {} issues, {} defaults synthesized",
            schema.model, object.size(), outcome.report.size(),
            outcome.validated.synthesized.size());
  return outcome;
}

} // namespace dmschema
