#include "datamodel-schema/Conversions.hpp"

#include <stdexcept>

namespace dmschema {

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    // Quoted scalars carry the non-specific "!" tag
    if (node.Tag() == "!") {
      return node.as<std::string>();
    }
    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i))
      return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d))
      return d;
    bool b = false;
    if (YAML::convert<bool>::decode(node, b))
      return b;
    return node.Scalar();
  } else if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

DataValue json_to_data_value(const nlohmann::json &j) {
  switch (j.type()) {
  case nlohmann::json::value_t::null:
    return std::monostate{};
  case nlohmann::json::value_t::boolean:
    return j.get<bool>();
  case nlohmann::json::value_t::number_integer:
    return j.get<int64_t>();
  case nlohmann::json::value_t::number_unsigned:
    return j.get<uint64_t>();
  case nlohmann::json::value_t::number_float:
    return j.get<double>();
  case nlohmann::json::value_t::string:
    return j.get<std::string>();
  case nlohmann::json::value_t::object: {
    auto obj = std::make_shared<DataObject>();
    for (const auto &[key, val] : j.items()) {
      obj->set(key, json_to_data_value(val));
    }
    return DataObjectPtr(obj);
  }
  default:
    throw std::invalid_argument("Unsupported value type: " +
                                std::string(j.type_name()));
  }
}

nlohmann::json data_value_to_json(const DataValue &value) {
  struct ToJson {
    nlohmann::json operator()(std::monostate) const { return nullptr; }
    nlohmann::json operator()(bool v) const { return v; }
    nlohmann::json operator()(int64_t v) const { return v; }
    nlohmann::json operator()(uint64_t v) const { return v; }
    nlohmann::json operator()(double v) const { return v; }
    nlohmann::json operator()(const std::string &v) const { return v; }
    nlohmann::json operator()(const ArrayValue &array) const {
      return {{"datatype", datatype_name(array.datatype)},
              {"shape", array.shape}};
    }
    nlohmann::json operator()(const DataObjectPtr &obj) const {
      if (!obj)
        return nullptr;
      return data_object_to_json(*obj);
    }
  };
  return std::visit(ToJson{}, value);
}

nlohmann::json data_object_to_json(const DataObject &obj) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[name, value] : obj.fields()) {
    j[name] = data_value_to_json(value);
  }
  return j;
}

static ArrayValue array_from_yaml(const YAML::Node &node) {
  if (!node.IsMap() || !node["datatype"] || !node["shape"]) {
    throw std::invalid_argument(
        "!array entries need 'datatype' and 'shape' keys");
  }

  auto datatype = parse_datatype(node["datatype"].as<std::string>());
  if (!datatype) {
    throw std::invalid_argument("Unknown array datatype '" +
                                node["datatype"].as<std::string>() + "'");
  }
  if (!node["shape"].IsSequence()) {
    throw std::invalid_argument("!array shape must be a sequence");
  }

  ArrayValue array;
  array.datatype = *datatype;
  for (const auto &extent : node["shape"]) {
    auto n = extent.as<int64_t>();
    if (n < 0) {
      throw std::invalid_argument("!array extents must be non-negative");
    }
    array.shape.push_back(static_cast<size_t>(n));
  }
  return array;
}

static DataValue data_value_from_yaml(const YAML::Node &node) {
  if (node.Tag() == "!array") {
    return array_from_yaml(node);
  }
  if (node.IsMap()) {
    return DataObjectPtr(
        std::make_shared<DataObject>(data_object_from_yaml(node)));
  }
  return json_to_data_value(yaml_to_json(node));
}

DataObject data_object_from_yaml(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Data document must be a mapping");
  }
  DataObject obj;
  for (const auto &kv : node) {
    obj.set(kv.first.as<std::string>(), data_value_from_yaml(kv.second));
  }
  return obj;
}

} // namespace dmschema
