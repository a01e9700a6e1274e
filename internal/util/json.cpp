#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

namespace ingest::util {

std::string EncodeStringMap(const std::map<std::string, std::string>& values) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : values) {
    (*object.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode json map: " + std::string(status.message()));
  }
  return json;
}

std::map<std::string, std::string> DecodeStringMap(std::string_view json) {
  std::map<std::string, std::string> values;
  if (json.empty()) {
    return values;
  }

  for (const auto& [key, value] : ParseJsonObject(json).fields()) {
    switch (value.kind_case()) {
      case google::protobuf::Value::kStringValue:
        values[key] = value.string_value();
        break;
      case google::protobuf::Value::kBoolValue:
        values[key] = value.bool_value() ? "true" : "false";
        break;
      case google::protobuf::Value::kNumberValue: {
        const double number = value.number_value();
        values[key]         = number == std::floor(number) ? std::to_string(static_cast<int64_t>(number)) : std::to_string(number);
        break;
      }
      default:
        break;
    }
  }
  return values;
}

google::protobuf::Struct ParseJsonObject(std::string_view json) {
  google::protobuf::Struct                 object;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &object, options);
  if (!status.ok()) {
    throw std::runtime_error("invalid json object: " + std::string(status.message()));
  }
  return object;
}

std::optional<std::string> GetString(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

std::optional<double> GetNumber(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  return it->second.number_value();
}

} // namespace ingest::util
