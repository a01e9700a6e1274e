#pragma once

#include <google/protobuf/struct.pb.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ingest::util {

/*
  JSON helpers on top of google::protobuf::Struct.

  Used to persist string maps in TEXT/JSONB columns and to read
  provider API responses.
*/

std::string                        EncodeStringMap(const std::map<std::string, std::string>& values);
std::map<std::string, std::string> DecodeStringMap(std::string_view json);

google::protobuf::Struct ParseJsonObject(std::string_view json);

std::optional<std::string> GetString(const google::protobuf::Struct& object, const std::string& key);
std::optional<double>      GetNumber(const google::protobuf::Struct& object, const std::string& key);

} // namespace ingest::util
