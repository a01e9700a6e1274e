#pragma once

#include <optional>
#include <string_view>

#include "file.hpp"
#include "provider_kind.hpp"
#include "upload_session.hpp"
#include "variant.hpp"

namespace ingest::model {

std::string_view ToString(TypeCategory value);
std::string_view ToString(FileStatus value);
std::string_view ToString(Privacy value);
std::string_view ToString(FileCategory value);
std::string_view ToString(SessionStatus value);
std::string_view ToString(VariantKind value);
std::string_view ToString(ProviderKind value);

std::optional<Privacy>      ParsePrivacy(std::string_view value);
std::optional<FileCategory> ParseFileCategory(std::string_view value);
std::optional<VariantKind>  ParseVariantKind(std::string_view value);
std::optional<FileStatus>   ParseFileStatus(std::string_view value);
std::optional<TypeCategory> ParseTypeCategory(std::string_view value);

} // namespace ingest::model
