#include <arrow/io/file.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using namespace ingest;

static void Usage() {
  std::cout << "Usage: ingestctl --config <config.yaml> <command> [args] [key=value ...]\n"
            << "  submit   <owner> <path> <mime_type> [privacy=..] [category=..] [variants=a,b]\n"
            << "  upload   <owner> <path> <mime_type> <chunk_size> [privacy=..] [category=..] [variants=a,b]\n"
            << "  status   <owner> <file_id>\n"
            << "  session  <owner> <session_id>\n"
            << "  list     <owner> [status=..] [type=..] [category=..] [limit=50] [offset=0]\n"
            << "  delete   <owner> <file_id>\n"
            << "  url      <owner> <file_id> [ttl=<seconds>]\n"
            << "  variants <owner> <file_id> [kinds=a,b]\n"
            << "  stats\n"
            << "  failed   <queue>\n"
            << "  retry    <queue> <job_id>\n"
            << "  sweep\n"
            << "  health\n";
}

namespace {

struct Command {
  std::string                        name;
  std::vector<std::string>           args;
  std::map<std::string, std::string> options;

  const std::string& Arg(std::size_t i) const {
    if (i >= args.size()) throw util::InvalidArgument("missing argument " + std::to_string(i + 1) + " for " + name);
    return args[i];
  }

  std::optional<std::string> Option(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string::npos) end = value.size();
    if (end > start) out.push_back(value.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

std::vector<model::VariantKind> ParseVariants(const std::optional<std::string>& value) {
  std::vector<model::VariantKind> kinds;
  if (!value) return kinds;
  for (const auto& name : SplitList(*value)) {
    auto kind = model::ParseVariantKind(name);
    if (!kind) throw util::InvalidArgument("unknown variant: " + name);
    kinds.push_back(*kind);
  }
  return kinds;
}

template <typename T, typename Parser>
T ParseOr(const std::optional<std::string>& value, T fallback, Parser parse, const char* what) {
  if (!value) return fallback;
  auto parsed = parse(*value);
  if (!parsed) throw util::InvalidArgument(std::string("unknown ") + what + ": " + *value);
  return *parsed;
}

std::shared_ptr<arrow::Buffer> ReadLocalFile(const std::string& path) {
  auto file   = storage::common::Unwrap(arrow::io::ReadableFile::Open(path));
  auto buffer = storage::common::ReadAll(file);
  storage::common::Unwrap(file->Close());
  return buffer;
}

void PrintFile(const db::model::FileRecord& file) {
  std::cout << "id=" << file.id << "\n"
            << "name=" << file.original_name << "\n"
            << "stored_as=" << file.generated_filename << "\n"
            << "mime_type=" << file.mime_type << "\n"
            << "type=" << model::ToString(file.type_category) << "\n"
            << "size=" << file.size_bytes << "\n"
            << "sha256=" << file.content_hash << "\n"
            << "status=" << model::ToString(file.status) << "\n"
            << "privacy=" << model::ToString(file.privacy) << "\n"
            << "category=" << model::ToString(file.category) << "\n"
            << "provider=" << model::ToString(file.primary_provider) << "\n";
  if (!file.primary_url.empty()) std::cout << "url=" << file.primary_url << "\n";
  if (!file.backup_object_id.empty()) std::cout << "backup=" << file.backup_object_id << "\n";
  if (auto error = file.metadata.find("error"); error != file.metadata.end()) std::cout << "error=" << error->second << "\n";
}

void PrintSession(const db::model::SessionRecord& session) {
  std::cout << "session_id=" << session.id << "\n"
            << "status=" << model::ToString(session.status) << "\n"
            << "chunks=" << session.uploaded_chunks.size() << "/" << session.total_chunks << "\n"
            << "uploaded=" << session.uploaded_size << "/" << session.total_size << "\n"
            << "progress=" << session.ProgressPercent() << "%\n"
            << "expires_at=" << util::ToIso8601(util::FromUnixMillis(session.expires_at_ms)) << "\n";
}

void PrintJobs(const std::vector<db::model::JobRecord>& jobs) {
  for (const auto& job : jobs) {
    std::cout << job.id << " kind=" << job.kind << " attempts=" << job.attempts_made << "/" << job.max_attempts
              << " code=" << (job.error_code.empty() ? "-" : job.error_code) << " error=\"" << job.last_error << "\"\n";
  }
}

void PrintQueues(const std::vector<service::QueueStats>& stats) {
  for (const auto& entry : stats) {
    std::cout << entry.queue << " waiting=" << entry.counts.waiting << " delayed=" << entry.counts.delayed << " active=" << entry.counts.active
              << " completed=" << entry.counts.completed << " failed=" << entry.counts.failed << "\n";
  }
}

service::CompleteOptions CompleteOptionsFrom(const Command& cmd) {
  service::CompleteOptions options;
  options.privacy  = ParseOr(cmd.Option("privacy"), model::Privacy::kPrivate, model::ParsePrivacy, "privacy");
  options.category = ParseOr(cmd.Option("category"), model::FileCategory::kContent, model::ParseFileCategory, "category");
  options.variants = ParseVariants(cmd.Option("variants"));
  return options;
}

int Run(factory::Application& app, const Command& cmd) {
  if (cmd.name == "submit") {
    auto options = CompleteOptionsFrom(cmd);

    core::SubmitRequest request;
    request.owner_id      = cmd.Arg(0);
    request.data          = ReadLocalFile(cmd.Arg(1));
    request.original_name = std::filesystem::path(cmd.Arg(1)).filename().string();
    request.mime_type     = cmd.Arg(2);
    request.privacy       = options.privacy;
    request.category      = options.category;
    request.variants      = options.variants;

    auto file = app.upload_service->Submit(request);
    app.DrainQueues();
    PrintFile(app.upload_service->GetFileStatus(file.id, request.owner_id));
    return 0;
  }

  if (cmd.name == "upload") {
    const auto& owner      = cmd.Arg(0);
    auto        data       = ReadLocalFile(cmd.Arg(1));
    const auto  chunk_size = std::stoll(cmd.Arg(3));

    upload::InitUploadRequest init;
    init.owner_id   = owner;
    init.filename   = std::filesystem::path(cmd.Arg(1)).filename().string();
    init.mime_type  = cmd.Arg(2);
    init.total_size = data->size();
    init.chunk_size = chunk_size;

    auto session = app.upload_service->InitUpload(init);
    std::cout << "session_id=" << session.id << " chunks=" << session.total_chunks << "\n";

    std::string_view bytes(reinterpret_cast<const char*>(data->data()), static_cast<std::size_t>(data->size()));
    for (uint64_t index = 0; index < session.total_chunks; ++index) {
      const auto offset = index * session.chunk_size;
      const auto length = std::min<uint64_t>(session.chunk_size, bytes.size() - offset);
      session           = app.upload_service->UploadChunk(session.id, static_cast<int64_t>(index), bytes.substr(offset, length), owner);
    }

    auto file = app.upload_service->CompleteUpload(session.id, owner, CompleteOptionsFrom(cmd));
    app.DrainQueues();
    PrintFile(app.upload_service->GetFileStatus(file.id, owner));
    return 0;
  }

  if (cmd.name == "status") {
    PrintFile(app.upload_service->GetFileStatus(cmd.Arg(1), cmd.Arg(0)));
    return 0;
  }

  if (cmd.name == "session") {
    auto session = app.upload_service->GetSession(cmd.Arg(1), cmd.Arg(0));
    PrintSession(session);
    std::cout << "missing=";
    for (auto index : app.upload_service->GetMissingChunks(cmd.Arg(1), cmd.Arg(0))) std::cout << index << " ";
    std::cout << "\n";
    return 0;
  }

  if (cmd.name == "list") {
    db::FileFilter filter;
    filter.owner_id = cmd.Arg(0);
    if (auto status = cmd.Option("status")) filter.status = ParseOr(status, model::FileStatus::kReady, model::ParseFileStatus, "status");
    if (auto type = cmd.Option("type")) filter.type_category = ParseOr(type, model::TypeCategory::kOther, model::ParseTypeCategory, "type");
    if (auto category = cmd.Option("category")) {
      filter.category = ParseOr(category, model::FileCategory::kContent, model::ParseFileCategory, "category");
    }

    db::Page page;
    if (auto limit = cmd.Option("limit")) page.limit = static_cast<uint32_t>(std::stoul(*limit));
    if (auto offset = cmd.Option("offset")) page.offset = static_cast<uint32_t>(std::stoul(*offset));

    for (const auto& file : app.file_service->ListFiles(filter, page)) {
      std::cout << file.id << " " << model::ToString(file.status) << " " << file.size_bytes << " " << file.original_name << "\n";
    }
    return 0;
  }

  if (cmd.name == "delete") {
    app.file_service->DeleteFile(cmd.Arg(1), cmd.Arg(0));
    app.DrainQueues();
    std::cout << "deleted\n";
    return 0;
  }

  if (cmd.name == "url") {
    std::optional<std::chrono::seconds> ttl;
    if (auto value = cmd.Option("ttl")) ttl = std::chrono::seconds(std::stoll(*value));
    std::cout << app.file_service->DownloadUrl(cmd.Arg(1), cmd.Arg(0), ttl) << "\n";
    return 0;
  }

  if (cmd.name == "variants") {
    auto kinds = ParseVariants(cmd.Option("kinds"));
    if (!kinds.empty()) {
      app.file_service->RequestVariants(cmd.Arg(1), cmd.Arg(0), kinds);
      app.DrainQueues();
    }
    for (const auto& variant : app.file_service->ListVariants(cmd.Arg(1), cmd.Arg(0))) {
      std::cout << model::ToString(variant.kind) << " " << variant.url << "\n";
    }
    return 0;
  }

  if (cmd.name == "stats") {
    PrintQueues(app.admin_service->Stats());
    return 0;
  }

  if (cmd.name == "failed") {
    PrintJobs(app.admin_service->FailedJobs(cmd.Arg(0)));
    return 0;
  }

  if (cmd.name == "retry") {
    app.admin_service->RetryJob(cmd.Arg(0), cmd.Arg(1));
    app.DrainQueues();
    std::cout << "retried\n";
    return 0;
  }

  if (cmd.name == "sweep") {
    auto stats = app.admin_service->SweepSessions();
    std::cout << "expired=" << stats.expired << " purged=" << stats.purged << "\n";
    return 0;
  }

  if (cmd.name == "health") {
    auto report = app.admin_service->Health();
    std::cout << "repository=" << (report.repository_ok ? "ok" : report.repository_error) << "\n"
              << "media=" << (report.media_configured ? "configured" : "disabled") << "\n"
              << "backup=" << (report.backup_enabled ? "enabled" : "disabled") << "\n";
    PrintQueues(report.queues);
    return report.Healthy() ? 0 : 3;
  }

  Usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  Command cmd;
  cmd.name = argv[3];
  for (int i = 4; i < argc; ++i) {
    std::string arg = argv[i];
    auto        eq  = arg.find('=');
    if (eq != std::string::npos && eq > 0) {
      cmd.options[arg.substr(0, eq)] = arg.substr(eq + 1);
    } else {
      cmd.args.push_back(std::move(arg));
    }
  }

  try {
    auto runtime_config = config::ConfigLoader::LoadFromYaml(argv[2]);
    observability::InitializeLogging(runtime_config);

    auto app  = factory::Build(runtime_config);
    int  code = Run(app, cmd);
    observability::ShutdownLogging();
    return code;
  } catch (const util::Error& e) {
    std::cerr << util::ErrorCodeName(e.code()) << ": " << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  }
}
