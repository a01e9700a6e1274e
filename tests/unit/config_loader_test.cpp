#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using ingest::config::ConfigLoader;
using ingest::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ingest_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
  include_trace_context: true
database:
  sqlite:
    path: /var/lib/ingest/ingest.db
    wal_mode: true
policy:
  max_file_size_bytes: 52428800
  allowed_mime_types: ["image/*", "application/pdf"]
  strict_content_type: true
resumable:
  temp_directory: /var/tmp/uploads
  session_ttl_seconds: 7200
queue:
  accept_workers: 4
  persist_jobs: true
providers:
  media:
    enabled: true
    cloud_name: demo
    api_key: "123456789012345"
    api_secret: s3cr3t
  object_store:
    root_uri: s3://media-bucket/prod
    access_key_id: AKIDEXAMPLE
    secret_access_key: secret
    sse_customer_key: "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"
  backup:
    enabled: true
virus_scan:
  enabled: true
  socket_path: /run/clamav/clamd.ctl
observability:
  tracing_enabled: true
  otlp_endpoint: http://collector:4318
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "/var/lib/ingest/ingest.db");
  assert(config.policy().max_file_size_bytes() == 52428800);
  assert(config.policy().allowed_mime_types_size() == 2);
  assert(config.policy().strict_content_type());
  assert(config.resumable().temp_directory() == "/var/tmp/uploads");
  assert(config.resumable().session_ttl_seconds() == 7200);
  assert(config.resumable().sweep_interval_seconds() == 3600);
  assert(config.queue().accept_workers() == 4);
  assert(config.queue().processing_workers() == 2);
  assert(config.queue().persist_jobs());

  // Quoted digits stay strings.
  assert(config.providers().media().api_key() == "123456789012345");
  assert(config.providers().media().folder() == "uploads");
  assert(config.providers().object_store().root_uri() == "s3://media-bucket/prod");
  assert(config.providers().object_store().region() == "us-east-1");
  assert(config.providers().backup().enabled());
  assert(config.providers().backup().folder() == "backups");

  assert(config.virus_scan().enabled());
  assert(config.virus_scan().socket_path() == "/run/clamav/clamd.ctl");
  assert(config.observability().transport() == ingest::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().service_name() == "ingest-manager");
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromString("");

  assert(config.logging().level() == "info");
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
  assert(config.policy().max_file_size_bytes() == 100ULL * 1024 * 1024);
  assert(config.policy().allowed_mime_types_size() == 3);
  assert(config.policy().allowed_mime_types(0) == "image/*");
  assert(!config.policy().strict_content_type());
  assert(config.resumable().temp_directory() == "/tmp/ingest-uploads");
  assert(config.resumable().session_ttl_seconds() == 86400);
  assert(config.queue().max_attempts() == 3);
  assert(config.queue().backoff_initial_ms() == 2000);
  assert(!config.queue().persist_jobs());
  assert(config.providers().request_timeout_ms() == 30000);
  assert(config.providers().signed_url_ttl_seconds() == 3600);
  assert(!config.providers().media().enabled());
  assert(config.providers().object_store().root_uri() == "/tmp/ingest-objects");
  assert(!config.providers().backup().enabled());
  assert(config.virus_scan().port() == 3310);
  assert(config.virus_scan().timeout_ms() == 60000);
  assert(config.observability().metrics_interval_ms() == 10000);
}

void TestBucketSuppressesLocalRoot() {
  auto config = ConfigLoader::LoadFromString(R"(providers:
  object_store:
    bucket: media-bucket
    endpoint_override: minio:9000
    scheme: http
)");
  assert(config.providers().object_store().root_uri().empty());
  assert(config.providers().object_store().scheme() == "http");
}

void TestPostgresBackend() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "postgresql://ingest:pw@db:5432/ingest"
    max_connections: 8
)");
  assert(config.database().backend_case() == DatabaseConfig::kPostgres);
  assert(config.database().postgres().connection_uri() == "postgresql://ingest:pw@db:5432/ingest");
  assert(config.database().postgres().max_connections() == 8);
}

void TestScalarEscaping() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\ingest\\\"quoted\"\\db.sqlite"
resumable:
  temp_directory: "line1\nline2☃"
)");
  assert(config.database().sqlite().path() == "C:\\ingest\\\"quoted\"\\db.sqlite");
  assert(config.resumable().temp_directory() == "line1\nline2☃");
}

void TestInvalidDocumentsAreRejected() {
  assert(Rejects("unknown_section:\n  value: 1\n"));
  assert(Rejects("queue:\n  acept_workers: 3\n"));
  assert(Rejects("- just\n- a list\n"));
  assert(Rejects("queue: [unterminated\n"));
  // Unquoted digits are numbers, which a string field refuses.
  assert(Rejects("providers:\n  media:\n    api_key: 12345\n"));

  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/ingest-config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentUsesDefaults();
  TestBucketSuppressesLocalRoot();
  TestPostgresBackend();
  TestScalarEscaping();
  TestInvalidDocumentsAreRejected();

  std::cout << "ingest_manager_unit_config_loader: pass\n";
  return 0;
}
