#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ingest::security {

struct ScanResult {
  bool                     infected = false;
  std::vector<std::string> viruses;
};

/*
  Content scanner consulted before a file is accepted.

  Scan throws when the scanner itself cannot produce a verdict; the
  caller decides whether that blocks the upload.
*/
class VirusScanner {
 public:
  virtual ~VirusScanner() = default;

  virtual ScanResult Scan(std::string_view data, const std::string& name) = 0;
};

using VirusScannerPtr = std::shared_ptr<VirusScanner>;

struct ClamdOptions {
  std::string               socket_path; // unix socket; host/port are used when empty
  std::string               host = "localhost";
  uint16_t                  port = 3310;
  std::chrono::milliseconds timeout{60000};
};

/*
  clamd client speaking zINSTREAM:

      "zINSTREAM\0"
      { <u32 big-endian length> <bytes> }*
      <u32 0>

  Reply: "stream: OK" or "stream: <signature> FOUND".
*/
class ClamdScanner final : public VirusScanner {
 public:
  explicit ClamdScanner(ClamdOptions options);

  ScanResult Scan(std::string_view data, const std::string& name) override;

 private:
  ClamdOptions options_;
};

// Throws std::runtime_error on an ERROR reply or anything unrecognised.
ScanResult ParseClamdReply(std::string_view reply);

} // namespace ingest::security
