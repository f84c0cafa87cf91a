#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace evx::core {

/// Fully resolved configuration of one invocation. Captured once from the
/// environment and the command line, then passed down by value; nothing
/// re-reads the environment mid-flow.
struct ExportConfig {
  static constexpr const char *kDefaultApiHost = "api.sekoia.io";

  std::string api_host = kDefaultApiHost;
  std::string api_key;

  std::chrono::milliseconds poll_interval{2000};
  std::optional<std::chrono::milliseconds> max_wait;
  int max_status_retries = 3;

  // SSE-C
  std::optional<std::string> s3_sse_c_key; // base64
  std::optional<std::string> s3_sse_c_key_md5;
  std::string s3_sse_c_algorithm = "AES256";
  bool no_sse_c = false;

  // Custom S3 destination
  std::string s3_bucket;
  std::string s3_prefix;
  std::string s3_access_key_id;
  std::string s3_secret_access_key;
  std::string s3_endpoint_url;
  std::string s3_region_name;

  std::vector<std::string> export_fields;
  std::optional<std::string> output_path;
  bool no_download = false;

  // HTTP (connect, read): (5 s, 30 s) for API calls,
  // 60 s read timeout for the download stream.
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds api_read_timeout{30000};
  std::chrono::milliseconds download_read_timeout{60000};

  bool verbose = false;
};

} // namespace evx::core
