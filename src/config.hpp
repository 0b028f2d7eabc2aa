#pragma once

#include <string>

namespace toolseek {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

struct RelayConfig {
  HttpListenConfig listen;
  HttpEndpoint upstream;
  std::string upstream_model = "deepseek-reasoner";
  std::string upstream_api_key;
  int upstream_read_timeout_s = 300;
  bool code_execution_enabled = true;
  std::string python_executable = "python3";
  int max_sub_requests = 16;
  int max_output_chars = 4000;
  std::string api_prefix_mode = "auto";
};

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::string EndpointOrigin(const HttpEndpoint& ep);
std::string JoinPath(const std::string& base, const std::string& path);

// Loads KEY=VALUE lines into the process environment. Variables that are
// already set are left alone. Returns false when the file cannot be opened.
bool LoadDotEnv(const std::string& path);

RelayConfig LoadConfigFromEnv();

}  // namespace toolseek
