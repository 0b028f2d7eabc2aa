#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

namespace toolseek {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string TrimAscii(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) {
    s.erase(s.begin());
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
    s.pop_back();
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParsePositiveInt(const std::string& s, int* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || n <= 0) return false;
  if (n > 1000000000L) n = 1000000000L;
  *out = static_cast<int>(n);
  return true;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = TrimAscii(url);
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
    if (default_port == 80) default_port = 443;
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string EndpointOrigin(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port);
}

std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

bool LoadDotEnv(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    line = TrimAscii(line);
    if (line.empty() || line[0] == '#') continue;
    if (StartsWith(line, "export ")) line = TrimAscii(line.substr(7));
    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    auto key = TrimAscii(line.substr(0, eq));
    auto value = TrimAscii(line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    if (key.empty()) continue;
    ::setenv(key.c_str(), value.c_str(), 0);
  }
  return true;
}

RelayConfig LoadConfigFromEnv() {
  RelayConfig cfg;
  cfg.upstream = ParseHttpEndpoint("https://api.deepseek.com/beta", 443);

  if (auto host = GetEnvStr("TOOLSEEK_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("TOOLSEEK_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  if (auto url = GetEnvStr("TOOLSEEK_UPSTREAM_URL"); !url.empty()) cfg.upstream = ParseHttpEndpoint(url, 80);
  if (auto model = GetEnvStr("TOOLSEEK_UPSTREAM_MODEL"); !model.empty()) cfg.upstream_model = model;
  cfg.upstream_api_key = TrimAscii(GetEnvStr("DEEPSEEK_API_KEY"));
  if (auto t = GetEnvStr("TOOLSEEK_UPSTREAM_READ_TIMEOUT_S"); !t.empty()) {
    int n = 0;
    if (TryParsePositiveInt(t, &n)) cfg.upstream_read_timeout_s = n;
  }

  if (auto exec = GetEnvStr("TOOLSEEK_CODE_EXECUTION"); !exec.empty()) {
    bool b = true;
    if (TryParseBool(exec, &b)) cfg.code_execution_enabled = b;
  }
  if (auto py = GetEnvStr("TOOLSEEK_PYTHON"); !py.empty()) cfg.python_executable = py;
  if (auto n = GetEnvStr("TOOLSEEK_MAX_SUB_REQUESTS"); !n.empty()) {
    int v = 0;
    if (TryParsePositiveInt(n, &v)) cfg.max_sub_requests = v;
  }
  if (auto n = GetEnvStr("TOOLSEEK_MAX_OUTPUT_CHARS"); !n.empty()) {
    int v = 0;
    if (TryParsePositiveInt(n, &v)) cfg.max_output_chars = v;
  }
  if (auto mode = GetEnvStr("TOOLSEEK_API_PREFIX_MODE"); !mode.empty()) cfg.api_prefix_mode = ToLower(mode);

  return cfg;
}

}  // namespace toolseek
