#include "sse.hpp"

#include <httplib.h>

#include <cstring>
#include <string>
#include <utility>

namespace toolseek {
namespace {

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

}  // namespace

std::string SseData(const nlohmann::json& j) {
  return std::string("data: ") + j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
}

std::string SseDone() {
  return std::string("data: ") + kSseDoneSentinel + "\n\n";
}

bool SseDecoder::Feed(const std::string& bytes, const DataCallback& on_data) {
  if (done_ || stopped_) return false;
  line_buf_ += bytes;
  size_t start = 0;
  while (true) {
    auto nl = line_buf_.find('\n', start);
    if (nl == std::string::npos) break;
    std::string line = line_buf_.substr(start, nl - start);
    start = nl + 1;
    if (!HandleLine(std::move(line), on_data)) {
      line_buf_.clear();
      return false;
    }
  }
  line_buf_.erase(0, start);
  return true;
}

bool SseDecoder::Finish(const DataCallback& on_data) {
  if (done_ || stopped_) return false;
  if (!line_buf_.empty()) {
    std::string line = std::move(line_buf_);
    line_buf_.clear();
    if (!HandleLine(std::move(line), on_data)) return false;
  }
  return Dispatch(on_data);
}

bool SseDecoder::HandleLine(std::string line, const DataCallback& on_data) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (line.empty()) return Dispatch(on_data);
  if (line.front() == ':') return true;
  if (line.compare(0, 5, "data:") != 0) return true;
  std::string value = line.substr(5);
  if (!value.empty() && value.front() == ' ') value.erase(value.begin());
  if (has_data_) data_ += '\n';
  data_ += value;
  has_data_ = true;
  return true;
}

bool SseDecoder::Dispatch(const DataCallback& on_data) {
  if (!has_data_) return true;
  std::string payload = std::move(data_);
  data_.clear();
  has_data_ = false;

  size_t b = 0;
  size_t e = payload.size();
  while (b < e && (payload[b] == ' ' || payload[b] == '\t')) b++;
  while (e > b && (payload[e - 1] == ' ' || payload[e - 1] == '\t')) e--;
  if (payload.compare(b, e - b, kSseDoneSentinel) == 0) {
    done_ = true;
    return false;
  }
  if (!on_data(payload)) {
    stopped_ = true;
    return false;
  }
  return true;
}

bool StreamSsePost(const SsePostRequest& req,
                   const SseDecoder::DataCallback& on_data,
                   bool* canceled,
                   std::string* err) {
  if (canceled) *canceled = false;

  httplib::Client cli(EndpointOrigin(req.endpoint));
  cli.set_connection_timeout(req.connect_timeout_s);
  cli.set_read_timeout(req.read_timeout_s);
  cli.set_write_timeout(30);

  httplib::Request hreq;
  hreq.method = "POST";
  hreq.path = JoinPath(req.endpoint.base_path, req.path);
  for (const auto& kv : req.headers) hreq.headers.emplace(kv.first, kv.second);
  hreq.headers.emplace("Accept", "text/event-stream");
  hreq.headers.emplace("Content-Type", "application/json");
  hreq.body = req.body;

  int status = 0;
  std::string error_body;
  bool stopped_by_caller = false;
  SseDecoder decoder;
  auto forward = [&](const std::string& payload) -> bool {
    if (!on_data(payload)) {
      stopped_by_caller = true;
      return false;
    }
    return true;
  };

  hreq.response_handler = [&](const httplib::Response& r) {
    status = r.status;
    return true;
  };
  hreq.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (status < 200 || status >= 300) {
      if (error_body.size() < 4096) error_body.append(data, len);
      return true;
    }
    return decoder.Feed(std::string(data, len), forward);
  };

  auto res = cli.send(hreq);

  if (stopped_by_caller) {
    if (canceled) *canceled = true;
    return true;
  }
  if (decoder.Done()) return true;
  if (!res) {
    if (err) *err = "upstream: " + httplib::to_string(res.error());
    return false;
  }
  if (status < 200 || status >= 300) {
    if (err) *err = "upstream http " + std::to_string(status) + ": " + TruncateForLog(error_body, 512);
    return false;
  }
  decoder.Finish(forward);
  if (stopped_by_caller && canceled) *canceled = true;
  return true;
}

}  // namespace toolseek
