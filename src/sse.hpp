#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace toolseek {

inline constexpr const char* kSseDoneSentinel = "[DONE]";

std::string SseData(const nlohmann::json& j);
std::string SseDone();

// Incremental decoder for a text/event-stream body. Bytes may be split at any
// point. Each event's data lines are joined with '\n' and handed to the
// callback; blank keep-alives, comments and other fields are skipped. The
// [DONE] sentinel ends the stream and is never handed out as a payload.
class SseDecoder {
 public:
  using DataCallback = std::function<bool(const std::string& data)>;

  // Returns false once the stream is over: sentinel seen or callback refused.
  bool Feed(const std::string& bytes, const DataCallback& on_data);
  // Dispatches a trailing event that was not terminated by a blank line.
  bool Finish(const DataCallback& on_data);

  bool Done() const { return done_; }

 private:
  bool HandleLine(std::string line, const DataCallback& on_data);
  bool Dispatch(const DataCallback& on_data);

  std::string line_buf_;
  std::string data_;
  bool has_data_ = false;
  bool done_ = false;
  bool stopped_ = false;
};

struct SsePostRequest {
  HttpEndpoint endpoint;
  std::string path;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  int connect_timeout_s = 10;
  int read_timeout_s = 300;
};

// POSTs a JSON body and decodes the streamed SSE reply. Returns true when the
// stream ended normally or the callback asked to stop (then *canceled is set).
// Transport failures and non-2xx replies return false with *err filled.
bool StreamSsePost(const SsePostRequest& req,
                   const SseDecoder::DataCallback& on_data,
                   bool* canceled,
                   std::string* err);

}  // namespace toolseek
