#pragma once

#include "chat_message.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolseek {

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
  std::optional<int> max_tokens;
  std::optional<float> temperature;
  std::optional<float> top_p;
  // Remaining client parameters (stop, penalties, response_format, ...),
  // passed upstream as is. The fields above take precedence.
  nlohmann::json extra = nlohmann::json::object();
};

struct ChatResponse {
  std::string model;
  std::string reasoning;
  std::string content;
  std::string finish_reason = "stop";
  nlohmann::json usage;
};

class IUpstreamClient {
 public:
  virtual ~IUpstreamClient() = default;

  virtual std::string Name() const = 0;

  virtual std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) = 0;

  // Streams one completion. Returning false from on_delta abandons the
  // request; that is a normal outcome and ChatStream still returns true.
  // on_done only runs when the upstream finished the stream by itself.
  virtual bool ChatStream(const ChatRequest& req,
                          const std::function<bool(const Delta&)>& on_delta,
                          const std::function<void(const std::string& finish_reason)>& on_done,
                          std::string* err) = 0;
};

}  // namespace toolseek
