#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace toolseek {

class OpenAiCompatibleHttpProvider : public IUpstreamClient {
 public:
  OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key);

  void SetReadTimeout(int seconds);

  std::string Name() const override;
  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;
  bool ChatStream(const ChatRequest& req,
                  const std::function<bool(const Delta&)>& on_delta,
                  const std::function<void(const std::string& finish_reason)>& on_done,
                  std::string* err) override;

 private:
  std::string name_;
  HttpEndpoint endpoint_;
  std::string api_key_;
  int read_timeout_s_ = 300;
};

nlohmann::json BuildChatRequestBody(const ChatRequest& req);

struct StreamChunk {
  Delta delta;
  std::optional<std::string> finish_reason;
  std::optional<std::string> error;
};

// Decodes one chat.completion.chunk payload. Returns nullopt for payloads that
// are not JSON objects.
std::optional<StreamChunk> ParseStreamChunk(const std::string& payload);

}  // namespace toolseek
