#include "openai_compatible_http_provider.hpp"

#include "sse.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace toolseek {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int read_timeout_s) {
  auto cli = std::make_unique<httplib::Client>(EndpointOrigin(ep));
  cli->set_connection_timeout(10);
  cli->set_read_timeout(read_timeout_s);
  cli->set_write_timeout(30);
  return cli;
}

static std::string ExtractErrorMessage(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("error")) return {};
  const auto& e = j["error"];
  if (e.is_string()) return e.get<std::string>();
  if (e.is_object() && e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
  return "upstream error";
}

static std::optional<std::string> OptionalString(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return std::nullopt;
  return obj[key].get<std::string>();
}

}  // namespace

OpenAiCompatibleHttpProvider::OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

void OpenAiCompatibleHttpProvider::SetReadTimeout(int seconds) {
  if (seconds > 0) read_timeout_s_ = seconds;
}

std::string OpenAiCompatibleHttpProvider::Name() const {
  return name_;
}

nlohmann::json BuildChatRequestBody(const ChatRequest& req) {
  nlohmann::json j = req.extra.is_object() ? req.extra : nlohmann::json::object();
  j["model"] = req.model;
  j["stream"] = req.stream;
  if (req.max_tokens.has_value() && req.max_tokens.value() > 0) j["max_tokens"] = req.max_tokens.value();
  if (req.temperature.has_value()) j["temperature"] = req.temperature.value();
  if (req.top_p.has_value()) j["top_p"] = req.top_p.value();
  j["messages"] = MessagesToJson(req.messages);
  return j;
}

std::optional<StreamChunk> ParseStreamChunk(const std::string& payload) {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  StreamChunk out;
  auto err = ExtractErrorMessage(j);
  if (!err.empty()) {
    out.error = err;
    return out;
  }
  if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) return out;
  const auto& choice = j["choices"][0];
  if (!choice.is_object()) return out;
  if (choice.contains("delta") && choice["delta"].is_object()) {
    const auto& d = choice["delta"];
    out.delta.reasoning_text = OptionalString(d, "reasoning_content");
    out.delta.answer_text = OptionalString(d, "content");
  }
  out.finish_reason = OptionalString(choice, "finish_reason");
  return out;
}

std::optional<ChatResponse> OpenAiCompatibleHttpProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  auto cli = MakeClient(endpoint_, read_timeout_s_);
  httplib::Headers headers;
  if (!api_key_.empty()) headers.emplace("Authorization", "Bearer " + api_key_);

  ChatRequest once = req;
  once.stream = false;
  const auto body = BuildChatRequestBody(once).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  auto res = cli->Post(JoinPath(endpoint_.base_path, "/chat/completions"), headers, body, "application/json");
  if (!res) {
    if (err) *err = name_ + ": failed to connect";
    return std::nullopt;
  }
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (res->status < 200 || res->status >= 300) {
    auto msg = jr.is_discarded() ? std::string() : ExtractErrorMessage(jr);
    if (err) *err = name_ + ": /chat/completions http " + std::to_string(res->status) + (msg.empty() ? "" : ": " + msg);
    return std::nullopt;
  }
  if (jr.is_discarded() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") || !jr["choices"][0]["message"].is_object()) {
    if (err) *err = name_ + ": invalid json from /chat/completions";
    return std::nullopt;
  }
  const auto& msg = jr["choices"][0]["message"];
  ChatResponse out;
  out.model = req.model;
  if (auto content = OptionalString(msg, "content")) out.content = *content;
  if (auto reasoning = OptionalString(msg, "reasoning_content")) out.reasoning = *reasoning;
  if (auto fr = OptionalString(jr["choices"][0], "finish_reason")) out.finish_reason = *fr;
  if (jr.contains("usage") && jr["usage"].is_object()) out.usage = jr["usage"];
  return out;
}

bool OpenAiCompatibleHttpProvider::ChatStream(const ChatRequest& req,
                                              const std::function<bool(const Delta&)>& on_delta,
                                              const std::function<void(const std::string& finish_reason)>& on_done,
                                              std::string* err) {
  SsePostRequest sreq;
  sreq.endpoint = endpoint_;
  sreq.path = "/chat/completions";
  if (!api_key_.empty()) sreq.headers.emplace_back("Authorization", "Bearer " + api_key_);
  sreq.read_timeout_s = read_timeout_s_;
  ChatRequest streaming = req;
  streaming.stream = true;
  sreq.body = BuildChatRequestBody(streaming).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::string finish_reason = "stop";
  std::string stream_error;
  bool canceled = false;
  const bool ok = StreamSsePost(
      sreq,
      [&](const std::string& payload) -> bool {
        auto chunk = ParseStreamChunk(payload);
        if (!chunk) return true;
        if (chunk->error) {
          stream_error = *chunk->error;
          return false;
        }
        if (chunk->finish_reason && !chunk->finish_reason->empty()) finish_reason = *chunk->finish_reason;
        if (!chunk->delta.reasoning_text && !chunk->delta.answer_text) return true;
        return on_delta(chunk->delta);
      },
      &canceled,
      err);
  if (!ok) {
    std::cout << "[upstream] provider=" << name_ << " error=" << (err ? *err : std::string("-")) << "\n";
    return false;
  }
  if (!stream_error.empty()) {
    if (err) *err = name_ + ": " + stream_error;
    std::cout << "[upstream] provider=" << name_ << " stream_error=" << stream_error << "\n";
    return false;
  }
  if (canceled) return true;
  if (on_done) on_done(finish_reason);
  return true;
}

}  // namespace toolseek
