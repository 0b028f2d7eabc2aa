#include "relay_router.hpp"

#include "chat_message.hpp"
#include "sse.hpp"
#include "tool_loop.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toolseek {
namespace {

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string NormalizePrefix(std::string p) {
  if (p.empty()) return {};
  if (p == "/") return {};
  if (!p.empty() && p.back() == '/') p.pop_back();
  if (p.empty()) return {};
  if (p.front() != '/') p.insert(p.begin(), '/');
  return p;
}

static std::vector<std::string> GetApiPrefixes(const std::string& mode) {
  if (mode == "v1" || mode == "none" || mode == "off") {
    return {""};
  }
  if (mode == "api") {
    return {"/api"};
  }
  return {"", "/api"};
}

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
  return j;
}

static void AddCorsHeaders(httplib::Response* res) {
  res->set_header("Access-Control-Allow-Origin", "*");
  res->set_header("Access-Control-Allow-Methods", "*");
  res->set_header("Access-Control-Allow-Headers", "*");
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  AddCorsHeaders(res);
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  if (j.is_object()) {
    for (const auto& key : {"api_key", "api-key", "authorization", "apiKey"}) {
      if (j.contains(key)) j.erase(key);
    }
  }
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static void LogRequestRaw(const httplib::Request& req) {
  std::cout << "[request] " << req.method << " " << req.path << "\n";
  if (!req.body.empty()) {
    std::cout << "  body: " << TruncateForLog(SanitizeBodyForLog(req.body), 2000) << "\n";
  }
}

static std::optional<int> OptionalInt(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_number_integer()) return std::nullopt;
  return j[key].get<int>();
}

static std::optional<float> OptionalFloat(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
  return j[key].get<float>();
}

static nlohmann::json DeltaToJson(const Delta& d) {
  nlohmann::json out = nlohmann::json::object();
  if (d.reasoning_text) out["reasoning_content"] = *d.reasoning_text;
  if (d.answer_text) out["content"] = *d.answer_text;
  return out;
}

}  // namespace

RelayRouter::RelayRouter(RelayConfig cfg, IUpstreamClient* upstream, ICodeExecutor* executor)
    : cfg_(std::move(cfg)), upstream_(upstream), executor_(executor) {}

void RelayRouter::Register(httplib::Server* server) {
  auto health_handler = [](const httplib::Request&, httplib::Response& res) {
    SendJson(&res, 200, {{"status", "ok"}});
  };

  auto models_handler = [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json out;
    out["object"] = "list";
    out["data"] = nlohmann::json::array();
    out["data"].push_back({{"id", cfg_.upstream_model}, {"object", "model"}, {"owned_by", upstream_->Name()}});
    SendJson(&res, 200, out);
  };

  auto options_handler = [](const httplib::Request&, httplib::Response& res) {
    AddCorsHeaders(&res);
    res.status = 204;
  };

  auto chat_completions_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestRaw(req);
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) return SendJson(&res, 400, MakeError("invalid JSON", "invalid_request_error"));

    std::string err;
    auto messages = ParseChatMessages(body, &err);
    if (!messages) return SendJson(&res, 400, MakeError(err, "invalid_request_error"));

    bool stream = false;
    if (body.contains("stream")) {
      if (!body["stream"].is_boolean()) return SendJson(&res, 400, MakeError("stream must be a boolean", "invalid_request_error"));
      stream = body["stream"].get<bool>();
    }

    ChatRequest creq;
    creq.model = cfg_.upstream_model;
    creq.stream = stream;
    creq.messages = std::move(*messages);
    creq.max_tokens = OptionalInt(body, "max_tokens");
    creq.temperature = OptionalFloat(body, "temperature");
    creq.top_p = OptionalFloat(body, "top_p");
    creq.extra = body;
    for (const std::string key : {"model", "messages", "stream", "max_tokens", "temperature", "top_p"}) creq.extra.erase(key);

    // The tool loop continues the last user turn with an assistant prefix.
    if (stream && cfg_.code_execution_enabled && creq.messages.back().role != Role::kUser) {
      return SendJson(&res, 400, MakeError("last message must be from the user", "invalid_request_error"));
    }

    const std::string model = cfg_.upstream_model;
    const auto id = NewId("chatcmpl");
    const auto created = NowSeconds();

    if (!stream) {
      auto resp = upstream_->ChatOnce(creq, &err);
      if (!resp) return SendJson(&res, 502, MakeError(err.empty() ? "upstream error" : err, "api_error"));
      std::cout << "[chat] id=" << id << " stream=0 finish_reason=" << resp->finish_reason
                << " output_chars=" << resp->content.size() << "\n";

      nlohmann::json out;
      out["id"] = id;
      out["object"] = "chat.completion";
      out["created"] = created;
      out["model"] = model;
      out["choices"] = nlohmann::json::array();
      nlohmann::json choice;
      choice["index"] = 0;
      choice["message"] = {{"role", "assistant"}, {"content", resp->content}};
      if (!resp->reasoning.empty()) choice["message"]["reasoning_content"] = resp->reasoning;
      choice["finish_reason"] = resp->finish_reason;
      out["choices"].push_back(std::move(choice));
      if (!resp->usage.is_null()) out["usage"] = resp->usage;
      return SendJson(&res, 200, out);
    }

    res.status = 200;
    AddCorsHeaders(&res);
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "close");
    res.set_header("X-Accel-Buffering", "no");

    const bool tool_loop = cfg_.code_execution_enabled;
    ToolLoopOptions options;
    options.max_sub_requests = cfg_.max_sub_requests;
    options.max_output_chars = static_cast<size_t>(cfg_.max_output_chars);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, id, created, model, tool_loop, options, creq = std::move(creq)](size_t, httplib::DataSink& sink) mutable {
          try {
            bool wrote_role = false;
            size_t output_chars = 0;

            auto write_bytes = [&](const std::string& s) -> bool {
              if (sink.is_writable && !sink.is_writable()) return false;
              if (!sink.write) return false;
              return sink.write(s.data(), s.size());
            };

            if (!write_bytes(std::string(": init\n") + std::string(2048, ' ') + "\n\n")) {
              sink.done();
              return false;
            }

            auto write_chunk = [&](nlohmann::json delta, const nlohmann::json& finish_reason) -> bool {
              if (!wrote_role) {
                delta["role"] = "assistant";
                wrote_role = true;
              }
              nlohmann::json chunk;
              chunk["id"] = id;
              chunk["object"] = "chat.completion.chunk";
              chunk["created"] = created;
              chunk["model"] = model;
              nlohmann::json choice;
              choice["index"] = 0;
              choice["delta"] = std::move(delta);
              choice["finish_reason"] = finish_reason;
              chunk["choices"] = nlohmann::json::array({choice});
              return write_bytes(SseData(chunk));
            };

            auto write_delta = [&](const Delta& d) -> bool {
              if (d.error) {
                nlohmann::json e;
                e["error"] = {{"message", *d.error}};
                return write_bytes(SseData(e));
              }
              if (d.finish_reason) return write_chunk(nlohmann::json::object(), *d.finish_reason);
              output_chars += d.reasoning_text.value_or(std::string()).size() + d.answer_text.value_or(std::string()).size();
              return write_chunk(DeltaToJson(d), nullptr);
            };

            bool client_gone = false;
            if (tool_loop) {
              ToolLoop loop(TurnContext{upstream_, executor_}, options);
              auto result = loop.RunTurn(creq, write_delta);
              client_gone = result.phase == TurnPhase::kCanceled;
              std::cout << "[chat] id=" << id << " stream=1 tool_loop=1 phase=" << TurnPhaseName(result.phase)
                        << " sub_requests=" << result.sub_requests << " executions=" << result.executions
                        << " finish_reason=" << (result.finish_reason.empty() ? "-" : result.finish_reason)
                        << " output_chars=" << output_chars << "\n";
            } else {
              std::string finish_reason = "stop";
              std::string stream_err;
              const bool ok = upstream_->ChatStream(
                  creq,
                  [&](const Delta& d) -> bool {
                    if (!write_delta(d)) {
                      client_gone = true;
                      return false;
                    }
                    return true;
                  },
                  [&](const std::string& fr) { finish_reason = fr; },
                  &stream_err);
              if (!client_gone) {
                Delta last;
                if (ok) {
                  last.finish_reason = finish_reason;
                } else {
                  last.error = stream_err.empty() ? "upstream error" : stream_err;
                }
                client_gone = !write_delta(last);
              }
              std::cout << "[chat] id=" << id << " stream=1 tool_loop=0 ok=" << (ok ? 1 : 0)
                        << " finish_reason=" << finish_reason << " output_chars=" << output_chars << "\n";
            }

            if (!client_gone) write_bytes(SseDone());
            sink.done();
            return false;
          } catch (const std::exception& e) {
            std::cout << "[chat] id=" << id << " stream aborted error=" << e.what() << "\n";
            sink.done();
            return false;
          }
        },
        [](bool) {});
  };

  for (const auto& raw_prefix : GetApiPrefixes(cfg_.api_prefix_mode)) {
    const auto prefix = NormalizePrefix(raw_prefix);
    server->Get(prefix + "/v1/models", models_handler);
    server->Post(prefix + "/v1/chat/completions", chat_completions_handler);
  }
  server->Get("/health", health_handler);
  server->Options(R"(/.*)", options_handler);
}

}  // namespace toolseek
