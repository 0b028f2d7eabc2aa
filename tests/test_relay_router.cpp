#include <gtest/gtest.h>

#include "code_executor.hpp"
#include "config.hpp"
#include "openai_compatible_http_provider.hpp"
#include "relay_router.hpp"
#include "sse.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace toolseek;

namespace {

Delta R(const std::string& text) {
  Delta d;
  d.reasoning_text = text;
  return d;
}

Delta A(const std::string& text) {
  Delta d;
  d.answer_text = text;
  return d;
}

class FakeUpstream : public IUpstreamClient {
 public:
  std::string Name() const override { return "fake"; }

  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override {
    last_request = req;
    if (!once) {
      if (err) *err = "fake: http 503";
      return std::nullopt;
    }
    return once;
  }

  bool ChatStream(const ChatRequest& req,
                  const std::function<bool(const Delta&)>& on_delta,
                  const std::function<void(const std::string&)>& on_done,
                  std::string* err) override {
    last_request = req;
    calls++;
    if (next >= streams.size()) {
      if (err) *err = stream_error.empty() ? "no stream left" : stream_error;
      return false;
    }
    for (const auto& d : streams[next++]) {
      if (!on_delta(d)) return true;
    }
    if (on_done) on_done("stop");
    return true;
  }

  std::optional<ChatResponse> once;
  std::vector<std::vector<Delta>> streams;
  std::string stream_error;
  size_t next = 0;
  int calls = 0;
  ChatRequest last_request;
};

class FixedExecutor : public ICodeExecutor {
 public:
  std::unique_ptr<ExecutionNamespace> NewNamespace() override { return std::make_unique<ExecutionNamespace>(); }
  std::string Execute(const std::string& source, ExecutionNamespace*) override {
    executed.push_back(source);
    return "42\n";
  }
  std::vector<std::string> executed;
};

struct StreamedReply {
  std::string reasoning;
  std::string content;
  std::vector<std::string> finish_reasons;
  std::vector<std::string> errors;
  bool first_has_role = false;
  bool done = false;
  int chunks = 0;
};

StreamedReply DecodeStream(const std::string& body) {
  StreamedReply out;
  SseDecoder decoder;
  decoder.Feed(body, [&](const std::string& payload) {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded()) return true;
    if (j.contains("error")) {
      out.errors.push_back(j["error"].value("message", ""));
      return true;
    }
    const auto& choice = j["choices"][0];
    if (out.chunks == 0) out.first_has_role = choice["delta"].value("role", "") == "assistant";
    out.chunks++;
    if (choice["delta"].contains("reasoning_content")) out.reasoning += choice["delta"]["reasoning_content"].get<std::string>();
    if (choice["delta"].contains("content")) out.content += choice["delta"]["content"].get<std::string>();
    if (choice["finish_reason"].is_string()) out.finish_reasons.push_back(choice["finish_reason"].get<std::string>());
    return true;
  });
  out.done = decoder.Done();
  return out;
}

}  // namespace

class RelayRouterTest : public ::testing::Test {
 protected:
  void Start(RelayConfig cfg = RelayConfig()) {
    cfg.upstream_model = "deepseek-reasoner";
    router = std::make_unique<RelayRouter>(cfg, &upstream, &executor);
    router->Register(&server);
    port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this] { server.listen_after_bind(); });
    for (int i = 0; i < 500 && !server.is_running(); i++) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(server.is_running());
  }

  void TearDown() override {
    server.stop();
    if (thread.joinable()) thread.join();
  }

  httplib::Result Post(const std::string& path, const std::string& body) {
    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(30);
    return cli.Post(path, body, "application/json");
  }

  FakeUpstream upstream;
  FixedExecutor executor;
  httplib::Server server;
  std::unique_ptr<RelayRouter> router;
  std::thread thread;
  int port = 0;
};

TEST_F(RelayRouterTest, HealthAndModels) {
  Start();
  httplib::Client cli("127.0.0.1", port);
  auto res = cli.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "ok");

  for (const std::string path : {"/v1/models", "/api/v1/models"}) {
    res = cli.Get(path);
    ASSERT_TRUE(res) << path;
    EXPECT_EQ(res->status, 200) << path;
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["data"][0]["id"], "deepseek-reasoner");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
  }
}

TEST_F(RelayRouterTest, PrefixModeV1HidesApiRoutes) {
  RelayConfig cfg;
  cfg.api_prefix_mode = "v1";
  Start(cfg);
  httplib::Client cli("127.0.0.1", port);
  auto res = cli.Get("/api/v1/models");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
}

TEST_F(RelayRouterTest, RejectsInvalidRequests) {
  Start();
  for (const std::string body : {std::string("{not json"), std::string(R"({"model":"x"})"),
                                 std::string(R"({"messages":[]})"),
                                 std::string(R"({"messages":[{"role":"user","content":"hi"}],"stream":"yes"})")}) {
    auto res = Post("/v1/chat/completions", body);
    ASSERT_TRUE(res) << body;
    EXPECT_EQ(res->status, 400) << body;
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["error"]["type"], "invalid_request_error") << body;
  }
  EXPECT_EQ(upstream.calls, 0);
}

TEST_F(RelayRouterTest, NonStreamingIsProxied) {
  ChatResponse resp;
  resp.content = "42";
  resp.reasoning = "6*7";
  upstream.once = resp;
  Start();

  auto res = Post("/v1/chat/completions", R"({"model":"whatever","messages":[{"role":"user","content":"6*7?"}]})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["object"], "chat.completion");
  EXPECT_EQ(j["model"], "deepseek-reasoner");
  EXPECT_EQ(j["choices"][0]["message"]["content"], "42");
  EXPECT_EQ(j["choices"][0]["message"]["reasoning_content"], "6*7");
  EXPECT_EQ(upstream.last_request.model, "deepseek-reasoner");
  EXPECT_FALSE(upstream.last_request.stream);
}

TEST_F(RelayRouterTest, ExtraParametersReachUpstream) {
  upstream.streams.push_back({R("thinking"), A("hello")});
  Start();

  auto res = Post("/v1/chat/completions",
                  R"({"model":"m","messages":[{"role":"user","content":"hi"}],"stream":true,)"
                  R"("stop":["###"],"presence_penalty":0.5,"stream_options":{"include_usage":true},"max_tokens":64})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  const auto& extra = upstream.last_request.extra;
  ASSERT_TRUE(extra.is_object());
  EXPECT_EQ(extra["stop"], nlohmann::json::array({"###"}));
  EXPECT_EQ(extra["presence_penalty"], 0.5);
  EXPECT_EQ(extra["stream_options"]["include_usage"], true);
  EXPECT_FALSE(extra.contains("model"));
  EXPECT_FALSE(extra.contains("messages"));
  EXPECT_FALSE(extra.contains("stream"));
  EXPECT_FALSE(extra.contains("max_tokens"));
  ASSERT_TRUE(upstream.last_request.max_tokens.has_value());
  EXPECT_EQ(*upstream.last_request.max_tokens, 64);
  EXPECT_EQ(upstream.last_request.model, "deepseek-reasoner");
}

TEST_F(RelayRouterTest, NonStreamingCarriesStopAndUsage) {
  ChatResponse resp;
  resp.content = "42";
  resp.usage = {{"prompt_tokens", 10}, {"completion_tokens", 3}, {"total_tokens", 13}};
  upstream.once = resp;
  Start();

  auto res = Post("/v1/chat/completions", R"({"messages":[{"role":"user","content":"hi"}],"stop":"END"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["usage"]["total_tokens"], 13);
  EXPECT_EQ(upstream.last_request.extra["stop"], "END");
}

TEST_F(RelayRouterTest, TrailingAssistantMessageIsRejectedBeforeUpstream) {
  upstream.streams.push_back({R("thinking"), A("hello")});
  Start();

  auto res = Post("/v1/chat/completions",
                  R"({"messages":[{"role":"user","content":"hi"},{"role":"assistant","content":"Hello"}],"stream":true})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["error"]["type"], "invalid_request_error");
  EXPECT_EQ(upstream.calls, 0);
  EXPECT_TRUE(executor.executed.empty());
}

TEST_F(RelayRouterTest, TrailingAssistantMessageRelaysWhenExecutionDisabled) {
  upstream.streams.push_back({A("hello")});
  RelayConfig cfg;
  cfg.code_execution_enabled = false;
  Start(cfg);

  auto res = Post("/v1/chat/completions",
                  R"({"messages":[{"role":"user","content":"hi"},{"role":"assistant","content":"Hello"}],"stream":true})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(DecodeStream(res->body).content, "hello");
  EXPECT_EQ(upstream.calls, 1);
}

TEST_F(RelayRouterTest, NonStreamingUpstreamFailureIs502) {
  Start();
  auto res = Post("/v1/chat/completions", R"({"messages":[{"role":"user","content":"hi"}],"stream":false})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 502);
  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["error"]["type"], "api_error");
  EXPECT_EQ(j["error"]["message"], "fake: http 503");
}

TEST_F(RelayRouterTest, StreamingRunsToolLoop) {
  upstream.streams.push_back({R("Check <python>print(6*7)</python>")});
  upstream.streams.push_back({R("Confirmed."), A("The answer is 42.")});
  Start();

  auto res = Post("/api/v1/chat/completions", R"({"messages":[{"role":"user","content":"6*7?"}],"stream":true})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_NE(res->get_header_value("Content-Type").find("text/event-stream"), std::string::npos);

  auto reply = DecodeStream(res->body);
  EXPECT_TRUE(reply.done);
  EXPECT_TRUE(reply.first_has_role);
  EXPECT_EQ(reply.reasoning, "Check <python>print(6*7)</python>\n<output>\n42\n</output>\nConfirmed.");
  EXPECT_EQ(reply.content, "The answer is 42.");
  ASSERT_EQ(reply.finish_reasons.size(), 1u);
  EXPECT_EQ(reply.finish_reasons[0], "stop");
  EXPECT_TRUE(reply.errors.empty());
  ASSERT_EQ(executor.executed.size(), 1u);
  EXPECT_EQ(executor.executed[0], "print(6*7)");
  EXPECT_EQ(upstream.calls, 2);
}

TEST_F(RelayRouterTest, StreamingUpstreamFailureSendsErrorEvent) {
  upstream.stream_error = "upstream http 401: bad key";
  Start();

  auto res = Post("/v1/chat/completions", R"({"messages":[{"role":"user","content":"hi"}],"stream":true})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto reply = DecodeStream(res->body);
  ASSERT_EQ(reply.errors.size(), 1u);
  EXPECT_EQ(reply.errors[0], "upstream http 401: bad key");
  EXPECT_TRUE(reply.finish_reasons.empty());
  EXPECT_TRUE(reply.done);
}

TEST_F(RelayRouterTest, ExecutionDisabledRelaysVerbatim) {
  upstream.streams.push_back({R("<python>print(1)</python>"), A("done")});
  RelayConfig cfg;
  cfg.code_execution_enabled = false;
  Start(cfg);

  auto res = Post("/v1/chat/completions", R"({"messages":[{"role":"user","content":"hi"}],"stream":true})");
  ASSERT_TRUE(res);
  auto reply = DecodeStream(res->body);
  EXPECT_EQ(reply.reasoning, "<python>print(1)</python>");
  EXPECT_EQ(reply.content, "done");
  EXPECT_TRUE(executor.executed.empty());
  EXPECT_EQ(upstream.calls, 1);
  EXPECT_FALSE(upstream.last_request.messages.back().prefix);
}

TEST_F(RelayRouterTest, SsePostClientReadsRelayStream) {
  upstream.streams.push_back({R("thinking"), A("hello")});
  Start();

  SsePostRequest req;
  req.endpoint = ParseHttpEndpoint("http://127.0.0.1:" + std::to_string(port) + "/v1/chat/completions", 80);
  req.body = R"({"messages":[{"role":"user","content":"hi"}],"stream":true})";
  std::string content;
  bool canceled = true;
  std::string err;
  const bool ok = StreamSsePost(
      req,
      [&](const std::string& payload) {
        auto chunk = ParseStreamChunk(payload);
        if (chunk && chunk->delta.answer_text) content += *chunk->delta.answer_text;
        return true;
      },
      &canceled,
      &err);
  EXPECT_TRUE(ok) << err;
  EXPECT_FALSE(canceled);
  EXPECT_EQ(content, "hello");
}

TEST_F(RelayRouterTest, OptionsPreflight) {
  Start();
  httplib::Client cli("127.0.0.1", port);
  auto res = cli.Options("/v1/chat/completions");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "*");
}
