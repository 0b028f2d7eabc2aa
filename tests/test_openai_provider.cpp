#include <gtest/gtest.h>

#include "config.hpp"
#include "openai_compatible_http_provider.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace toolseek;

// Stands in for the DeepSeek API on a local port.
class OpenAiProviderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server.Post("/beta/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
      auth_header = req.get_header_value("Authorization");
      last_body = nlohmann::json::parse(req.body, nullptr, false);
      res.status = status;
      res.set_content(reply, content_type);
    });
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

  OpenAiCompatibleHttpProvider Provider() {
    return OpenAiCompatibleHttpProvider(
        "deepseek", ParseHttpEndpoint("http://127.0.0.1:" + std::to_string(port) + "/beta", 80), "sk-test");
  }

  ChatRequest Request() {
    ChatRequest req;
    req.model = "deepseek-reasoner";
    req.messages.push_back({Role::kUser, "hi", false});
    req.messages.push_back({Role::kAssistant, "<think>\n", true});
    return req;
  }

  httplib::Server server;
  std::thread thread;
  int port = 0;

  int status = 200;
  std::string reply;
  std::string content_type = "text/event-stream";
  std::string auth_header;
  nlohmann::json last_body;
};

TEST_F(OpenAiProviderTest, StreamsReasoningThenContent) {
  reply =
      ": keep-alive\n\n"
      "data: {\"choices\":[{\"index\":0,\"delta\":{\"role\":\"assistant\",\"reasoning_content\":\"Let \"}}]}\n\n"
      "data: {\"choices\":[{\"index\":0,\"delta\":{\"reasoning_content\":\"me think\"}}]}\n\n"
      "data: {\"choices\":[{\"index\":0,\"delta\":{\"content\":\"42\"}}]}\n\n"
      "data: {\"choices\":[{\"index\":0,\"delta\":{},\"finish_reason\":\"length\"}]}\n\n"
      "data: [DONE]\n\n";
  auto provider = Provider();

  std::string reasoning;
  std::string content;
  std::string finish;
  std::string err;
  const bool ok = provider.ChatStream(
      Request(),
      [&](const Delta& d) {
        if (d.reasoning_text) reasoning += *d.reasoning_text;
        if (d.answer_text) content += *d.answer_text;
        return true;
      },
      [&](const std::string& fr) { finish = fr; },
      &err);

  ASSERT_TRUE(ok) << err;
  EXPECT_EQ(reasoning, "Let me think");
  EXPECT_EQ(content, "42");
  EXPECT_EQ(finish, "length");
  EXPECT_EQ(auth_header, "Bearer sk-test");
  ASSERT_FALSE(last_body.is_discarded());
  EXPECT_EQ(last_body["stream"], true);
  EXPECT_EQ(last_body["messages"][1]["prefix"], true);
}

TEST_F(OpenAiProviderTest, StopFromCallbackIsNotAnError) {
  reply =
      "data: {\"choices\":[{\"delta\":{\"reasoning_content\":\"a\"}}]}\n\n"
      "data: {\"choices\":[{\"delta\":{\"reasoning_content\":\"b\"}}]}\n\n"
      "data: [DONE]\n\n";
  auto provider = Provider();
  int seen = 0;
  bool done_called = false;
  std::string err;
  const bool ok = provider.ChatStream(
      Request(),
      [&](const Delta&) {
        seen++;
        return false;
      },
      [&](const std::string&) { done_called = true; },
      &err);
  EXPECT_TRUE(ok) << err;
  EXPECT_EQ(seen, 1);
  EXPECT_FALSE(done_called);
}

TEST_F(OpenAiProviderTest, HttpErrorStatusFails) {
  status = 401;
  content_type = "application/json";
  reply = R"({"error":{"message":"Authentication Fails"}})";
  auto provider = Provider();
  std::string err;
  const bool ok = provider.ChatStream(
      Request(), [](const Delta&) { return true; }, nullptr, &err);
  EXPECT_FALSE(ok);
  EXPECT_NE(err.find("401"), std::string::npos) << err;
  EXPECT_NE(err.find("Authentication Fails"), std::string::npos) << err;
}

TEST_F(OpenAiProviderTest, ErrorEventInStreamFails) {
  reply =
      "data: {\"choices\":[{\"delta\":{\"reasoning_content\":\"a\"}}]}\n\n"
      "data: {\"error\":{\"message\":\"overloaded\"}}\n\n";
  auto provider = Provider();
  std::string err;
  const bool ok = provider.ChatStream(
      Request(), [](const Delta&) { return true; }, nullptr, &err);
  EXPECT_FALSE(ok);
  EXPECT_NE(err.find("overloaded"), std::string::npos) << err;
}

TEST_F(OpenAiProviderTest, UnreachableUpstreamFails) {
  OpenAiCompatibleHttpProvider provider("deepseek", ParseHttpEndpoint("http://127.0.0.1:1/beta", 80), "");
  std::string err;
  EXPECT_FALSE(provider.ChatStream(
      Request(), [](const Delta&) { return true; }, nullptr, &err));
  EXPECT_FALSE(err.empty());
}

TEST_F(OpenAiProviderTest, ChatOnceReadsMessage) {
  content_type = "application/json";
  reply = R"({"choices":[{"index":0,"message":{"role":"assistant","content":"42","reasoning_content":"6*7"},"finish_reason":"stop"}]})";
  auto provider = Provider();
  std::string err;
  auto resp = provider.ChatOnce(Request(), &err);
  ASSERT_TRUE(resp.has_value()) << err;
  EXPECT_EQ(resp->content, "42");
  EXPECT_EQ(resp->reasoning, "6*7");
  EXPECT_EQ(resp->finish_reason, "stop");
  EXPECT_EQ(last_body["stream"], false);
}

TEST_F(OpenAiProviderTest, ChatOnceReportsHttpError) {
  status = 500;
  content_type = "application/json";
  reply = R"({"error":{"message":"boom"}})";
  auto provider = Provider();
  std::string err;
  EXPECT_FALSE(provider.ChatOnce(Request(), &err).has_value());
  EXPECT_NE(err.find("500"), std::string::npos) << err;
  EXPECT_NE(err.find("boom"), std::string::npos) << err;
}

TEST_F(OpenAiProviderTest, ExtraParametersAreSentAndOwnFieldsWin) {
  content_type = "application/json";
  reply = R"({"choices":[{"message":{"content":"ok"},"finish_reason":"stop"}],"usage":{"total_tokens":7}})";
  auto provider = Provider();
  auto req = Request();
  req.temperature = 0.25f;
  req.extra = {{"stop", {"END"}}, {"response_format", {{"type", "text"}}}, {"model", "other"}, {"stream", true}};
  std::string err;
  auto resp = provider.ChatOnce(req, &err);
  ASSERT_TRUE(resp.has_value()) << err;
  EXPECT_EQ(resp->usage["total_tokens"], 7);

  ASSERT_FALSE(last_body.is_discarded());
  EXPECT_EQ(last_body["stop"], nlohmann::json::array({"END"}));
  EXPECT_EQ(last_body["response_format"]["type"], "text");
  EXPECT_EQ(last_body["model"], "deepseek-reasoner");
  EXPECT_EQ(last_body["stream"], false);
  EXPECT_FLOAT_EQ(last_body["temperature"].get<float>(), 0.25f);
  EXPECT_EQ(last_body["messages"].size(), 2u);
}
