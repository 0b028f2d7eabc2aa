#include "chat_message.hpp"

#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace toolseek {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static bool ExtractMessageContent(const nlohmann::json& content, std::string* out) {
  if (content.is_string()) {
    *out = content.get<std::string>();
    return true;
  }
  if (!content.is_array()) return false;
  std::string text;
  for (const auto& part : content) {
    if (!part.is_object()) return false;
    if (part.contains("type") && part["type"].is_string()) {
      const auto type = part["type"].get<std::string>();
      if (type != "text" && type != "input_text") continue;
    }
    if (part.contains("text") && part["text"].is_string()) text += part["text"].get<std::string>();
  }
  *out = std::move(text);
  return true;
}

}  // namespace

const char* RoleName(Role role) {
  switch (role) {
    case Role::kSystem:
      return "system";
    case Role::kUser:
      return "user";
    case Role::kAssistant:
      return "assistant";
  }
  return "user";
}

std::optional<Role> ParseRole(const std::string& name) {
  if (name == "system") return Role::kSystem;
  if (name == "user") return Role::kUser;
  if (name == "assistant") return Role::kAssistant;
  return std::nullopt;
}

nlohmann::json MessagesToJson(const std::vector<ChatMessage>& messages) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& m : messages) {
    nlohmann::json jm;
    jm["role"] = RoleName(m.role);
    jm["content"] = m.content;
    if (m.prefix) jm["prefix"] = true;
    out.push_back(std::move(jm));
  }
  return out;
}

std::optional<std::vector<ChatMessage>> ParseChatMessages(const nlohmann::json& body, std::string* err) {
  auto fail = [&](const std::string& msg) -> std::optional<std::vector<ChatMessage>> {
    if (err) *err = msg;
    return std::nullopt;
  };
  if (!body.is_object()) return fail("request body must be a JSON object");
  if (!body.contains("messages") || !body["messages"].is_array()) return fail("missing required field: messages");
  if (body["messages"].empty()) return fail("messages must not be empty");

  std::vector<ChatMessage> out;
  bool has_user = false;
  size_t index = 0;
  for (const auto& m : body["messages"]) {
    const auto where = "messages[" + std::to_string(index++) + "]";
    if (!m.is_object()) return fail(where + " must be an object");
    if (!m.contains("role") || !m["role"].is_string()) return fail(where + ".role must be a string");
    auto role = ParseRole(m["role"].get<std::string>());
    if (!role) return fail(where + ".role is not one of system, user, assistant");
    ChatMessage cm;
    cm.role = *role;
    if (!m.contains("content") || !ExtractMessageContent(m["content"], &cm.content)) {
      return fail(where + ".content must be a string");
    }
    if (cm.role == Role::kUser) has_user = true;
    out.push_back(std::move(cm));
  }
  if (!has_user) return fail("messages must contain a user message");
  return out;
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

}  // namespace toolseek
