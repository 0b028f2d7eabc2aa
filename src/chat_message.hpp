#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolseek {

enum class Role { kSystem, kUser, kAssistant };

struct ChatMessage {
  Role role = Role::kUser;
  std::string content;
  // Partial assistant message that seeds a continuation instead of closing a turn.
  bool prefix = false;
};

// One unit of streamed output. Upstream deltas only carry text; the
// orchestrator ends every turn with exactly one delta that carries either
// finish_reason or error.
struct Delta {
  std::optional<std::string> reasoning_text;
  std::optional<std::string> answer_text;
  std::optional<std::string> finish_reason;
  std::optional<std::string> error;

  bool IsTerminal() const { return finish_reason.has_value() || error.has_value(); }
};

const char* RoleName(Role role);
std::optional<Role> ParseRole(const std::string& name);

nlohmann::json MessagesToJson(const std::vector<ChatMessage>& messages);

// Validates the "messages" array of an inbound request. Rejects anything that
// is not a non-empty array of {role, content} objects with at least one user
// message.
std::optional<std::vector<ChatMessage>> ParseChatMessages(const nlohmann::json& body, std::string* err);

std::string NewId(const std::string& prefix);

}  // namespace toolseek
