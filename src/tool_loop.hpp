#pragma once

#include "chat_message.hpp"
#include "code_executor.hpp"
#include "providers/provider.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace toolseek {

enum class TurnPhase { kRequesting, kStreaming, kExecuting, kRestarting, kForwarding, kDone, kFailed, kCanceled };

const char* TurnPhaseName(TurnPhase phase);

// Collaborators of one turn. Both are shared across turns and must not keep
// per-turn state; the execution namespace is created per turn.
struct TurnContext {
  IUpstreamClient* upstream = nullptr;
  ICodeExecutor* executor = nullptr;
};

struct ToolLoopOptions {
  int max_sub_requests = 16;
  size_t max_output_chars = 4000;
};

struct TurnResult {
  TurnPhase phase = TurnPhase::kRequesting;
  std::string finish_reason;
  std::string error;
  int sub_requests = 0;
  int executions = 0;
  // Seed, reasoning, spliced outputs and the end-of-reasoning marker.
  std::string prefix;
  std::string answer;
};

// Receives every client-visible delta in order. Returning false means the
// client is gone and the turn is abandoned.
using DeltaSink = std::function<bool(const Delta&)>;

// Drives one client turn through as many upstream sub-requests as the
// model's code blocks require. Each sub-request continues from the prefix
// built so far; a completed <python> block is executed once, its output is
// spliced into the prefix and generation restarts from there.
class ToolLoop {
 public:
  ToolLoop(TurnContext ctx, ToolLoopOptions options);

  // request.messages holds the conversation ending with the user's turn.
  TurnResult RunTurn(const ChatRequest& request, const DeltaSink& sink);

 private:
  TurnContext ctx_;
  ToolLoopOptions options_;
};

std::string BuildToolInstruction();
std::string InitialReasoningPrefix();
std::string FormatOutputBlock(const std::string& output, size_t max_chars);

// Conversation with the tool instruction appended to the latest user message,
// followed by the assistant continuation seeded with prefix.
std::vector<ChatMessage> BuildSubRequestMessages(const std::vector<ChatMessage>& conversation, const std::string& prefix);

}  // namespace toolseek
