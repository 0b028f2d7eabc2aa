#include "tool_loop.hpp"

#include "tag_scanner.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace toolseek {
namespace {

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static std::string OneLine(std::string s) {
  for (auto& c : s) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return s;
}

enum class StreamAction { kNone, kExecute, kCloseReasoning };

// State of one client turn. prefix_ only grows except when the tail of an
// abandoned sub-request is cut off; prefix_[0, sent_) has been delivered
// (or is the hidden seed, or a skipped marker) and is never sent again.
class Turn {
 public:
  Turn(const TurnContext& ctx, const ToolLoopOptions& options, const ChatRequest& request, const DeltaSink& sink)
      : ctx_(ctx), options_(options), request_(request), sink_(sink), scanner_(TagScanner::ForReasoning()) {}

  TurnResult Run() {
    TurnResult result;
    if (!ctx_.upstream || !ctx_.executor) {
      Fail("tool loop is not configured");
      result.phase = TurnPhase::kFailed;
      result.error = error_;
      return result;
    }

    prefix_ = InitialReasoningPrefix();
    sent_ = prefix_.size();
    ns_ = ctx_.executor->NewNamespace();

    TurnPhase phase = TurnPhase::kRequesting;
    while (phase != TurnPhase::kDone && phase != TurnPhase::kFailed && phase != TurnPhase::kCanceled) {
      switch (phase) {
        case TurnPhase::kRequesting:
          if (sub_requests_ >= options_.max_sub_requests) {
            Fail("tool loop limit reached after " + std::to_string(sub_requests_) + " sub-requests");
            phase = TurnPhase::kFailed;
            break;
          }
          phase = thinking_open_ ? TurnPhase::kStreaming : TurnPhase::kForwarding;
          break;
        case TurnPhase::kStreaming:
        case TurnPhase::kForwarding:
          phase = StreamOnce(phase);
          break;
        case TurnPhase::kExecuting:
          phase = ExecutePendingBlock() ? TurnPhase::kRestarting : TurnPhase::kCanceled;
          break;
        case TurnPhase::kRestarting:
          phase = TurnPhase::kRequesting;
          break;
        default:
          break;
      }
    }
    ns_.reset();

    result.phase = phase;
    result.finish_reason = finish_reason_;
    result.error = error_;
    result.sub_requests = sub_requests_;
    result.executions = executions_;
    result.prefix = prefix_;
    result.answer = answer_;
    std::cout << "[tool-loop] end phase=" << TurnPhaseName(phase) << " sub_requests=" << sub_requests_
              << " executions=" << executions_ << " prefix_chars=" << prefix_.size() << " answer_chars=" << answer_.size()
              << "\n";
    return result;
  }

 private:
  TurnPhase StreamOnce(TurnPhase phase) {
    sub_requests_++;
    scanner_ = TagScanner::ForReasoning();
    scan_pos_ = prefix_.size();
    release_ = sent_;
    code_open_ = false;
    code_.clear();
    action_ = StreamAction::kNone;
    saw_reasoning_field_ = false;

    ChatRequest req = request_;
    req.stream = true;
    req.messages = BuildSubRequestMessages(request_.messages, prefix_);
    std::cout << "[tool-loop] sub_request=" << sub_requests_ << " phase=" << TurnPhaseName(phase)
              << " prefix_chars=" << prefix_.size() << "\n";

    std::string finish_reason = "stop";
    std::string err;
    const bool ok = ctx_.upstream->ChatStream(
        req,
        [&](const Delta& d) { return thinking_open_ ? OnThinkingDelta(d) : OnAnswerDelta(d); },
        [&](const std::string& fr) { finish_reason = fr; },
        &err);

    if (client_gone_) return TurnPhase::kCanceled;
    if (!ok) {
      Fail(err.empty() ? "upstream error" : err);
      return TurnPhase::kFailed;
    }
    if (action_ == StreamAction::kExecute) return TurnPhase::kExecuting;
    if (action_ == StreamAction::kCloseReasoning) return TurnPhase::kRestarting;

    if (thinking_open_) {
      // Ended inside the reasoning: whatever is held back goes out as is.
      for (const auto& seg : scanner_.Finish()) scan_pos_ += seg.text.size();
      if (!Release(prefix_.size())) return TurnPhase::kCanceled;
    }
    finish_reason_ = finish_reason;
    Delta fin;
    fin.finish_reason = finish_reason;
    Emit(fin);
    return TurnPhase::kDone;
  }

  bool OnThinkingDelta(const Delta& d) {
    const std::string reasoning = d.reasoning_text.value_or(std::string());
    const std::string answer = d.answer_text.value_or(std::string());
    if (!reasoning.empty()) saw_reasoning_field_ = true;
    if (saw_reasoning_field_ && reasoning.empty() && !answer.empty()) {
      // The upstream moved from its reasoning field to the answer field.
      if (!CloseReasoningBySwitch()) return false;
      return OnAnswerDelta(d);
    }

    const std::string text = reasoning + answer;
    if (text.empty()) return true;
    prefix_ += text;
    for (const auto& seg : scanner_.Feed(text)) {
      HandleSegment(seg);
      if (action_ != StreamAction::kNone) break;
    }

    switch (action_) {
      case StreamAction::kExecute:
        // Anything the model wrote past </python> is dropped with the sub-request.
        prefix_.resize(cut_);
        Release(release_);
        return false;
      case StreamAction::kCloseReasoning:
        prefix_.resize(marker_end_);
        if (!Release(marker_begin_)) return false;
        sent_ = marker_end_;
        thinking_open_ = false;
        std::cout << "[tool-loop] reasoning closed prefix_chars=" << prefix_.size() << "\n";
        return false;
      case StreamAction::kNone:
        break;
    }
    return Release(release_);
  }

  bool OnAnswerDelta(const Delta& d) {
    Delta out;
    if (d.reasoning_text && !d.reasoning_text->empty()) out.reasoning_text = d.reasoning_text;
    if (d.answer_text && !d.answer_text->empty()) {
      out.answer_text = d.answer_text;
      answer_ += *d.answer_text;
    }
    if (!out.reasoning_text && !out.answer_text) return true;
    prefix_ += out.reasoning_text.value_or(std::string()) + out.answer_text.value_or(std::string());
    sent_ = prefix_.size();
    return Emit(out);
  }

  bool CloseReasoningBySwitch() {
    for (const auto& seg : scanner_.Finish()) scan_pos_ += seg.text.size();
    if (!Release(prefix_.size())) return false;
    prefix_ += kEndOfReasoningMarker;
    sent_ = prefix_.size();
    thinking_open_ = false;
    std::cout << "[tool-loop] reasoning closed by field switch prefix_chars=" << prefix_.size() << "\n";
    return true;
  }

  void HandleSegment(const ScanSegment& seg) {
    const size_t begin = scan_pos_;
    scan_pos_ += seg.text.size();
    switch (seg.kind) {
      case SegmentKind::kText:
        if (code_open_) {
          code_ += seg.text;
        } else {
          release_ = scan_pos_;
        }
        break;
      case SegmentKind::kOpenTag:
        if (seg.region == kCodeTag) {
          // The block is held back until its closing tag arrives.
          code_open_ = true;
          code_.clear();
        } else {
          release_ = scan_pos_;
        }
        break;
      case SegmentKind::kCloseTag:
        release_ = scan_pos_;
        if (seg.region == kCodeTag && code_open_) {
          code_open_ = false;
          cut_ = scan_pos_;
          action_ = StreamAction::kExecute;
        }
        break;
      case SegmentKind::kMarker:
        release_ = begin;
        marker_begin_ = begin;
        marker_end_ = scan_pos_;
        action_ = StreamAction::kCloseReasoning;
        break;
    }
  }

  bool ExecutePendingBlock() {
    executions_++;
    std::cout << "[exec] block=" << executions_ << " code=" << TruncateForLog(OneLine(code_), 200) << "\n";
    const std::string output = ctx_.executor->Execute(code_, ns_.get());
    std::cout << "[exec] block=" << executions_ << " output_chars=" << output.size()
              << " output=" << TruncateForLog(OneLine(output), 200) << "\n";
    prefix_ += FormatOutputBlock(output, options_.max_output_chars);
    code_.clear();
    return Release(prefix_.size());
  }

  bool Release(size_t end) {
    if (end <= sent_) return true;
    Delta d;
    d.reasoning_text = prefix_.substr(sent_, end - sent_);
    sent_ = end;
    return Emit(d);
  }

  bool Emit(const Delta& d) {
    if (client_gone_) return false;
    if (!sink_(d)) {
      client_gone_ = true;
      std::cout << "[tool-loop] client disconnected\n";
      return false;
    }
    return true;
  }

  void Fail(const std::string& message) {
    error_ = message;
    std::cout << "[tool-loop] failed error=" << message << "\n";
    Delta d;
    d.error = message;
    Emit(d);
  }

  const TurnContext& ctx_;
  const ToolLoopOptions& options_;
  const ChatRequest& request_;
  const DeltaSink& sink_;

  std::string prefix_;
  size_t sent_ = 0;
  std::unique_ptr<ExecutionNamespace> ns_;
  bool thinking_open_ = true;
  std::string answer_;
  std::string finish_reason_;
  std::string error_;
  int sub_requests_ = 0;
  int executions_ = 0;
  bool client_gone_ = false;

  TagScanner scanner_;
  size_t scan_pos_ = 0;
  size_t release_ = 0;
  bool code_open_ = false;
  std::string code_;
  StreamAction action_ = StreamAction::kNone;
  size_t cut_ = 0;
  size_t marker_begin_ = 0;
  size_t marker_end_ = 0;
  bool saw_reasoning_field_ = false;
};

}  // namespace

const char* TurnPhaseName(TurnPhase phase) {
  switch (phase) {
    case TurnPhase::kRequesting:
      return "requesting";
    case TurnPhase::kStreaming:
      return "streaming";
    case TurnPhase::kExecuting:
      return "executing";
    case TurnPhase::kRestarting:
      return "restarting";
    case TurnPhase::kForwarding:
      return "forwarding";
    case TurnPhase::kDone:
      return "done";
    case TurnPhase::kFailed:
      return "failed";
    case TurnPhase::kCanceled:
      return "canceled";
  }
  return "unknown";
}

ToolLoop::ToolLoop(TurnContext ctx, ToolLoopOptions options) : ctx_(ctx), options_(std::move(options)) {}

TurnResult ToolLoop::RunTurn(const ChatRequest& request, const DeltaSink& sink) {
  Turn turn(ctx_, options_, request, sink);
  return turn.Run();
}

std::string BuildToolInstruction() {
  std::string s;
  s += "You can run Python code while you think. Inside your reasoning, write code between <python> and </python> tags. ";
  s += "The code runs as soon as the closing tag appears, and everything it prints is inserted right after it ";
  s += "between <output> and </output> tags. The value of a bare expression is printed for you. ";
  s += "Variables and imports persist between code blocks within this answer. ";
  s += "Never write <output> blocks yourself; wait for them. ";
  s += "Use code whenever a calculation or a check makes the answer more reliable, ";
  s += "then end your reasoning with </think> and give the final answer.";
  return s;
}

std::string InitialReasoningPrefix() {
  std::string s = std::string(kReasoningOpenMarker) + "\n";
  s += "I can run Python while I think. Quick check that it works:\n";
  s += "<python>\nprint(\"ready\")\n</python>";
  s += FormatOutputBlock("ready\n", 0);
  s += "It works. Now the actual question.\n";
  return s;
}

std::string FormatOutputBlock(const std::string& output, size_t max_chars) {
  std::string out = output;
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
  if (out.empty()) out = kEmptyOutputPlaceholder;
  if (max_chars > 0 && out.size() > max_chars) {
    size_t cut = max_chars;
    // Keep UTF-8 sequences whole.
    while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) cut--;
    out.resize(cut);
    out += "...(truncated)";
  }
  return std::string("\n<") + kOutputTag + ">\n" + out + "\n</" + kOutputTag + ">\n";
}

std::vector<ChatMessage> BuildSubRequestMessages(const std::vector<ChatMessage>& conversation, const std::string& prefix) {
  std::vector<ChatMessage> out = conversation;
  for (size_t i = out.size(); i > 0; i--) {
    if (out[i - 1].role != Role::kUser) continue;
    out[i - 1].content += "\n\n" + BuildToolInstruction();
    break;
  }
  ChatMessage seed;
  seed.role = Role::kAssistant;
  seed.content = prefix;
  seed.prefix = true;
  out.push_back(std::move(seed));
  return out;
}

}  // namespace toolseek
