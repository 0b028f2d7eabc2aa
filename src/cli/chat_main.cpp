#include "chat_message.hpp"
#include "config.hpp"
#include "openai_compatible_http_provider.hpp"
#include "sse.hpp"
#include "tag_scanner.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kPromptStyle = "\033[1;36m";
constexpr const char* kReasonStyle = "\033[3;90m";
constexpr const char* kCodeStyle = "\033[38;5;35m";
constexpr const char* kOutputStyle = "\033[38;5;214m";
constexpr const char* kCmdStyle = "\033[33m";

static std::string Trim(std::string s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static void ShowHelp() {
  std::cout << kCmdStyle << "/clear" << kReset << " - reset conversation\n"
            << kCmdStyle << "/exit" << kReset << " - quit\n"
            << kCmdStyle << "/help" << kReset << " - this help\n";
}

// Returns false when the command ends the session.
static bool HandleSlash(const std::string& cmd, std::vector<toolseek::ChatMessage>* hist) {
  const auto name = ToLower(Trim(cmd.substr(1)));
  if (name == "exit" || name == "quit") return false;
  if (name == "clear") {
    hist->clear();
    std::cout << "\033[2J\033[H" << "Context cleared.\n";
  } else if (name == "help") {
    ShowHelp();
  } else {
    std::cout << "Unknown command: " << cmd << "\n";
  }
  return true;
}

// Animates "Loading..." on the current line until the first chunk arrives.
class Spinner {
 public:
  Spinner() : thread_([this] { Run(); }) {}
  ~Spinner() { Stop(); }

  Spinner(const Spinner&) = delete;
  Spinner& operator=(const Spinner&) = delete;

  void Stop() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
  }

 private:
  void Run() {
    static const char* kFrames[] = {"|", "/", "-", "\\"};
    size_t i = 0;
    while (!stop_.load()) {
      std::cout << "\rLoading... " << kFrames[i++ % 4] << std::flush;
      std::this_thread::sleep_for(std::chrono::milliseconds(80));
    }
    std::cout << "\r" << std::string(30, ' ') << "\r" << std::flush;
  }

  std::atomic<bool> stop_{false};
  std::thread thread_;
};

// Tags are consumed; only the text they enclose is shown, colored by region.
static void Print(const std::vector<toolseek::ScanSegment>& segments, bool reasoning) {
  for (const auto& seg : segments) {
    if (seg.kind != toolseek::SegmentKind::kText) continue;
    const char* style = reasoning ? kReasonStyle : "";
    if (seg.region == toolseek::kCodeTag) style = kCodeStyle;
    if (seg.region == toolseek::kOutputTag) style = kOutputStyle;
    std::cout << style << seg.text << kReset;
  }
  std::cout << std::flush;
}

}  // namespace

int main() {
  std::signal(SIGPIPE, SIG_IGN);
  toolseek::LoadDotEnv(".env");
  const char* url = std::getenv("TOOLSEEK_API_URL");
  const auto endpoint =
      toolseek::ParseHttpEndpoint(url && *url ? url : "http://localhost:8000/v1/chat/completions", 80);

  std::cout << kPromptStyle << "ToolSeek CLI" << kReset << "  (/help for help)\n"
            << kReasonStyle << "Reasoning can run Python code; its output is shown in orange.\n\n" << kReset;

  std::vector<toolseek::ChatMessage> hist;
  std::string line;
  while (true) {
    std::cout << kPromptStyle << "You" << kReset << ": " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    if (!line.empty() && line[0] == '/') {
      if (!HandleSlash(line, &hist)) break;
      continue;
    }
    if (Trim(line).empty()) continue;

    hist.push_back({toolseek::Role::kUser, line, false});
    nlohmann::json body;
    body["messages"] = toolseek::MessagesToJson(hist);
    body["stream"] = true;

    toolseek::SsePostRequest req;
    req.endpoint = endpoint;
    req.path = "";
    req.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    req.read_timeout_s = 600;

    auto tagger = toolseek::TagScanner::ForReasoning();
    bool started = false;
    bool finished_reasoning = false;
    bool reasoning_mode = true;
    std::string answer;
    std::string stream_error;
    std::string err;
    bool canceled = false;
    Spinner spinner;
    const bool ok = toolseek::StreamSsePost(
        req,
        [&](const std::string& payload) -> bool {
          auto chunk = toolseek::ParseStreamChunk(payload);
          if (!chunk) return true;
          spinner.Stop();
          if (chunk->error) {
            stream_error = *chunk->error;
            return false;
          }
          if (!started) {
            std::cout << kPromptStyle << "AI" << kReset << ": ";
            started = true;
          }
          if (chunk->delta.reasoning_text && !chunk->delta.reasoning_text->empty()) {
            Print(tagger.Feed(*chunk->delta.reasoning_text), true);
          }
          if (chunk->delta.answer_text && !chunk->delta.answer_text->empty()) {
            if (!finished_reasoning) {
              finished_reasoning = true;
              Print(tagger.Finish(), reasoning_mode);
              reasoning_mode = false;
              std::cout << "\n";
            }
            Print(tagger.Feed(*chunk->delta.answer_text), false);
            answer += *chunk->delta.answer_text;
          }
          return true;
        },
        &canceled,
        &err);
    spinner.Stop();
    Print(tagger.Finish(), reasoning_mode);

    if (!ok) {
      std::cout << "\nRequest error: " << err << "\n";
      hist.pop_back();
      continue;
    }
    if (!stream_error.empty()) {
      std::cout << "\nError: " << stream_error << "\n";
      hist.pop_back();
      continue;
    }
    std::cout << "\n";
    hist.push_back({toolseek::Role::kAssistant, answer, false});
  }
  std::cout << "\nBye!\n";
  return 0;
}
