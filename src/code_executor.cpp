#include "code_executor.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolseek {
namespace {

// Request loop run inside the worker. The protocol uses private copies of
// fds 0 and 1; user code sees an empty stdin and its raw fd 1 writes land on
// stderr.
constexpr const char* kWorkerScript = R"PY(
import contextlib, io, json, os, sys, textwrap, traceback
_requests = os.fdopen(os.dup(0), "r", encoding="utf-8")
_replies = os.fdopen(os.dup(1), "w", encoding="utf-8")
_null = os.open(os.devnull, os.O_RDONLY)
os.dup2(_null, 0)
os.close(_null)
os.dup2(2, 1)
sys.stdin = open(os.devnull, "r")
_ns = {"__name__": "__main__", "__builtins__": __builtins__}

def _run(src):
    src = textwrap.dedent(src).strip("\n")
    buf = io.StringIO()
    with contextlib.redirect_stdout(buf), contextlib.redirect_stderr(buf):
        try:
            try:
                code = compile(src, "<python>", "eval")
            except SyntaxError:
                code = None
            if code is not None:
                value = eval(code, _ns)
                if value is not None:
                    print(repr(value))
            else:
                exec(compile(src, "<python>", "exec"), _ns)
        except BaseException:
            traceback.print_exc()
    return buf.getvalue()

for _line in _requests:
    try:
        _out = _run(json.loads(_line).get("code", ""))
    except BaseException:
        _out = traceback.format_exc()
    _replies.write(json.dumps({"output": _out}) + "\n")
    _replies.flush()
)PY";

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  // A worker that died must surface as EPIPE on write, not kill the relay.
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

class PythonWorker {
 public:
  explicit PythonWorker(std::string python) : python_(std::move(python)) {}
  ~PythonWorker() { Stop(); }

  PythonWorker(const PythonWorker&) = delete;
  PythonWorker& operator=(const PythonWorker&) = delete;

  bool Running() const { return pid_ > 0; }

  bool Start(std::string* err) {
    IgnoreSigpipeOnce();
    int to_child[2];
    int from_child[2];
    if (::pipe2(to_child, O_CLOEXEC) != 0) {
      if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
      return false;
    }
    if (::pipe2(from_child, O_CLOEXEC) != 0) {
      if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
      ::close(to_child[0]);
      ::close(to_child[1]);
      return false;
    }

    std::string arg_u = "-u";
    std::string arg_c = "-c";
    std::string script = kWorkerScript;
    std::vector<char*> argv = {python_.data(), arg_u.data(), arg_c.data(), script.data(), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
      if (err) *err = std::string("fork failed: ") + std::strerror(errno);
      ::close(to_child[0]);
      ::close(to_child[1]);
      ::close(from_child[0]);
      ::close(from_child[1]);
      return false;
    }
    if (pid == 0) {
      ::dup2(to_child[0], STDIN_FILENO);
      ::dup2(from_child[1], STDOUT_FILENO);
      ::execvp(argv[0], argv.data());
      ::_exit(127);
    }

    ::close(to_child[0]);
    ::close(from_child[1]);
    pid_ = pid;
    to_child_ = to_child[1];
    from_child_ = from_child[0];
    read_buf_.clear();
    std::cout << "[exec] worker started pid=" << pid_ << " python=" << python_ << "\n";
    return true;
  }

  void Stop() {
    if (to_child_ >= 0) ::close(to_child_);
    if (from_child_ >= 0) ::close(from_child_);
    to_child_ = -1;
    from_child_ = -1;
    if (pid_ > 0) {
      ::kill(pid_, SIGKILL);
      while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
      }
      std::cout << "[exec] worker stopped pid=" << pid_ << "\n";
    }
    pid_ = -1;
    read_buf_.clear();
  }

  std::optional<std::string> Run(const std::string& code, std::string* err) {
    if (!Running() && !Start(err)) return std::nullopt;

    nlohmann::json req;
    req["code"] = code;
    if (!WriteAll(req.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n")) {
      if (err) *err = "python worker is not accepting input";
      return std::nullopt;
    }
    std::string line;
    if (!ReadLine(&line)) {
      if (err) *err = "python worker exited";
      return std::nullopt;
    }
    auto reply = nlohmann::json::parse(line, nullptr, false);
    if (reply.is_discarded() || !reply.is_object() || !reply.contains("output") || !reply["output"].is_string()) {
      if (err) *err = "malformed reply from python worker";
      return std::nullopt;
    }
    return reply["output"].get<std::string>();
  }

 private:
  bool WriteAll(const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
      ssize_t n = ::write(to_child_, s.data() + off, s.size() - off);
      if (n < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      off += static_cast<size_t>(n);
    }
    return true;
  }

  bool ReadLine(std::string* line) {
    char buf[4096];
    while (true) {
      auto nl = read_buf_.find('\n');
      if (nl != std::string::npos) {
        *line = read_buf_.substr(0, nl);
        read_buf_.erase(0, nl + 1);
        return true;
      }
      ssize_t n = ::read(from_child_, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) return false;
      read_buf_.append(buf, static_cast<size_t>(n));
    }
  }

  std::string python_;
  pid_t pid_ = -1;
  int to_child_ = -1;
  int from_child_ = -1;
  std::string read_buf_;
};

class PythonNamespace : public ExecutionNamespace {
 public:
  explicit PythonNamespace(std::string python) : worker(std::move(python)) {}
  PythonWorker worker;
};

}  // namespace

PythonExecutor::PythonExecutor(std::string python_executable) : python_executable_(std::move(python_executable)) {}

std::unique_ptr<ExecutionNamespace> PythonExecutor::NewNamespace() {
  return std::make_unique<PythonNamespace>(python_executable_);
}

std::string PythonExecutor::Execute(const std::string& source, ExecutionNamespace* ns) {
  auto* py = dynamic_cast<PythonNamespace*>(ns);
  if (!py) return "[execution error] no python namespace";
  try {
    std::string err;
    auto out = py->worker.Run(source, &err);
    if (!out) {
      std::cout << "[exec] failed error=" << err << "\n";
      // Next block gets a fresh worker; earlier definitions are gone.
      py->worker.Stop();
      return "[execution error] " + err;
    }
    if (out->empty()) return kEmptyOutputPlaceholder;
    return *out;
  } catch (const std::exception& e) {
    py->worker.Stop();
    return std::string("[execution error] ") + e.what();
  }
}

}  // namespace toolseek
