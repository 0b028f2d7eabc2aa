#pragma once

#include <memory>
#include <string>

namespace toolseek {

inline constexpr const char* kEmptyOutputPlaceholder = "(no output)";

// Opaque per-turn execution environment. Definitions made by one executed
// block stay visible to later blocks run against the same namespace.
class ExecutionNamespace {
 public:
  virtual ~ExecutionNamespace() = default;
};

class ICodeExecutor {
 public:
  virtual ~ICodeExecutor() = default;

  virtual std::unique_ptr<ExecutionNamespace> NewNamespace() = 0;

  // Runs source against ns and returns everything it printed. Faults in the
  // code and in the executor itself come back as text; this never throws.
  virtual std::string Execute(const std::string& source, ExecutionNamespace* ns) = 0;
};

// Runs code in a python3 worker process, one process per namespace. The
// worker is started on first use and killed when the namespace is destroyed.
class PythonExecutor : public ICodeExecutor {
 public:
  explicit PythonExecutor(std::string python_executable = "python3");

  std::unique_ptr<ExecutionNamespace> NewNamespace() override;
  std::string Execute(const std::string& source, ExecutionNamespace* ns) override;

 private:
  std::string python_executable_;
};

}  // namespace toolseek
