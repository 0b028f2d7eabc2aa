#include <gtest/gtest.h>

#include "code_executor.hpp"

#include <memory>
#include <string>

using namespace toolseek;

class PythonExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { ns = executor.NewNamespace(); }

  std::string Run(const std::string& code) { return executor.Execute(code, ns.get()); }

  PythonExecutor executor;
  std::unique_ptr<ExecutionNamespace> ns;
};

TEST_F(PythonExecutorTest, CapturesPrintedOutput) {
  EXPECT_EQ(Run("print(2+2)"), "4\n");
}

TEST_F(PythonExecutorTest, BareExpressionIsEchoed) {
  EXPECT_EQ(Run("6*7"), "42\n");
  EXPECT_EQ(Run("'a' + 'b'"), "'ab'\n");
}

TEST_F(PythonExecutorTest, SilentCodeYieldsPlaceholder) {
  EXPECT_EQ(Run("x = 1"), kEmptyOutputPlaceholder);
  EXPECT_EQ(Run("None"), kEmptyOutputPlaceholder);
}

TEST_F(PythonExecutorTest, DefinitionsPersistWithinNamespace) {
  Run("import math\nr = 3");
  Run("def area(x):\n    return math.pi * x * x");
  EXPECT_EQ(Run("print(round(area(r), 2))"), "28.27\n");
}

TEST_F(PythonExecutorTest, NamespacesAreIsolated) {
  Run("secret = 1");
  auto other = executor.NewNamespace();
  const auto out = executor.Execute("print(secret)", other.get());
  EXPECT_NE(out.find("NameError"), std::string::npos) << out;
}

TEST_F(PythonExecutorTest, ExceptionsComeBackAsTraceback) {
  const auto out = Run("print('before')\n1/0");
  EXPECT_NE(out.find("before"), std::string::npos) << out;
  EXPECT_NE(out.find("Traceback"), std::string::npos) << out;
  EXPECT_NE(out.find("ZeroDivisionError"), std::string::npos) << out;
  EXPECT_EQ(Run("print('still here')"), "still here\n");
}

TEST_F(PythonExecutorTest, SyntaxErrorIsReported) {
  const auto out = Run("def broken(:\n  pass");
  EXPECT_NE(out.find("SyntaxError"), std::string::npos) << out;
}

TEST_F(PythonExecutorTest, StdinIsEmpty) {
  const auto out = Run("input()");
  EXPECT_NE(out.find("EOFError"), std::string::npos) << out;
}

TEST_F(PythonExecutorTest, StderrIsCaptured) {
  EXPECT_EQ(Run("import sys\nprint('warn', file=sys.stderr)"), "warn\n");
}

TEST_F(PythonExecutorTest, SystemExitDoesNotKillWorker) {
  const auto out = Run("raise SystemExit(3)");
  EXPECT_NE(out.find("SystemExit"), std::string::npos) << out;
  EXPECT_EQ(Run("print('alive')"), "alive\n");
}

TEST_F(PythonExecutorTest, IndentedBlockIsDedented) {
  EXPECT_EQ(Run("\n    x = 2\n    print(x + 1)\n"), "3\n");
}

TEST_F(PythonExecutorTest, WorkerDeathIsReportedAndRecovered) {
  Run("kept = 1");
  const auto out = Run("import os\nos._exit(1)");
  EXPECT_EQ(out.rfind("[execution error]", 0), 0u) << out;
  EXPECT_EQ(Run("print('fresh')"), "fresh\n");
  EXPECT_NE(Run("print(kept)").find("NameError"), std::string::npos);
}

TEST(PythonExecutor, MissingInterpreterIsAnError) {
  PythonExecutor executor("/nonexistent/toolseek-python");
  auto ns = executor.NewNamespace();
  const auto out = executor.Execute("print(1)", ns.get());
  EXPECT_EQ(out.rfind("[execution error]", 0), 0u) << out;
}
