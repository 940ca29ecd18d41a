#include <thread>
#include <vector>
#include <fstream>
#include <gtest/gtest.h>
#include <snipbox/paths.h>
#include <snipbox/engine.h>
#include <snipbox/pipeline.h>
#include <snipbox/artifacts.h>
#include "utils.h"

class EngineTest : public SandboxTest {
 protected:
  long saved_time_limit_, saved_rss_, saved_output_;

  void SetUp() override {
    SandboxTest::SetUp();
    saved_time_limit_ = kTimeLimitMs;
    saved_rss_ = kMaxRSS;
    saved_output_ = kMaxOutput;
  }
  void TearDown() override {
    kTimeLimitMs = saved_time_limit_;
    kMaxRSS = saved_rss_;
    kMaxOutput = saved_output_;
  }

  ExecutionResult RunSource(const std::string& source) {
    SourceUnit unit = MaterializeOrDie(source);
    ExecutionResult res = ::Run(unit);
    Discard(unit);
    return res;
  }
};

TEST_F(EngineTest, Hello) {
  ExecutionResult res = RunSource("print('hello')\n");
  EXPECT_TRUE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::OK);
  EXPECT_EQ(res.output, "hello\n");
  EXPECT_EQ(res.error, "");
  EXPECT_FALSE(res.exception);
}

TEST_F(EngineTest, StderrCaptured) {
  ExecutionResult res = RunSource("import sys\nsys.stderr.write('warn\\n')\nprint('out')\n");
  EXPECT_TRUE(res.succeeded);
  EXPECT_EQ(res.output, "out\n");
  EXPECT_EQ(res.error, "warn\n");
}

TEST_F(EngineTest, PartialOutputThenException) {
  ExecutionResult res = RunSource("print('before')\nraise ValueError('bad value')\n");
  EXPECT_FALSE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.output, "before\n");
  ASSERT_TRUE(res.exception);
  EXPECT_NE(res.exception->find("Traceback (most recent call last):"), std::string::npos);
  EXPECT_NE(res.exception->find("ValueError: bad value"), std::string::npos);
  EXPECT_NE(res.exception->find("line 2"), std::string::npos);
  EXPECT_EQ(res.exception->find('/'), std::string::npos);
}

TEST_F(EngineTest, NestedFrames) {
  ExecutionResult res = RunSource("def f():\n    return {}['missing']\n\ndef g():\n    return f()\n\ng()\n");
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  ASSERT_TRUE(res.exception);
  EXPECT_NE(res.exception->find("in g"), std::string::npos);
  EXPECT_NE(res.exception->find("in f"), std::string::npos);
  EXPECT_NE(res.exception->find("KeyError"), std::string::npos);
  EXPECT_EQ(res.exception->find('/'), std::string::npos);
  EXPECT_EQ(res.exception->find("\n\n"), std::string::npos);
}

TEST_F(EngineTest, SystemExit) {
  ExecutionResult res = RunSource("import sys\nprint('a')\nsys.exit(0)\nprint('b')\n");
  EXPECT_TRUE(res.succeeded);
  EXPECT_EQ(res.output, "a\n");
  EXPECT_FALSE(res.exception);

  res = RunSource("import sys\nsys.exit(3)\n");
  EXPECT_FALSE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.exception, "SystemExit: 3");
}

TEST_F(EngineTest, FreshGlobals) {
  ExecutionResult res = RunSource("print(__name__)\nprint([k for k in dir() if not k.startswith('__')])\n");
  EXPECT_TRUE(res.succeeded);
  EXPECT_EQ(res.output, "__main__\n[]\n");
}

TEST_F(EngineTest, NoSiblingImports) {
  SourceUnit helper = MaterializeOrDie("VALUE = 42\n");
  std::string module = helper.Id().substr(0, helper.Id().size() - 3);
  ExecutionResult res = RunSource("import " + module + "\nprint(" + module + ".VALUE)\n");
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  ASSERT_TRUE(res.exception);
  EXPECT_NE(res.exception->find("ModuleNotFoundError"), std::string::npos);
  Discard(helper);
}

TEST_F(EngineTest, FreshResultEveryRun) {
  SourceUnit unit = MaterializeOrDie("import time\nprint(time.time_ns())\n");
  ExecutionResult first = ::Run(unit);
  ExecutionResult second = ::Run(unit);
  EXPECT_TRUE(first.succeeded);
  EXPECT_TRUE(second.succeeded);
  EXPECT_NE(first.output, second.output);
  Discard(unit);
}

TEST_F(EngineTest, Timeout) {
  kTimeLimitMs = 1000;
  ExecutionResult res = RunSource("print('spin', flush=True)\nwhile True:\n    pass\n");
  EXPECT_FALSE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::TIMEOUT);
  EXPECT_EQ(res.output, "spin\n");
}

TEST_F(EngineTest, MemoryLimit) {
  kMaxRSS = 64 * 1024;
  ExecutionResult res = RunSource("x = bytearray(512 << 20)\nprint(len(x))\n");
  EXPECT_FALSE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::MEMORY_LIMIT);
}

TEST_F(EngineTest, OutputLimit) {
  kMaxOutput = 16;
  ExecutionResult res = RunSource("while True:\n    print('x' * 1000)\n");
  EXPECT_FALSE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.exception, "Output limit exceeded (16 KiB)");
  EXPECT_LE(res.output.size(), 16 * 1024 + 100u);
  EXPECT_NE(res.output.find("[Output truncated after 16 KiB]"), std::string::npos);
}

TEST_F(EngineTest, OutputLimitSwallowed) {
  kMaxOutput = 16;
  ExecutionResult res = RunSource(
      "try:\n"
      "    while True:\n"
      "        print('x' * 1000)\n"
      "except OSError:\n"
      "    pass\n");
  EXPECT_FALSE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.exception, "Output limit exceeded (16 KiB)");
  EXPECT_NE(res.output.find("[Output truncated after 16 KiB]"), std::string::npos);
}

TEST_F(EngineTest, OutputBelowLimit) {
  kMaxOutput = 16;
  ExecutionResult res = RunSource("print('x' * 1000)\n");
  EXPECT_TRUE(res.succeeded);
  EXPECT_EQ(res.output, std::string(1000, 'x') + "\n");
}

// Captured output may be charged to the box's cgroup; it must not count as the snippet's memory
TEST_F(EngineTest, LargeOutputIsNotMemory) {
  kMaxRSS = 48 * 1024;
  kMaxOutput = 1024;
  ExecutionResult res = RunSource("for i in range(1000):\n    print('x' * 1000)\n");
  EXPECT_TRUE(res.succeeded);
  EXPECT_EQ(res.outcome, Outcome::OK);
  EXPECT_EQ(res.output.size(), 1000u * 1001);
}

// Replacing the capture files inside the box must not make the host file show up in the result
TEST_F(EngineTest, CaptureCannotBeRedirected) {
  fs::path secret = kUnitRoot / "host_secret";
  {
    std::ofstream fout(secret);
    fout << "HOST-ONLY SECRET";
  }
  std::string source =
      "import os\n"
      "for name in os.listdir('/workdir'):\n"
      "    if not name.endswith('.py'):\n"
      "        os.unlink('/workdir/' + name)\n"
      "for name in ('stdout', 'stderr', 'exception', 'message', 'error'):\n"
      "    try:\n"
      "        os.symlink('" + secret.string() + "', '/workdir/' + name)\n"
      "    except OSError:\n"
      "        pass\n"
      "print('done')\n"
      "raise ValueError('after symlinks')\n";
  ExecutionResult res = RunSource(source);
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.output, "done\n");
  ASSERT_TRUE(res.exception);
  EXPECT_NE(res.exception->find("ValueError: after symlinks"), std::string::npos);
  EXPECT_EQ(res.output.find("SECRET"), std::string::npos);
  EXPECT_EQ(res.error.find("SECRET"), std::string::npos);
  EXPECT_EQ(res.exception->find("SECRET"), std::string::npos);
  fs::remove(secret);
}

TEST_F(EngineTest, SyntaxErrorAtRun) {
  ExecutionResult res = RunSource("print('x'\n");
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  ASSERT_TRUE(res.exception);
  EXPECT_NE(res.exception->find("SyntaxError"), std::string::npos);
  EXPECT_EQ(res.exception->find('/'), std::string::npos);
}

// Sandboxes started from several threads at once, with the reaper thread alive, each see only
//   their own streams
TEST_F(EngineTest, ConcurrentRuns) {
  constexpr int kThreads = 4;
  Reaper reaper(std::chrono::seconds(3600));
  std::vector<ExecutionResult> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&results, i]() {
      SourceUnit unit = MaterializeOrDie(
          "import os, sys\n"
          "for fd in range(3, 64):\n"
          "    try:\n"
          "        os.write(fd, b'stray')\n"
          "    except OSError:\n"
          "        pass\n"
          "print(" + std::to_string(i) + ")\n"
          "sys.stderr.write('e" + std::to_string(i) + "')\n");
      results[i] = ::Run(unit);
      Discard(unit);
    });
  }
  for (auto& i : threads) i.join();
  for (int i = 0; i < kThreads; i++) {
    EXPECT_TRUE(results[i].succeeded) << i;
    EXPECT_EQ(results[i].output, std::to_string(i) + "\n");
    EXPECT_EQ(results[i].error, "e" + std::to_string(i));
    EXPECT_FALSE(results[i].exception);
  }
}
