#include <signal.h>
#include <atomic>
#include <thread>
#include <algorithm>
#include <vector>
#include <gtest/gtest.h>
#include <codeexec/paths.h>
#include <codeexec/pipeline.h>

#include "outcome.h"
#include "sandbox.h"
#include "languages.h"
#include "utils.h"

using namespace std::chrono_literals;

namespace {

const long kMiB = 1024 * 1024;

struct OutcomeParam {
  std::string name;
  MonitorState state;
  int timekill, oomkill;
  int signal, exit_code;
  long peak_memory;
  bool disk_exhausted;
  std::string stderr_str;
  ExecutionStatus expected;
};

std::string ParamName(const ::testing::TestParamInfo<OutcomeParam>& info) {
  return info.param.name;
}

// A language whose preparation is one shell step; tests that step output never reaches stdout
class ShellStepExecutor : public LanguageExecutor {
  std::string step_;
 public:
  explicit ShellStepExecutor(std::string step) : step_(std::move(step)) {}
  std::string Language() const override { return "shell-step"; }
  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!box.WriteFile("main.sh", req.code)) return ExecutionStatus::SETUP_ERROR;
    if (auto st = RunPrepareStep(box, sampler, {"/bin/sh", "-c", step_}, false, message);
        st != ExecutionStatus::SUCCESS) {
      return st;
    }
    spec = {{"/bin/sh", "main.sh"}, RunEnvs(req)};
    return ExecutionStatus::SUCCESS;
  }
};

size_t BoxRootEntries() {
  size_t cnt = 0;
  std::error_code ec;
  for (fs::directory_iterator it(kBoxRoot, ec), end; !ec && it != end; it.increment(ec)) cnt++;
  return cnt;
}

bool BoxRootEmpty() {
  std::error_code ec;
  return !fs::exists(kBoxRoot, ec) || fs::is_empty(kBoxRoot, ec);
}

class PipelineTest : public ::testing::Test {
 protected:
  AdmissionGate gate;
  ExecutorRegistry registry;
  ExecutionPipeline pipeline;

  PipelineTest() : gate(4), pipeline(gate, registry, TestLimits()) {
    RegisterDefaultExecutors(registry);
  }
  ExecutionResult Run(const ExecutionRequest& req) {
    return pipeline.Execute(req, TestLimits());
  }
  void TearDown() override {
    EXPECT_EQ(gate.InUse(), 0);
    EXPECT_TRUE(BoxRootEmpty());
  }
};

class JailedPipelineTest : public PipelineTest {
 protected:
  void TearDown() override {
    PipelineTest::TearDown();
    if (JailAvailable()) EXPECT_EQ(CountPoolProcesses(), 0);
  }
};

} // namespace

class Outcome : public testing::TestWithParam<OutcomeParam> {};
TEST_P(Outcome, Classify) {
  auto& param = GetParam();
  StepResult res;
  res.state = param.state;
  res.result.timekill = param.timekill;
  res.result.oomkill = param.oomkill;
  res.stats.signal = param.signal;
  res.stats.exit_code = param.exit_code;
  res.stats.peak_memory = param.peak_memory;
  std::vector<std::string> markers = {"MemoryError"};
  EXPECT_EQ(ClassifyOutcome(res, TestLimits(), param.disk_exhausted, param.stderr_str, markers),
            param.expected);
}
INSTANTIATE_TEST_SUITE_P(States, Outcome,
    testing::Values(
      (OutcomeParam){"success", MonitorState::COMPLETED, 0, 0, 0, 0, kMiB, false, "",
                     ExecutionStatus::SUCCESS},
      (OutcomeParam){"exit_code", MonitorState::COMPLETED, 0, 0, 0, 1, kMiB, false, "Traceback",
                     ExecutionStatus::RUNTIME_ERROR},
      (OutcomeParam){"signal", MonitorState::COMPLETED, 0, 0, SIGSEGV, 128 + SIGSEGV, kMiB, false, "",
                     ExecutionStatus::RUNTIME_ERROR},
      (OutcomeParam){"monitor_timeout", MonitorState::TIMED_OUT, 0, 0, SIGKILL, 128 + SIGKILL, kMiB, false, "",
                     ExecutionStatus::TIMEOUT},
      (OutcomeParam){"jail_timeout", MonitorState::COMPLETED, 1, 0, SIGKILL, 128 + SIGKILL, kMiB, false, "",
                     ExecutionStatus::TIMEOUT},
      (OutcomeParam){"monitor_limit", MonitorState::LIMIT_EXCEEDED, 0, 0, SIGTERM, 128 + SIGTERM, kMiB, false, "",
                     ExecutionStatus::RESOURCE_EXCEEDED},
      (OutcomeParam){"cgroup_oom", MonitorState::COMPLETED, 0, 1, SIGKILL, 128 + SIGKILL, kMiB, false, "",
                     ExecutionStatus::RESOURCE_EXCEEDED},
      (OutcomeParam){"file_size", MonitorState::COMPLETED, 0, 0, SIGXFSZ, 128 + SIGXFSZ, kMiB, false, "",
                     ExecutionStatus::RESOURCE_EXCEEDED},
      (OutcomeParam){"peak_memory", MonitorState::COMPLETED, 0, 0, 0, 0, 1024 * kMiB, false, "",
                     ExecutionStatus::RESOURCE_EXCEEDED},
      (OutcomeParam){"disk_full", MonitorState::COMPLETED, 0, 0, 0, 1, kMiB, true, "No space left on device",
                     ExecutionStatus::RESOURCE_EXCEEDED},
      (OutcomeParam){"oom_marker", MonitorState::COMPLETED, 0, 0, 0, 1, kMiB, false, "raise MemoryError\nMemoryError",
                     ExecutionStatus::RESOURCE_EXCEEDED},
      (OutcomeParam){"oom_marker_on_success", MonitorState::COMPLETED, 0, 0, 0, 0, kMiB, false, "MemoryError",
                     ExecutionStatus::SUCCESS},
      (OutcomeParam){"spawn_failed", MonitorState::SPAWN_FAILED, -1, 2, 0, 0, 0, false, "",
                     ExecutionStatus::SETUP_ERROR},
      (OutcomeParam){"jail_error", MonitorState::COMPLETED, -1, 2, 0, 0, 0, false, "",
                     ExecutionStatus::SETUP_ERROR}
    ),
    ParamName);

TEST_F(PipelineTest, BusyWhenFull) {
  ASSERT_TRUE(gate.TryAcquire());
  ASSERT_TRUE(gate.TryAcquire());
  ASSERT_TRUE(gate.TryAcquire());
  ASSERT_TRUE(gate.TryAcquire());
  auto req = MakeRequest("python", "print(1)");
  req.timeout = 100'000;
  auto start = std::chrono::steady_clock::now();
  auto res = Run(req);
  EXPECT_EQ(res.status, ExecutionStatus::BUSY);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
  for (int i = 0; i < 4; i++) gate.Release();
}

TEST_F(PipelineTest, LimitsOverMaxima) {
  auto limits = TestLimits();
  limits.memory *= 2;
  auto res = pipeline.Execute(MakeRequest("python", "print(1)"), limits);
  EXPECT_EQ(res.status, ExecutionStatus::SETUP_ERROR);
  EXPECT_NE(res.stderr_str.find("memory"), std::string::npos) << res.stderr_str;
  EXPECT_EQ(gate.PeakInUse(), 1);
}

TEST_F(PipelineTest, TimeoutOutOfRange) {
  EXPECT_EQ(Run(MakeRequest("python", "print(1)", 0)).status, ExecutionStatus::SETUP_ERROR);
  EXPECT_EQ(Run(MakeRequest("python", "print(1)", kMaxTimeout / 1'000'000 + 1)).status,
            ExecutionStatus::SETUP_ERROR);
}

TEST_F(PipelineTest, UnsupportedLanguage) {
  auto res = Run(MakeRequest("cobol", "DISPLAY 'HI'."));
  EXPECT_EQ(res.status, ExecutionStatus::UNSUPPORTED_LANGUAGE);
  EXPECT_EQ(res.stderr_str, "unsupported language: cobol");
  EXPECT_EQ(res.stats.exit_code, 0);
}

TEST_F(JailedPipelineTest, PythonHello) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto res = Run(MakeRequest("python", "print('Hello, World!')"));
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str << res.message;
  EXPECT_EQ(res.stdout_str, "Hello, World!\n");
  EXPECT_EQ(res.stderr_str, "");
  EXPECT_EQ(res.stats.exit_code, 0);
  EXPECT_GT(res.stats.wall_time, 0);
  EXPECT_GT(res.stats.peak_memory, 0);
}

TEST_F(JailedPipelineTest, PythonStdin) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto req = MakeRequest("python", "import sys\nprint(sys.stdin.read()[::-1], end='')");
  req.has_input = true;
  req.input = "abc";
  auto res = Run(req);
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str;
  EXPECT_EQ(res.stdout_str, "cba");
}

TEST_F(JailedPipelineTest, PythonRuntimeError) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto res = Run(MakeRequest("python", "import sys\nprint('before')\nsys.exit(3)"));
  EXPECT_EQ(res.status, ExecutionStatus::RUNTIME_ERROR);
  EXPECT_EQ(res.stdout_str, "before\n");
  EXPECT_EQ(res.stats.exit_code, 3);
}

TEST_F(JailedPipelineTest, PythonTimeout) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto start = std::chrono::steady_clock::now();
  auto res = Run(MakeRequest("python", "while True:\n    pass", 1));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.status, ExecutionStatus::TIMEOUT);
  EXPECT_GE(res.stats.wall_time, 1'000'000);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(JailedPipelineTest, PythonMemory) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto limits = TestLimits();
  limits.memory = 64 * kMiB;
  auto res = pipeline.Execute(MakeRequest("python", "x = b'x' * (512 * 1024 * 1024)\nprint(len(x))"), limits);
  EXPECT_EQ(res.status, ExecutionStatus::RESOURCE_EXCEEDED) << res.stderr_str;
  EXPECT_EQ(res.stdout_str, "");
}

TEST_F(JailedPipelineTest, OutputTruncated) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  size_t old = kMaxCapturedOutput;
  kMaxCapturedOutput = 1000;
  auto res = Run(MakeRequest("python", "print('x' * 5000)"));
  kMaxCapturedOutput = old;
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS);
  EXPECT_EQ(res.stdout_str, std::string(1000, 'x') + kTruncationMarker);
}

TEST_F(JailedPipelineTest, BackgroundProcessesAreKilled) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto res = Run(MakeRequest("python",
      "import subprocess\n"
      "subprocess.Popen(['sleep', '60'], start_new_session=True)\n"
      "print('detached')"));
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str;
  EXPECT_EQ(res.stdout_str, "detached\n");
}

TEST_F(JailedPipelineTest, ConcurrencyIsBounded) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  constexpr int kRequests = 10;
  const size_t free_uids = uid_pool.Available();
  std::atomic_bool done = false;
  size_t max_boxes = 0, max_uids = 0;
  // watches what actually exists on the machine, not the gate's own counter
  std::thread watcher([&] {
    while (!done) {
      max_boxes = std::max(max_boxes, BoxRootEntries());
      max_uids = std::max(max_uids, free_uids - uid_pool.Available());
      std::this_thread::sleep_for(5ms);
    }
  });
  std::vector<ExecutionStatus> statuses(kRequests, ExecutionStatus::SETUP_ERROR);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRequests; i++) {
    threads.emplace_back([&, i] {
      statuses[i] = Run(MakeRequest("python", "import time\ntime.sleep(1)", 30)).status;
    });
  }
  for (auto& i : threads) i.join();
  done = true;
  watcher.join();
  for (auto i : statuses) EXPECT_EQ(i, ExecutionStatus::SUCCESS);
  EXPECT_LE(max_boxes, (size_t)gate.Capacity());
  EXPECT_LE(max_uids, (size_t)gate.Capacity());
  EXPECT_GE(max_uids, 2u);
  EXPECT_EQ(gate.PeakInUse(), gate.Capacity());
  EXPECT_EQ(uid_pool.Available(), free_uids);
}

TEST_F(JailedPipelineTest, ConcurrentExecutionsAreIsolated) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  ExecutionResult first, second;
  // the first one writes a file and exits while the second is still running
  std::thread a([&] {
    first = Run(MakeRequest("python",
        "import os\n"
        "open('secret.txt', 'w').write('first')\n"
        "print(os.getuid())"));
  });
  std::thread b([&] {
    second = Run(MakeRequest("python",
        "import os, time\n"
        "time.sleep(0.5)\n"
        "print(os.path.exists('secret.txt'), os.path.exists('/workdir/secret.txt'))\n"
        "time.sleep(1)\n"
        "print(os.getuid())"));
  });
  a.join();
  b.join();
  ASSERT_EQ(first.status, ExecutionStatus::SUCCESS) << first.stderr_str;
  ASSERT_EQ(second.status, ExecutionStatus::SUCCESS) << second.stderr_str;
  auto pos = second.stdout_str.find('\n');
  ASSERT_NE(pos, std::string::npos) << second.stdout_str;
  EXPECT_EQ(second.stdout_str.substr(0, pos), "False False");
  EXPECT_NE(second.stdout_str.substr(pos + 1), first.stdout_str);
  EXPECT_LT(first.stats.wall_time, second.stats.wall_time);
}

TEST_F(JailedPipelineTest, CaptureFilesCannotBeReplaced) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto req = MakeRequest("python",
      "import os\n"
      "for name in ('/.stdout', '/.stderr', '/.stdin'):\n"
      "    try:\n"
      "        os.unlink(name)\n"
      "        print('removed', name)\n"
      "    except OSError:\n"
      "        pass\n"
      "os.symlink('/etc/hostname', '.stdout')\n"
      "os.mkfifo('.stderr')\n"
      "print('captured')");
  req.has_input = true;
  req.input = "in";
  auto start = std::chrono::steady_clock::now();
  auto res = Run(req);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str << res.message;
  EXPECT_EQ(res.stdout_str, "captured\n");
  EXPECT_EQ(res.stderr_str, "");
}

TEST_F(JailedPipelineTest, StepOutputIsNotProgramOutput) {
  SKIP_WITHOUT_JAIL();
  registry.Register(std::make_unique<ShellStepExecutor>("echo installing; echo warning >&2"));
  auto res = Run(MakeRequest("shell-step", "echo run"));
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str << res.message;
  EXPECT_EQ(res.stdout_str, "run\n");
  EXPECT_EQ(res.stderr_str, "");
}

TEST_F(JailedPipelineTest, FailedStepReportsItsLog) {
  SKIP_WITHOUT_JAIL();
  registry.Register(std::make_unique<ShellStepExecutor>("echo resolving; echo 'no such package' >&2; exit 1"));
  auto res = Run(MakeRequest("shell-step", "echo run"));
  EXPECT_EQ(res.status, ExecutionStatus::SETUP_ERROR);
  EXPECT_EQ(res.stdout_str, "");
  EXPECT_EQ(res.message, "resolving\nno such package\n");
}

TEST_F(JailedPipelineTest, PythonDependencyInstallFailure) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("python3");
  auto req = MakeRequest("python", "print('never runs')", 60);
  req.dependencies = {{"codeexec-no-such-package-0c8f", "1.0.0", ""}};
  auto res = Run(req);
  // venv creation or pip fails; either way nothing runs and the installer output is only in the message
  EXPECT_EQ(res.status, ExecutionStatus::SETUP_ERROR);
  EXPECT_EQ(res.stdout_str, "");
  EXPECT_FALSE(res.message.empty());
}

TEST_F(JailedPipelineTest, CppCompileError) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("g++");
  auto res = Run(MakeRequest("cpp", "int main() { return }", 30));
  EXPECT_EQ(res.status, ExecutionStatus::RUNTIME_ERROR);
  EXPECT_NE(res.stderr_str.find("error"), std::string::npos) << res.stderr_str;
  EXPECT_EQ(res.stdout_str, "");
}

TEST_F(JailedPipelineTest, CppRun) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("g++");
  auto req = MakeRequest("cpp",
      "#include <iostream>\nint main() { int a, b; std::cin >> a >> b; std::cout << a + b << '\\n'; }", 30);
  req.has_input = true;
  req.input = "2 3\n";
  auto res = Run(req);
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str << res.message;
  EXPECT_EQ(res.stdout_str, "5\n");
}

TEST_F(JailedPipelineTest, CppRejectsDependencies) {
  SKIP_WITHOUT_JAIL();
  auto req = MakeRequest("cpp", "int main() {}");
  req.dependencies = {{"boost", "1.84", ""}};
  auto res = Run(req);
  EXPECT_EQ(res.status, ExecutionStatus::SETUP_ERROR);
  EXPECT_NE(res.message.find("dependencies"), std::string::npos) << res.message;
}

TEST_F(JailedPipelineTest, JavaRejectsBadCoordinate) {
  SKIP_WITHOUT_JAIL();
  auto req = MakeRequest("java", "public class Main { public static void main(String[] a) {} }");
  req.dependencies = {{"gson", "2.10.1", ""}};
  auto res = Run(req);
  EXPECT_EQ(res.status, ExecutionStatus::SETUP_ERROR);
  EXPECT_NE(res.message.find("groupId:artifactId"), std::string::npos) << res.message;
}

TEST_F(JailedPipelineTest, SwiftDependencyNeedsUrl) {
  SKIP_WITHOUT_JAIL();
  auto req = MakeRequest("swift", "print(1)");
  req.dependencies = {{"ArgumentParser", "1.3.0", ""}};
  auto res = Run(req);
  EXPECT_EQ(res.status, ExecutionStatus::SETUP_ERROR);
  EXPECT_NE(res.message.find("package url"), std::string::npos) << res.message;
}

TEST_F(JailedPipelineTest, JavaRun) {
  SKIP_WITHOUT_JAIL();
  SKIP_WITHOUT_TOOL("javac");
  auto res = Run(MakeRequest("java",
      "public class Main { public static void main(String[] a) { System.out.println(\"hi\"); } }", 60));
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS) << res.stderr_str << res.message;
  EXPECT_EQ(res.stdout_str, "hi\n");
}
