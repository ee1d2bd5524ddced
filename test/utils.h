#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <unistd.h>
#include <deque>
#include <string>
#include <functional>
#include <gtest/gtest.h>
#include <codeexec/request.h>

#include "monitor.h"

// Jail tests need root, the sandbox-exec helper next to the test binary, and the toolchain.
bool JailAvailable();
bool ToolAvailable(const std::string& name);

#define SKIP_WITHOUT_JAIL() \
  if (!JailAvailable()) GTEST_SKIP() << "requires root and sandbox-exec"
#define SKIP_WITHOUT_TOOL(name) \
  if (!ToolAvailable(name)) GTEST_SKIP() << "requires " << name

// limits small enough to keep the tests fast
ResourceLimits TestLimits();
ExecutionRequest MakeRequest(const std::string& language, const std::string& code, long timeout_sec = 5);

// Returns samples in order; the last one repeats
class ScriptedSampler : public StatsSampler {
  std::deque<ProcessSample> samples_;
 public:
  int calls = 0;

  explicit ScriptedSampler(std::initializer_list<ProcessSample> samples) : samples_(samples) {}
  bool Sample(const SpawnHandle&, ProcessSample& sample) override;
};

// Fork a process group leader that runs body and exits. It stands in for the helper:
// body may write a cjail_result to the fd it is given.
SpawnHandle ForkFakeHelper(const std::function<void(int)>& body);
// write a result of a normal exit with status code
void WriteExitResult(int fd, int code);

// processes running as any uid of the sandbox uid pool
int CountPoolProcesses();

#endif // TEST_UTILS_H_
