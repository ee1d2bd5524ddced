#include "utils.h"

#include <fcntl.h>
#include <sys/wait.h>
#include <filesystem>
#include <codeexec/paths.h>

#include "paths.h"
#include "sandbox.h"

bool JailAvailable() {
  return geteuid() == 0 && fs::exists(SandboxHelperPath());
}

bool ToolAvailable(const std::string& name) {
  for (const char* dir : {"/usr/bin", "/usr/local/bin", "/bin"}) {
    if (access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
  }
  return false;
}

ResourceLimits TestLimits() {
  return ResourceLimits(256L * 1024 * 1024, 5, 32, 8L * 1024 * 1024, 64L * 1024 * 1024);
}

ExecutionRequest MakeRequest(const std::string& language, const std::string& code, long timeout_sec) {
  ExecutionRequest req;
  req.language = language;
  req.code = code;
  req.timeout = timeout_sec * 1'000'000;
  return req;
}

bool ScriptedSampler::Sample(const SpawnHandle&, ProcessSample& sample) {
  calls++;
  if (samples_.empty()) return false;
  sample = samples_.front();
  if (samples_.size() > 1) samples_.pop_front();
  return true;
}

SpawnHandle ForkFakeHelper(const std::function<void(int)>& body) {
  SpawnHandle handle;
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) return handle;
  pid_t pid = fork();
  if (pid < 0) {
    close(fds[0]);
    close(fds[1]);
    return handle;
  }
  if (pid == 0) {
    setpgid(0, 0);
    close(fds[0]);
    body(fds[1]);
    _exit(0);
  }
  setpgid(pid, pid);
  close(fds[1]);
  handle.pid = pid;
  handle.result_fd = fds[0];
  handle.uid = -1;
  handle.start = std::chrono::steady_clock::now();
  return handle;
}

void WriteExitResult(int fd, int code) {
  struct cjail_result res = {};
  res.info.si_code = CLD_EXITED;
  res.info.si_status = code;
  if (write(fd, &res, sizeof(res)) < 0) _exit(1);
}

int CountPoolProcesses() {
  int cnt = 0;
  for (pid_t pid : ListProcesses()) {
    ProcStatus status;
    if (!ReadProcStatus(pid, status) || status.state == 'Z') continue;
    if (status.uid >= kUidBase && status.uid < kUidBase + kUidPoolSize) cnt++;
  }
  return cnt;
}
