#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (ret == 0) {
      errno = EPIPE;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

// redirection fds are handed to the helper at these numbers
constexpr int kHelperFdBase = 3;
// above every fd the child moves into place
constexpr int kHelperFdScratch = 16;

} // namespace

bool SandboxSpawn(const SandboxOptions& opt, SpawnHandle& handle) {
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  // computed before fork; the child must not allocate
  const std::string cmd = SandboxHelperPath();
  const int fds[3] = {opt.fd_input, opt.fd_output, opt.fd_error};
  SandboxOptions sent = opt;
  sent.fd_input = fds[0] < 0 ? -1 : kHelperFdBase;
  sent.fd_output = fds[1] < 0 ? -1 : kHelperFdBase + 1;
  sent.fd_error = fds[2] < 0 ? -1 : kHelperFdBase + 2;
  auto vec = sent.Serialize();
  long size = vec.size();
  pid_t pid;
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    setpgid(0, 0);
    // move out of the way first so that no dup2 clobbers a source fd
    int moved[3];
    for (int i = 0; i < 3; i++) moved[i] = fds[i] < 0 ? -1 : fcntl(fds[i], F_DUPFD, kHelperFdScratch);
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    for (int i = 0; i < 3; i++) {
      if (fds[i] >= 0 && (moved[i] < 0 || dup2(moved[i], kHelperFdBase + i) < 0)) _exit(1);
    }
    CloseFrom(kHelperFdBase + 3);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  setpgid(pid, pid); // also done by the child; whichever runs first wins the race
  close(inpipe[1]);
  close(outpipe[0]);
  spdlog::debug("Helper spawned: pid={} boxdir={} uid={} command={}",
                pid, opt.boxdir, opt.uid, fmt::format("{}", opt.command));
  if (!WriteAll(outpipe[1], &size, sizeof(size)) || !WriteAll(outpipe[1], vec.data(), vec.size())) {
    spdlog::warn("Failed sending options to helper: pid={} errno={} {}", pid, errno, strerror(errno));
    close(outpipe[1]);
    close(inpipe[0]);
    kill(-pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    return false;
  }
  close(outpipe[1]);
  handle.pid = pid;
  handle.result_fd = inpipe[0];
  handle.uid = opt.uid;
  handle.start = std::chrono::steady_clock::now();
  return true;
err:
  spdlog::warn("SandboxSpawn error: errno={} {}", errno, strerror(errno));
  for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) {
    if (fd >= 0) close(fd);
  }
  return false;
}

bool CollectResult(SpawnHandle& handle, struct cjail_result& ret) {
  ret = {};
  if (!handle.Valid()) {
    ret.oomkill = ECHILD;
    ret.timekill = -1;
    return false;
  }
  bool ok = ReadAll(handle.result_fd, &ret, sizeof(ret));
  int err = errno;
  close(handle.result_fd);
  handle.result_fd = -1;
  if (!ok) {
    // the helper died without reporting; make sure nothing it started survives
    kill(-handle.pid, SIGKILL);
  }
  waitpid(handle.pid, nullptr, 0);
  if (!ok) {
    spdlog::warn("Helper returned no result: pid={} errno={} {}", handle.pid, err, strerror(err));
    ret = {};
    ret.oomkill = err;
    ret.timekill = -1;
  } else if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: pid={} errno={} {}", handle.pid, ret.oomkill, strerror(ret.oomkill));
  }
  handle.pid = -1;
  return ok && ret.timekill != -1;
}

void AbandonSpawn(SpawnHandle& handle) {
  if (handle.pid <= 0) return;
  spdlog::warn("Abandoning helper: pid={}", handle.pid);
  kill(-handle.pid, SIGKILL);
  if (handle.result_fd >= 0) {
    close(handle.result_fd);
    handle.result_fd = -1;
  }
  waitpid(handle.pid, nullptr, 0);
  handle.pid = -1;
}
