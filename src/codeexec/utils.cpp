#include "utils.h"

#include <fcntl.h>
#include <dirent.h>
#include <signal.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

namespace {

std::atomic_long sandbox_id_seq = 0;

} // namespace

long GetUniqueSandboxId() {
  return ++sandbox_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG1(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusName, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusWire, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG3(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusDesc, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

std::string ExecutionStatusReason(ExecutionStatus status) {
  std::string ret = ExecutionStatusName(status);
  std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c){ return std::tolower(c); });
  return ret;
}

bool ReasonToExecutionStatus(const std::string& str, ExecutionStatus& status) {
  static const ExecutionStatus kStatusTable[] = {
#define X(name, wire, desc) ExecutionStatus::name,
    ENUM_EXECUTION_STATUS_
#undef X
  };
  for (auto i : kStatusTable) {
    if (str == ExecutionStatusReason(i)) {
      status = i;
      return true;
    }
  }
  return false;
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

bool ReadFileCapped(const fs::path& path, size_t max_len, std::string& content, bool* truncated) {
  // the jailed uid may have planted a link or a fifo under this name
  int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  struct stat st;
  size_t len = 0;
  char ch;
  if (fstat(fd, &st) < 0) goto err;
  if (!S_ISREG(st.st_mode)) {
    errno = EINVAL;
    goto err;
  }
  content.resize(max_len);
  while (len < max_len) {
    ssize_t ret = read(fd, content.data() + len, max_len - len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret < 0) goto err;
    if (ret == 0) break;
    len += ret;
  }
  content.resize(len);
  if (truncated) *truncated = len == max_len && read(fd, &ch, 1) > 0;
  close(fd);
  return true;
err:
  spdlog::warn("Failed reading {}: {}", path.c_str(), strerror(errno));
  close(fd);
  content.clear();
  return false;
}

int OpenCaptureFile(const fs::path& path, bool write) {
  int flags = write ? O_WRONLY | O_CREAT | O_TRUNC : O_RDONLY;
  int fd = open(path.c_str(), flags | O_NOFOLLOW | O_CLOEXEC, 0600);
  if (fd < 0) spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
  return fd;
}

bool Chown(const fs::path& path, int uid, int gid) {
  if (chown(path.c_str(), uid, gid) < 0) {
    spdlog::warn("Failed changing owner of {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

std::vector<pid_t> ListProcesses() {
  std::vector<pid_t> ret;
  DIR* dir = opendir("/proc");
  if (!dir) {
    spdlog::warn("Failed opening /proc: {}", strerror(errno));
    return ret;
  }
  for (struct dirent* dent; (dent = readdir(dir));) {
    if (!isdigit(dent->d_name[0])) continue;
    ret.push_back(strtol(dent->d_name, nullptr, 10));
  }
  closedir(dir);
  return ret;
}

bool ReadProcStatus(pid_t pid, ProcStatus& status) {
  // the process may exit at any time, so failures here are expected and not logged
  std::ifstream fin("/proc/" + std::to_string(pid) + "/status");
  if (!fin) return false;
  status = {'?', -1, 0, 0};
  std::string line;
  while (std::getline(fin, line)) {
    if (line.compare(0, 6, "State:") == 0) {
      size_t pos = line.find_first_not_of(" \t", 6);
      if (pos != std::string::npos) status.state = line[pos];
    } else if (line.compare(0, 4, "Uid:") == 0) {
      status.uid = strtol(line.c_str() + 4, nullptr, 10);
    } else if (line.compare(0, 6, "VmRSS:") == 0) {
      status.rss_kib = strtol(line.c_str() + 6, nullptr, 10);
    } else if (line.compare(0, 8, "Threads:") == 0) {
      status.threads = strtol(line.c_str() + 8, nullptr, 10);
    }
  }
  return status.uid != -1;
}

std::vector<pid_t> ListUidProcesses(int uid) {
  std::vector<pid_t> ret;
  for (pid_t pid : ListProcesses()) {
    ProcStatus status;
    if (ReadProcStatus(pid, status) && status.uid == uid && status.state != 'Z') ret.push_back(pid);
  }
  return ret;
}

int KillUidProcesses(int uid, int sig) {
  if (uid <= 0) return 0; // never signal root or an unassigned uid
  int cnt = 0;
  for (pid_t pid : ListUidProcesses(uid)) {
    if (kill(pid, sig) == 0) cnt++;
  }
  if (cnt) spdlog::debug("Signalled processes: uid={} sig={} count={}", uid, sig, cnt);
  return cnt;
}
