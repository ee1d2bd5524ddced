#ifndef CODEEXEC_UTILS_H_
#define CODEEXEC_UTILS_H_

#include <sys/types.h>
#include <string>
#include <vector>
#include <filesystem>

#include <codeexec/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// close every fd >= minfd; safe to call between fork and exec
int CloseFrom(int minfd);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// read at most max_len bytes; truncated is set if the file is longer
// Fails on anything but a regular file, without following a final symlink.
bool ReadFileCapped(const fs::path&, size_t max_len, std::string& content, bool* truncated = nullptr);
// close-on-exec, never through a final symlink; writing creates (0600) or truncates
// -1 on failure (logged)
int OpenCaptureFile(const fs::path&, bool write);
bool Chown(const fs::path&, int uid, int gid);

struct ProcStatus {
  char state; // R, S, Z, ...
  int uid; // real uid
  long rss_kib;
  int threads;
};
std::vector<pid_t> ListProcesses();
bool ReadProcStatus(pid_t, ProcStatus&);

// live (non-zombie) processes whose real uid is uid
std::vector<pid_t> ListUidProcesses(int uid);
// return the number of processes signalled
int KillUidProcesses(int uid, int sig);

#endif  // CODEEXEC_UTILS_H_
