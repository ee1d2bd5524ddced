#include "sandbox.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/statvfs.h>
#include <thread>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "limiter.h"

const int kUidBase = 50000, kUidPoolSize = 100;

ResourceLimits kPrepareLimits(1024L * 1024 * 1024, 120, 256, 0, 0);
long kPrepareWallTime = 120L * 1'000'000;

UidPool uid_pool(kUidBase, kUidPoolSize);

namespace {

using namespace std::chrono_literals;

constexpr int kCreateAttempts = 16;
constexpr int kKillRounds = 50;
// the jail gets a little more wall time than the monitor so that the monitor acts first
constexpr long kJailWallMargin = 2L * 1'000'000;

const std::vector<std::string> kRunDirs = {
  "/usr", "/lib", "/lib32", "/lib64", "/etc/alternatives", "/bin", "/sbin"};
// package managers need certificates, resolver config and device nodes
const std::vector<std::string> kPrepareDirs = {
  "/usr", "/lib", "/lib32", "/lib64", "/etc", "/var/lib", "/bin", "/sbin", "/dev"};

inline long ToKiB(long bytes) {
  return (bytes + 1023) / 1024;
}

void CloseRedirects(SandboxOptions& opt) {
  if (opt.fd_error >= 0 && opt.fd_error != opt.fd_output) close(opt.fd_error);
  if (opt.fd_output >= 0) close(opt.fd_output);
  if (opt.fd_input >= 0) close(opt.fd_input);
  opt.fd_input = opt.fd_output = opt.fd_error = -1;
}

} // namespace

UidPool::UidPool(int base, int size) {
  for (int i = size - 1; i >= 0; i--) pool_.push_back(base + i);
}

bool UidPool::Acquire(int& uid) {
  std::lock_guard lck(mtx_);
  if (pool_.empty()) return false;
  uid = pool_.back();
  pool_.pop_back();
  return true;
}

void UidPool::Release(int uid) {
  std::lock_guard lck(mtx_);
  pool_.push_back(uid);
}

size_t UidPool::Available() {
  std::lock_guard lck(mtx_);
  return pool_.size();
}

bool StepResult::Succeeded() const {
  return state == MonitorState::COMPLETED && result.timekill == 0 && result.oomkill <= 0 &&
      result.info.si_code == CLD_EXITED && result.info.si_status == 0;
}

Sandbox::Sandbox(long id, int uid, const ResourceLimits& limits) :
    id_(id), uid_(uid), limits_(limits), root_(SandboxPath(id)),
    created_(std::chrono::system_clock::now()), mounted_(false), torn_down_(false) {}

std::unique_ptr<Sandbox> Sandbox::Create(const ResourceLimits& limits) {
  int uid;
  if (!uid_pool.Acquire(uid)) {
    spdlog::warn("No available uid for a new sandbox");
    return nullptr;
  }
  if (!CreateDirs(kBoxRoot)) {
    uid_pool.Release(uid);
    return nullptr;
  }
  long id = -1;
  for (int i = 0; i < kCreateAttempts && id == -1; i++) {
    long nid = GetUniqueSandboxId();
    std::error_code ec;
    // create_directory returns false if it already exists; the root must be ours alone
    if (fs::create_directory(SandboxPath(nid), ec)) {
      id = nid;
    } else if (ec) {
      spdlog::warn("Failed creating sandbox root {}: {}", SandboxPath(nid).c_str(), ec.message());
      break;
    } else {
      spdlog::debug("Sandbox root {} exists, skipping", SandboxPath(nid).c_str());
    }
  }
  if (id == -1) {
    uid_pool.Release(uid);
    return nullptr;
  }
  // from here on the destructor reclaims everything
  std::unique_ptr<Sandbox> box(new Sandbox(id, uid, limits));
  auto workdir = box->Workdir();
  // the box root is the jail's / and holds the capture files; only the workdir belongs to uid
  if (!CreateDirs(box->root_, kPerm755) || !CreateDirs(workdir)) return nullptr;
  if (!MountTmpfs(workdir, ToKiB(limits.disk))) return nullptr;
  box->mounted_ = true;
  if (!CreateDirs(workdir, kPerm755) || !Chown(workdir, uid, uid) ||
      !CreateDirs(workdir / ".tmp", fs::perms::owner_all) || !Chown(workdir / ".tmp", uid, uid)) {
    return nullptr;
  }
  spdlog::info("Sandbox created: id={} uid={} root={} disk={}", id, uid, box->root_.c_str(), limits.disk);
  return box;
}

fs::path Sandbox::Workdir() const {
  return SandboxWorkdir(id_);
}
fs::path Sandbox::InputPath() const {
  return SandboxInput(id_);
}
fs::path Sandbox::OutputPath() const {
  return SandboxOutput(id_);
}
fs::path Sandbox::ErrorPath() const {
  return SandboxError(id_);
}
fs::path Sandbox::StepLogPath() const {
  return SandboxStepLog(id_);
}

bool Sandbox::WriteFile(const fs::path& relative, const std::string& content) {
  fs::path path = Workdir() / relative;
  if (relative.has_parent_path() && !CreateDirs(path.parent_path(), fs::perms::all)) return false;
  return ::WriteFile(path, content, kPerm666);
}

bool Sandbox::WriteInput(const std::string& content) {
  return ::WriteFile(InputPath(), content, fs::perms::owner_read | fs::perms::owner_write);
}

bool Sandbox::DiskExhausted() const {
  struct statvfs st;
  if (statvfs(Workdir().c_str(), &st) < 0) return false;
  return st.f_bavail == 0;
}

SandboxOptions Sandbox::Options(const std::vector<std::string>& command, const std::vector<std::string>& envs,
                                bool prepare) const {
  SandboxOptions opt;
  opt.boxdir = root_;
  opt.command = command;
  opt.envs = envs;
  opt.workdir = SandboxWorkdir(-1, true);
  opt.uid = opt.gid = uid_;
  opt.dirs = prepare ? kPrepareDirs : kRunDirs;
  opt.FilterDirs();
  return opt;
}

StepResult Sandbox::Run(SandboxOptions& opt, const ResourceLimits& limits, const MonitorLimits& mon_limits,
                        StatsSampler& sampler) {
  StepResult ret;
  SpawnHandle handle;
  opt.wall_time = mon_limits.wall_time + kJailWallMargin;
  // an invalid handle makes the monitor enter SPAWN_FAILED without sampling
  if (!SpawnLimited(limits, opt, handle)) {
    spdlog::warn("Spawn failed: id={} command={}", id_, opt.command.empty() ? "" : opt.command[0]);
  }
  CloseRedirects(opt);
  ProcessMonitor monitor(sampler, mon_limits);
  ret.state = monitor.Run(handle, ret.result);
  ret.stats = monitor.Stats();
  FillStats(ret.result, ret.stats);
  return ret;
}

StepResult Sandbox::RunStep(const std::vector<std::string>& command, const std::vector<std::string>& envs,
                            StatsSampler& sampler) {
  SandboxOptions opt = Options(command, envs, true);
  opt.input = "/dev/null";
  // one open file description, so that stdout and stderr interleave in order
  opt.fd_output = opt.fd_error = OpenCaptureFile(StepLogPath(), true);
  if (opt.fd_output < 0) return StepResult();
  ResourceLimits limits = kPrepareLimits;
  limits.file_size = limits.disk = limits_.disk;
  MonitorLimits mon_limits{kPrepareWallTime, kPrepareLimits.memory, kPrepareLimits.processes};
  auto ret = Run(opt, limits, mon_limits, sampler);
  spdlog::info("Step finished: id={} command={} state={} code={} status={}", id_, command[0],
               MonitorStateName(ret.state), ret.result.info.si_code, ret.result.info.si_status);
  return ret;
}

StepResult Sandbox::RunProgram(const std::vector<std::string>& command, const std::vector<std::string>& envs,
                               const MonitorLimits& mon_limits, StatsSampler& sampler) {
  SandboxOptions opt = Options(command, envs, false);
  opt.fd_input = OpenCaptureFile(InputPath(), false);
  opt.fd_output = OpenCaptureFile(OutputPath(), true);
  opt.fd_error = OpenCaptureFile(ErrorPath(), true);
  if (opt.fd_input < 0 || opt.fd_output < 0 || opt.fd_error < 0) {
    CloseRedirects(opt);
    return StepResult();
  }
  return Run(opt, limits_, mon_limits, sampler);
}

void Sandbox::Teardown() {
  if (torn_down_) return;
  torn_down_ = true;
  int round = 0;
  while (KillUidProcesses(uid_, SIGKILL) > 0) {
    if (++round >= kKillRounds) break;
    std::this_thread::sleep_for(20ms);
  }
  bool clean = ListUidProcesses(uid_).empty();
  auto workdir = Workdir();
  if (mounted_ && Umount(workdir)) mounted_ = false;
  RemoveAll(root_);
  if (clean) {
    uid_pool.Release(uid_);
  } else {
    // never hand a uid with live processes to another sandbox
    spdlog::warn("Processes survived teardown; uid {} is not returned to the pool", uid_);
  }
  spdlog::info("Sandbox removed: id={} uid={} lifetime={}ms", id_, uid_,
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now() - created_).count());
}
