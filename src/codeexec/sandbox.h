#ifndef CODEEXEC_SANDBOX_H_
#define CODEEXEC_SANDBOX_H_

#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <codeexec/request.h>
#include "utils.h"
#include "monitor.h"
#include "sandbox_options.h"

extern const int kUidBase, kUidPoolSize;

// limits of dependency installation and compilation steps
extern ResourceLimits kPrepareLimits;
extern long kPrepareWallTime; // us

class UidPool {
  std::mutex mtx_;
  std::vector<int> pool_;
 public:
  UidPool(int base, int size);
  bool Acquire(int& uid);
  void Release(int uid);
  size_t Available();
};
extern UidPool uid_pool;

struct StepResult {
  MonitorState state;
  struct cjail_result result;
  ProcessStats stats;

  StepResult() : state(MonitorState::SPAWN_FAILED), result{}, stats() {}
  // exited by itself with status 0
  bool Succeeded() const;
};

// One execution's box: kBoxRoot/<id> with a tmpfs workdir and a uid of its own.
// Everything is reclaimed by the destructor.
class Sandbox {
  long id_;
  int uid_;
  ResourceLimits limits_;
  fs::path root_;
  std::chrono::system_clock::time_point created_;
  bool mounted_;
  bool torn_down_;

  Sandbox(long id, int uid, const ResourceLimits& limits);
 public:
  // nullptr if the box cannot be set up (logged)
  static std::unique_ptr<Sandbox> Create(const ResourceLimits&);
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  ~Sandbox() { Teardown(); }

  long Id() const { return id_; }
  int Uid() const { return uid_; }
  const ResourceLimits& Limits() const { return limits_; }
  const fs::path& Root() const { return root_; }
  fs::path Workdir() const;

  // Capture files: root-owned, mode 600, in the box root but outside the workdir.
  // The jail only gets descriptors of them, so the program can neither replace nor read them.
  fs::path InputPath() const;
  fs::path OutputPath() const;
  fs::path ErrorPath() const;
  fs::path StepLogPath() const;

  // relative to the workdir; parent directories are created
  bool WriteFile(const fs::path& relative, const std::string& content);
  bool WriteInput(const std::string& content);
  bool DiskExhausted() const;

  // Jail settings for a command in this box; the caller sets redirections and wall_time
  SandboxOptions Options(const std::vector<std::string>& command, const std::vector<std::string>& envs,
                         bool prepare) const;
  // Spawn under limits and monitor until a terminal state.
  // The redirection fds in opt are closed once the helper has its copies.
  StepResult Run(SandboxOptions& opt, const ResourceLimits& limits, const MonitorLimits& mon_limits,
                 StatsSampler& sampler);
  // A preparation step; stdout and stderr both go to the step log
  StepResult RunStep(const std::vector<std::string>& command, const std::vector<std::string>& envs,
                     StatsSampler& sampler);
  // The user program under the box limits, reading the input file and writing the output files
  StepResult RunProgram(const std::vector<std::string>& command, const std::vector<std::string>& envs,
                        const MonitorLimits& mon_limits, StatsSampler& sampler);

  // kill processes, unmount, remove the tree and return the uid; idempotent
  void Teardown();
};

#endif  // CODEEXEC_SANDBOX_H_
