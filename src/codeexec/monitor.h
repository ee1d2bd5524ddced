#ifndef CODEEXEC_MONITOR_H_
#define CODEEXEC_MONITOR_H_

#include <chrono>

#include <codeexec/request.h>
#include "sandbox_exec.h"

#define ENUM_MONITOR_STATE_ \
  X(RUNNING) \
  X(COMPLETED) \
  X(TIMED_OUT) \
  X(LIMIT_EXCEEDED) \
  X(SPAWN_FAILED)
enum class MonitorState {
#define X(name) name,
  ENUM_MONITOR_STATE_
#undef X
};

const char* MonitorStateName(MonitorState);

extern const std::chrono::milliseconds kSampleInterval;
extern const std::chrono::milliseconds kTerminateGrace;
extern const std::chrono::milliseconds kReapTimeout;

struct ProcessSample {
  long rss; // bytes, summed over all processes
  int processes;
};

class StatsSampler {
 public:
  virtual ~StatsSampler() = default;
  // return false if no process could be observed
  virtual bool Sample(const SpawnHandle&, ProcessSample&) = 0;
};

// Reads /proc/<pid>/status of every process that runs as the sandbox uid
// (or, if the handle has no uid, every process in the helper's process group)
class ProcfsSampler : public StatsSampler {
 public:
  bool Sample(const SpawnHandle&, ProcessSample&) override;
};

struct MonitorLimits {
  long wall_time; // us
  long memory; // bytes; 0 = not checked by sampling
  int processes; // 0 = not checked by sampling
};

class ProcessMonitor {
  StatsSampler& sampler_;
  MonitorLimits limits_;
  MonitorState state_;
  ProcessStats stats_;
  int samples_;

  void Signal(const SpawnHandle&, int sig);
  void Terminate(SpawnHandle&);
 public:
  ProcessMonitor(StatsSampler& sampler, const MonitorLimits& limits) :
      sampler_(sampler), limits_(limits), state_(MonitorState::RUNNING), samples_(0) {}

  // Block until the process reaches a terminal state; the handle is consumed.
  // result is filled from the helper (timekill = -1 if it reported nothing).
  MonitorState Run(SpawnHandle&, struct cjail_result& result);

  // Only the first transition out of RUNNING takes effect
  bool Transition(MonitorState);

  MonitorState State() const { return state_; }
  // sampled peaks and wall time; merged with the kernel's numbers by FillStats
  const ProcessStats& Stats() const { return stats_; }
  int Samples() const { return samples_; }
};

// Merge the rusage and exit information of a finished jail into stats
void FillStats(const struct cjail_result&, ProcessStats&);

#endif  // CODEEXEC_MONITOR_H_
