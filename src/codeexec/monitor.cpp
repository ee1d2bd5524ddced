#include "monitor.h"

#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

using namespace std::chrono_literals;

const std::chrono::milliseconds kSampleInterval = 100ms;
const std::chrono::milliseconds kTerminateGrace = 500ms;
const std::chrono::milliseconds kReapTimeout = 2000ms;

namespace {

inline long ToUs(const struct timeval& tv) {
  return tv.tv_sec * 1'000'000L + tv.tv_usec;
}

inline long ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

// true if fd is readable (result written or helper gone)
bool WaitReadable(int fd, std::chrono::milliseconds timeout) {
  struct pollfd pfd = {fd, POLLIN, 0};
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ret = poll(&pfd, 1, std::max(remaining.count(), 0L));
    if (ret > 0) return true;
    if (ret == 0) return false;
    if (errno != EINTR) {
      spdlog::warn("poll error: fd={} errno={} {}", fd, errno, strerror(errno));
      return true; // let the caller find out by reading
    }
  }
}

} // namespace

#define X(name) case MonitorState::name: return #name;
const char* MonitorStateName(MonitorState state) {
  switch (state) {
    ENUM_MONITOR_STATE_
  }
  __builtin_unreachable();
}
#undef X

bool ProcfsSampler::Sample(const SpawnHandle& handle, ProcessSample& sample) {
  sample = {0, 0};
  for (pid_t pid : ListProcesses()) {
    ProcStatus status;
    if (handle.uid > 0) {
      if (!ReadProcStatus(pid, status) || status.uid != handle.uid) continue;
    } else {
      if (handle.pid <= 0 || getpgid(pid) != handle.pid || !ReadProcStatus(pid, status)) continue;
    }
    sample.rss += status.rss_kib * 1024;
    sample.processes++;
  }
  return sample.processes > 0;
}

bool ProcessMonitor::Transition(MonitorState state) {
  if (state_ != MonitorState::RUNNING || state == MonitorState::RUNNING) return false;
  spdlog::debug("Monitor transition: {} -> {}", MonitorStateName(state_), MonitorStateName(state));
  state_ = state;
  return true;
}

void ProcessMonitor::Signal(const SpawnHandle& handle, int sig) {
  if (handle.uid > 0) {
    KillUidProcesses(handle.uid, sig);
  } else if (handle.pid > 0) {
    kill(-handle.pid, sig);
  }
}

void ProcessMonitor::Terminate(SpawnHandle& handle) {
  spdlog::info("Terminating: pid={} uid={} state={}", handle.pid, handle.uid, MonitorStateName(state_));
  Signal(handle, SIGTERM);
  if (WaitReadable(handle.result_fd, kTerminateGrace)) return;
  Signal(handle, SIGKILL);
  if (WaitReadable(handle.result_fd, kReapTimeout)) return;
  AbandonSpawn(handle);
}

MonitorState ProcessMonitor::Run(SpawnHandle& handle, struct cjail_result& result) {
  result = {};
  if (!handle.Valid()) {
    Transition(MonitorState::SPAWN_FAILED);
    result.oomkill = ECHILD;
    result.timekill = -1;
    return state_;
  }
  while (true) {
    long elapsed = ElapsedUs(handle.start);
    auto wait = std::min<std::chrono::milliseconds>(
        kSampleInterval, std::chrono::milliseconds(std::max(limits_.wall_time - elapsed, 0L) / 1000 + 1));
    if (WaitReadable(handle.result_fd, wait)) {
      stats_.wall_time = ElapsedUs(handle.start);
      break;
    }
    ProcessSample sample;
    if (sampler_.Sample(handle, sample)) {
      samples_++;
      stats_.peak_memory = std::max(stats_.peak_memory, sample.rss);
      stats_.peak_processes = std::max(stats_.peak_processes, sample.processes);
      if (limits_.memory && sample.rss > limits_.memory) {
        spdlog::info("Memory limit exceeded: pid={} rss={} limit={}", handle.pid, sample.rss, limits_.memory);
        Transition(MonitorState::LIMIT_EXCEEDED);
      } else if (limits_.processes && sample.processes > limits_.processes) {
        spdlog::info("Process limit exceeded: pid={} processes={} limit={}",
                     handle.pid, sample.processes, limits_.processes);
        Transition(MonitorState::LIMIT_EXCEEDED);
      }
    }
    if (elapsed = ElapsedUs(handle.start); elapsed >= limits_.wall_time) {
      Transition(MonitorState::TIMED_OUT);
    }
    if (state_ != MonitorState::RUNNING) {
      stats_.wall_time = elapsed;
      Terminate(handle);
      break;
    }
  }
  bool ok = CollectResult(handle, result);
  if (!ok) Transition(MonitorState::SPAWN_FAILED);
  Transition(MonitorState::COMPLETED);
  spdlog::debug("Monitor finished: state={} samples={} wall_time={} peak_memory={}",
                MonitorStateName(state_), samples_, stats_.wall_time, stats_.peak_memory);
  return state_;
}

void FillStats(const struct cjail_result& res, ProcessStats& stats) {
  if (res.timekill == -1) return;
  stats.user_time = ToUs(res.rus.ru_utime);
  stats.system_time = ToUs(res.rus.ru_stime);
  stats.cpu_time = stats.user_time + stats.system_time;
  stats.peak_memory = std::max(stats.peak_memory, (long)res.rus.ru_maxrss * 1024);
  stats.minor_faults = res.rus.ru_minflt;
  stats.major_faults = res.rus.ru_majflt;
  stats.block_reads = res.rus.ru_inblock;
  stats.block_writes = res.rus.ru_oublock;
  stats.voluntary_switches = res.rus.ru_nvcsw;
  stats.involuntary_switches = res.rus.ru_nivcsw;
  if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
    stats.signal = res.info.si_status;
    stats.exit_code = 128 + res.info.si_status;
  } else {
    stats.signal = 0;
    stats.exit_code = res.info.si_status;
  }
}
