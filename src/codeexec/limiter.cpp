#include "limiter.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

int kMaxOpenFiles = 256;

namespace {

inline long ToKiB(long bytes) {
  return (bytes + 1023) / 1024;
}

bool CheckField(const char* name, long val, long max, std::string* reason) {
  if (val <= 0) {
    if (reason) *reason = fmt::format("{} must be positive (got {})", name, val);
    return false;
  }
  if (max > 0 && val > max) {
    if (reason) *reason = fmt::format("{} exceeds the server maximum ({} > {})", name, val, max);
    return false;
  }
  return true;
}

} // namespace

bool ValidateLimits(const ResourceLimits& limits, const ResourceLimits& maxima, std::string* reason) {
  return CheckField("memory", limits.memory, maxima.memory, reason) &&
      CheckField("cpu_time", limits.cpu_time, maxima.cpu_time, reason) &&
      CheckField("processes", limits.processes, maxima.processes, reason) &&
      CheckField("file_size", limits.file_size, maxima.file_size, reason) &&
      CheckField("disk", limits.disk, maxima.disk, reason);
}

ResourceLimits ResolveLimits(const ResourceLimits& overrides, const ResourceLimits& defaults) {
  ResourceLimits ret = defaults;
  if (overrides.memory) ret.memory = overrides.memory;
  if (overrides.cpu_time) ret.cpu_time = overrides.cpu_time;
  if (overrides.processes) ret.processes = overrides.processes;
  if (overrides.file_size) ret.file_size = overrides.file_size;
  if (overrides.disk) ret.disk = overrides.disk;
  return ret;
}

bool ApplyLimits(const ResourceLimits& limits, SandboxOptions& opt) {
  std::string reason;
  if (!ValidateLimits(limits, ResourceLimits(), &reason)) {
    spdlog::warn("Refusing to apply limits: {}", reason);
    opt.rss = opt.cpu_time = opt.fsize = 0;
    opt.proc_num = 0;
    return false;
  }
  // Files in the workdir tmpfs are accounted in cgroups, so we need to extend RSS limit
  // The memory limit itself is still enforced by the monitor on sampled RSS
  opt.rss = ToKiB(limits.memory) + ToKiB(limits.disk);
  opt.vss = 0;
  opt.cpu_time = limits.cpu_time * 1'000'000;
  opt.proc_num = limits.processes;
  opt.fsize = ToKiB(limits.file_size);
  opt.file_num = kMaxOpenFiles;
  return true;
}

bool SpawnLimited(const ResourceLimits& limits, SandboxOptions& opt, SpawnHandle& handle) {
  if (!ApplyLimits(limits, opt)) return false;
  if (opt.wall_time <= 0 || !opt.Limited()) {
    spdlog::warn("Refusing to spawn without complete limits: boxdir={} wall_time={} uid={}",
                 opt.boxdir, opt.wall_time, opt.uid);
    return false;
  }
  spdlog::debug("Limits applied: rss={}KiB cpu_time={}us proc_num={} fsize={}KiB wall_time={}us",
                opt.rss, opt.cpu_time, opt.proc_num, opt.fsize, opt.wall_time);
  return SandboxSpawn(opt, handle);
}
