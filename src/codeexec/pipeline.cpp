#include <codeexec/pipeline.h>

#include <signal.h>
#include <algorithm>
#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codeexec/limits.h>
#include "sandbox.h"
#include "outcome.h"

long kMaxTimeout = 300L * 1'000'000;
size_t kMaxCapturedOutput = 1024 * 1024;
const char kTruncationMarker[] = "\n[output truncated]";

namespace {

void ReadOutput(const fs::path& path, std::string& content) {
  bool truncated = false;
  if (!ReadFileCapped(path, kMaxCapturedOutput, content, &truncated)) {
    content.clear();
    return;
  }
  if (truncated) content += kTruncationMarker;
}

} // namespace

ExecutionStatus ClassifyOutcome(const StepResult& res, const ResourceLimits& limits, bool disk_exhausted,
                                const std::string& stderr_str, const std::vector<std::string>& oom_markers) {
  switch (res.state) {
    case MonitorState::TIMED_OUT: return ExecutionStatus::TIMEOUT;
    case MonitorState::LIMIT_EXCEEDED: return ExecutionStatus::RESOURCE_EXCEEDED;
    case MonitorState::SPAWN_FAILED: return ExecutionStatus::SETUP_ERROR;
    case MonitorState::RUNNING: return ExecutionStatus::SETUP_ERROR; // not terminal
    case MonitorState::COMPLETED: break;
  }
  if (res.result.timekill == -1) return ExecutionStatus::SETUP_ERROR;
  if (res.result.oomkill > 0) return ExecutionStatus::RESOURCE_EXCEEDED;
  if (res.result.timekill) return ExecutionStatus::TIMEOUT;
  if (res.stats.signal == SIGXFSZ) return ExecutionStatus::RESOURCE_EXCEEDED;
  if (res.stats.peak_memory > limits.memory) return ExecutionStatus::RESOURCE_EXCEEDED;
  if (disk_exhausted) return ExecutionStatus::RESOURCE_EXCEEDED;
  if (res.stats.signal) return ExecutionStatus::RUNTIME_ERROR;
  if (res.stats.exit_code) {
    for (auto& i : oom_markers) {
      if (stderr_str.find(i) != std::string::npos) return ExecutionStatus::RESOURCE_EXCEEDED;
    }
    return ExecutionStatus::RUNTIME_ERROR;
  }
  return ExecutionStatus::SUCCESS;
}

ExecutionPipeline::ExecutionPipeline(AdmissionGate& gate, const ExecutorRegistry& registry,
                                     const ResourceLimits& maxima) :
    gate_(gate), registry_(registry), maxima_(maxima),
    own_sampler_(std::make_unique<ProcfsSampler>()), sampler_(own_sampler_.get()) {}

ExecutionPipeline::ExecutionPipeline(AdmissionGate& gate, const ExecutorRegistry& registry,
                                     const ResourceLimits& maxima, StatsSampler& sampler) :
    gate_(gate), registry_(registry), maxima_(maxima), sampler_(&sampler) {}

ExecutionPipeline::~ExecutionPipeline() = default;

ExecutionResult ExecutionPipeline::Execute(const ExecutionRequest& req, const ResourceLimits& limits) {
  auto deadline = AdmissionGate::Clock::now() + std::chrono::microseconds(std::max(req.timeout, 0L));
  AdmissionSlot slot(gate_, deadline);
  if (!slot.Acquired()) {
    spdlog::info("Execution rejected: language={} capacity={}", req.language, gate_.Capacity());
    return ExecutionResult(ExecutionStatus::BUSY, "too many concurrent executions");
  }
  auto ret = ExecuteAdmitted(req, limits);
  spdlog::info("Execution finished: language={} status={} ({}) wall_time={} cpu_time={} peak_memory={} exit_code={}",
               req.language, ExecutionStatusName(ret.status), ExecutionStatusDesc(ret.status), ret.stats.wall_time,
               ret.stats.cpu_time, ret.stats.peak_memory, ret.stats.exit_code);
  return ret;
}

ExecutionResult ExecutionPipeline::ExecuteAdmitted(const ExecutionRequest& req, const ResourceLimits& limits) {
  std::string reason;
  if (!ValidateLimits(limits, maxima_, &reason)) {
    spdlog::info("Invalid limits: {}", reason);
    return ExecutionResult(ExecutionStatus::SETUP_ERROR, reason);
  }
  if (req.timeout <= 0 || req.timeout > kMaxTimeout) {
    reason = fmt::format("timeout must be between 1 and {} seconds", kMaxTimeout / 1'000'000);
    return ExecutionResult(ExecutionStatus::SETUP_ERROR, reason);
  }
  const LanguageExecutor* executor = registry_.Find(req.language);
  if (!executor) {
    spdlog::info("Unsupported language: {}", req.language);
    return ExecutionResult(ExecutionStatus::UNSUPPORTED_LANGUAGE,
                           fmt::format("unsupported language: {}", req.language));
  }
  try {
    auto box = Sandbox::Create(limits);
    if (!box) return ExecutionResult(ExecutionStatus::SETUP_ERROR, "failed to create sandbox");
    return ExecuteInSandbox(*executor, req, limits, *box);
  } catch (const std::exception& e) {
    // the sandbox is already torn down by unwinding
    spdlog::error("Execution aborted: language={} what={}", req.language, e.what());
    ExecutionResult ret(ExecutionStatus::SETUP_ERROR, "internal error");
    ret.message = e.what();
    return ret;
  }
}

ExecutionResult ExecutionPipeline::ExecuteInSandbox(const LanguageExecutor& executor, const ExecutionRequest& req,
                                                    const ResourceLimits& limits, Sandbox& box) {
  if (!box.WriteInput(req.has_input ? req.input : "")) {
    return ExecutionResult(ExecutionStatus::SETUP_ERROR, "failed to write input");
  }

  RunSpec spec;
  std::string message;
  if (auto st = executor.Prepare(req, box, *sampler_, spec, message); st != ExecutionStatus::SUCCESS) {
    spdlog::info("Prepare failed: id={} language={} status={}", box.Id(), req.language, ExecutionStatusName(st));
    ExecutionResult ret(st, message);
    ret.message = message;
    return ret;
  }

  MonitorLimits mon_limits{req.timeout, limits.memory, limits.processes};
  auto res = box.RunProgram(spec.command, spec.envs, mon_limits, *sampler_);

  ExecutionResult ret;
  ReadOutput(box.OutputPath(), ret.stdout_str);
  ReadOutput(box.ErrorPath(), ret.stderr_str);
  ret.stats = res.stats;
  ret.status = ClassifyOutcome(res, limits, box.DiskExhausted(), ret.stderr_str, executor.OutOfMemoryMarkers());
  if (ret.status == ExecutionStatus::SETUP_ERROR) {
    ret.message = fmt::format("failed to run the program (state={} error={})",
                              MonitorStateName(res.state), res.result.oomkill);
  }
  spdlog::debug("Run finished: id={} state={} timekill={} oomkill={} signal={} exit_code={}", box.Id(),
                MonitorStateName(res.state), res.result.timekill, res.result.oomkill, res.stats.signal,
                res.stats.exit_code);
  return ret;
}
