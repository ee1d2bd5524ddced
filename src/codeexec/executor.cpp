#include <codeexec/executor.h>

#include <cstdlib>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "paths.h"
#include "languages.h"

const size_t kMaxMessageLength = 4000;

namespace {

const char kDefaultPath[] = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

std::map<std::string, std::string> BaseEnvs() {
  std::string workdir = SandboxWorkdir(-1, true);
  std::map<std::string, std::string> envs = {
    {"HOME", workdir},
    {"TMPDIR", workdir + "/.tmp"},
    {"LANG", "C.UTF-8"},
  };
  const char* path = getenv("PATH");
  envs["PATH"] = path && *path ? path : kDefaultPath;
  return envs;
}

std::vector<std::string> ToEnvList(const std::map<std::string, std::string>& envs) {
  std::vector<std::string> ret;
  for (auto& [key, val] : envs) ret.push_back(key + '=' + val);
  return ret;
}

} // namespace

void ExecutorRegistry::Register(std::unique_ptr<LanguageExecutor>&& executor) {
  std::string language = executor->Language();
  spdlog::debug("Register executor: language={}", language);
  executors_[language] = std::move(executor);
}

const LanguageExecutor* ExecutorRegistry::Find(const std::string& language) const {
  auto it = executors_.find(language);
  return it == executors_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ExecutorRegistry::Languages() const {
  std::vector<std::string> ret;
  for (auto& i : executors_) ret.push_back(i.first);
  return ret;
}

std::vector<std::string> StepEnvs() {
  std::string workdir = SandboxWorkdir(-1, true);
  auto envs = BaseEnvs();
  envs["GOPATH"] = workdir + "/.go";
  envs["GOCACHE"] = workdir + "/.cache/go-build";
  envs["GOTOOLCHAIN"] = "local";
  // module cache is read-only by default, which breaks removal by anything but root
  envs["GOFLAGS"] = "-modcacherw";
  envs["CARGO_HOME"] = workdir + "/.cargo";
  envs["npm_config_cache"] = workdir + "/.npm";
  envs["npm_config_update_notifier"] = "false";
  envs["COMPOSER_HOME"] = workdir + "/.composer";
  envs["PIP_DISABLE_PIP_VERSION_CHECK"] = "1";
  if (const char* rustup = getenv("RUSTUP_HOME")) envs["RUSTUP_HOME"] = rustup;
  return ToEnvList(envs);
}

std::vector<std::string> RunEnvs(const ExecutionRequest& req) {
  auto envs = BaseEnvs();
  if (const char* rustup = getenv("RUSTUP_HOME")) envs["RUSTUP_HOME"] = rustup;
  for (auto& [key, val] : req.env_vars) {
    if (key.empty() || key.find('=') != std::string::npos) {
      spdlog::warn("Ignoring invalid environment variable name: {}", key);
      continue;
    }
    envs[key] = val;
  }
  return ToEnvList(envs);
}

ExecutionStatus RunPrepareStep(Sandbox& box, StatsSampler& sampler, const std::vector<std::string>& command,
                               bool compile, std::string& message) {
  spdlog::debug("Prepare step: id={} command={}", box.Id(), fmt::format("{}", command));
  auto res = box.RunStep(command, StepEnvs(), sampler);
  if (res.Succeeded()) return ExecutionStatus::SUCCESS;

  std::string log;
  bool truncated = false;
  if (!ReadFileCapped(box.StepLogPath(), kMaxMessageLength, log, &truncated)) {
    log = "(no output)";
  } else if (truncated) {
    log += "\n... (output truncated)";
  }
  if (res.state == MonitorState::SPAWN_FAILED || res.result.timekill == -1) {
    message = fmt::format("failed to start {}", command[0]);
    return ExecutionStatus::SETUP_ERROR;
  }
  if (res.state == MonitorState::TIMED_OUT || res.result.timekill) {
    message = fmt::format("{} did not finish in time\n{}", fmt::join(command, " "), log);
  } else if (res.state == MonitorState::LIMIT_EXCEEDED || res.result.oomkill > 0) {
    message = fmt::format("{} exceeded the preparation limits\n{}", fmt::join(command, " "), log);
  } else {
    message = log;
  }
  return compile ? ExecutionStatus::RUNTIME_ERROR : ExecutionStatus::SETUP_ERROR;
}
