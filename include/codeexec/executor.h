#ifndef INCLUDE_CODEEXEC_EXECUTOR_H_
#define INCLUDE_CODEEXEC_EXECUTOR_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "request.h"

class Sandbox;
class StatsSampler;

// what to run once the sandbox is prepared; paths are inside the box
struct RunSpec {
  std::vector<std::string> command;
  std::vector<std::string> envs;
};

class LanguageExecutor {
 public:
  virtual ~LanguageExecutor() = default;

  virtual std::string Language() const = 0;

  // Materialize the source and dependencies in the sandbox and run every install/compile
  // step in it. On SUCCESS, spec holds the run command. Otherwise message holds what went
  // wrong (compiler diagnostics for RUNTIME_ERROR).
  virtual ExecutionStatus Prepare(const ExecutionRequest&, Sandbox&, StatsSampler&,
                                  RunSpec& spec, std::string& message) const = 0;

  // stderr substrings meaning the runtime gave up on allocating memory
  virtual std::vector<std::string> OutOfMemoryMarkers() const { return {}; }
};

class ExecutorRegistry {
  std::map<std::string, std::unique_ptr<LanguageExecutor>> executors_;
 public:
  // replaces an executor with the same language
  void Register(std::unique_ptr<LanguageExecutor>&&);
  // nullptr if not registered
  const LanguageExecutor* Find(const std::string& language) const;
  std::vector<std::string> Languages() const;
};

void RegisterDefaultExecutors(ExecutorRegistry&);

#endif  // INCLUDE_CODEEXEC_EXECUTOR_H_
