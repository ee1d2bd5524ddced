#ifndef INCLUDE_CODEEXEC_PIPELINE_H_
#define INCLUDE_CODEEXEC_PIPELINE_H_

#include <memory>

#include "gate.h"
#include "request.h"
#include "executor.h"

extern long kMaxTimeout; // us
// stdout and stderr are each cut at this size
extern size_t kMaxCapturedOutput;
extern const char kTruncationMarker[];

class ExecutionPipeline {
  AdmissionGate& gate_;
  const ExecutorRegistry& registry_;
  ResourceLimits maxima_;
  std::unique_ptr<StatsSampler> own_sampler_;
  StatsSampler* sampler_;

  ExecutionResult ExecuteAdmitted(const ExecutionRequest&, const ResourceLimits&);
  ExecutionResult ExecuteInSandbox(const LanguageExecutor&, const ExecutionRequest&, const ResourceLimits&,
                                   Sandbox&);
 public:
  ExecutionPipeline(AdmissionGate& gate, const ExecutorRegistry& registry, const ResourceLimits& maxima);
  // the sampler must outlive the pipeline
  ExecutionPipeline(AdmissionGate& gate, const ExecutorRegistry& registry, const ResourceLimits& maxima,
                    StatsSampler& sampler);
  ~ExecutionPipeline();
  ExecutionPipeline(const ExecutionPipeline&) = delete;
  ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

  const ResourceLimits& Maxima() const { return maxima_; }

  // Never throws. BUSY if no slot is free within request.timeout; every other
  // failure is reported in the result.
  ExecutionResult Execute(const ExecutionRequest& request, const ResourceLimits& limits);
};

#endif  // INCLUDE_CODEEXEC_PIPELINE_H_
