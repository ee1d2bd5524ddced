#ifndef CODEEXEC_OUTCOME_H_
#define CODEEXEC_OUTCOME_H_

#include <string>
#include <vector>

#include "sandbox.h"

// Map the terminal state of the user program to exactly one status.
// stderr_str is matched against oom_markers when the program exited with a nonzero code.
ExecutionStatus ClassifyOutcome(const StepResult& res, const ResourceLimits& limits, bool disk_exhausted,
                                const std::string& stderr_str, const std::vector<std::string>& oom_markers);

#endif  // CODEEXEC_OUTCOME_H_
