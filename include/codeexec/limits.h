#ifndef INCLUDE_CODEEXEC_LIMITS_H_
#define INCLUDE_CODEEXEC_LIMITS_H_

#include <string>

#include "request.h"

// Every field must be positive and not larger than the same field of maxima.
// reason (if given) is set to a human-readable description of the first violation.
bool ValidateLimits(const ResourceLimits& limits, const ResourceLimits& maxima, std::string* reason = nullptr);

// Fields of overrides that are 0 take the value of defaults
ResourceLimits ResolveLimits(const ResourceLimits& overrides, const ResourceLimits& defaults);

#endif  // INCLUDE_CODEEXEC_LIMITS_H_
