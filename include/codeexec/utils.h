#ifndef INCLUDE_CODEEXEC_UTILS_H_
#define INCLUDE_CODEEXEC_UTILS_H_

#include <string>

#include "request.h"

long GetUniqueSandboxId();

const char* ExecutionStatusName(ExecutionStatus);
const char* ExecutionStatusWire(ExecutionStatus);
const char* ExecutionStatusDesc(ExecutionStatus);
// lowercase identifier; unique per status, unlike the wire name
std::string ExecutionStatusReason(ExecutionStatus);
// return false if no status has this reason
bool ReasonToExecutionStatus(const std::string&, ExecutionStatus&);

#endif  // INCLUDE_CODEEXEC_UTILS_H_
