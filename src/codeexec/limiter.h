#ifndef CODEEXEC_LIMITER_H_
#define CODEEXEC_LIMITER_H_

#include <codeexec/limits.h>

#include "sandbox_exec.h"

// RLIMIT_NOFILE of every jailed process
extern int kMaxOpenFiles;

// Translate limits into jail ceilings. Return false (and leave opt unlimited) if any is out of range.
bool ApplyLimits(const ResourceLimits&, SandboxOptions& opt);

// ApplyLimits then SandboxSpawn; nothing is started unless every ceiling could be applied.
// opt.wall_time must be set by the caller.
bool SpawnLimited(const ResourceLimits&, SandboxOptions& opt, SpawnHandle&);

#endif  // CODEEXEC_LIMITER_H_
