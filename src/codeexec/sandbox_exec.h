#ifndef CODEEXEC_SANDBOX_EXEC_H_
#define CODEEXEC_SANDBOX_EXEC_H_

#include <sys/types.h>
#include <chrono>

#include "sandbox_options.h"

// We separate this from sandbox_options.h because these functions need logging,
//   while the helper binary keeps sandbox_options.h as small as possible

// cjail is not known to be thread-safe, so every jail runs in a forked sandbox-exec helper.
// The helper is the leader of its own process group; the jailed processes run as uid.
struct SpawnHandle {
  pid_t pid;
  int result_fd; // readable once the helper has written its cjail_result
  int uid; // -1 if the processes are only identified by the process group
  std::chrono::steady_clock::time_point start;

  SpawnHandle() : pid(-1), result_fd(-1), uid(-1) {}
  bool Valid() const { return pid > 0 && result_fd >= 0; }
};

// Start the helper and hand it the options; does not wait for the jail.
bool SandboxSpawn(const SandboxOptions&, SpawnHandle&);

// Read the result and reap the helper. Blocks until the helper writes or exits.
// On failure, result is marked as an execution error (timekill = -1, oomkill = errno).
bool CollectResult(SpawnHandle&, struct cjail_result& result);

// Kill the helper's whole process group and reap it; for a helper that stopped responding
void AbandonSpawn(SpawnHandle&);

#endif  // CODEEXEC_SANDBOX_EXEC_H_
