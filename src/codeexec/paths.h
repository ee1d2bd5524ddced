#ifndef CODEEXEC_PATHS_H_
#define CODEEXEC_PATHS_H_

#include <codeexec/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// for sandbox
// if inside_box = true, id is not used; those calls will have id marked as -1
fs::path SandboxPath(long id);
fs::path SandboxWorkdir(long id, bool inside_box = false);
// capture files sit in the root-owned box root, outside the workdir;
// the jail reaches them only through descriptors opened by the server
fs::path SandboxInput(long id);
fs::path SandboxOutput(long id);
fs::path SandboxError(long id);
fs::path SandboxStepLog(long id);

fs::path SandboxHelperPath();
fs::path LockFilePath();

#endif  // CODEEXEC_PATHS_H_
