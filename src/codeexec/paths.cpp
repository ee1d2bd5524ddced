#include "paths.h"

#include <string>

fs::path kBoxRoot = "/tmp/codeexec_box";

namespace internal {
fs::path kDataDir = fs::path(CODEEXEC_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path SandboxPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}

fs::path SandboxWorkdir(long id, bool inside_box) {
  return Workdir(BoxRoot(SandboxPath(id), inside_box));
}

fs::path SandboxInput(long id) {
  return SandboxPath(id) / ".stdin";
}
fs::path SandboxOutput(long id) {
  return SandboxPath(id) / ".stdout";
}
fs::path SandboxError(long id) {
  return SandboxPath(id) / ".stderr";
}
fs::path SandboxStepLog(long id) {
  return SandboxPath(id) / ".prepare.log";
}

fs::path SandboxHelperPath() {
  return internal::kDataDir / "sandbox-exec";
}
fs::path LockFilePath() {
  return internal::kDataDir / "lock";
}
