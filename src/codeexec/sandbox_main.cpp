#include <errno.h>
#include <unistd.h>

#include "sandbox_options.h"

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    ptr += ret;
    len -= ret;
  }
  return true;
}

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  if (!opt.Limited()) {
    // never run without limits
    ret.oomkill = EINVAL;
    ret.timekill = -1;
    return ret;
  }
  CJailCtxClass ctx = opt.ToCJailCtx();
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res = SandboxExec(SandboxOptions(buf));
  if (write(1, &res, sizeof(res)) < 0) return 1;
}
