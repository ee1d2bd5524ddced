#ifndef CODEEXEC_SANDBOX_OPTIONS_H_
#define CODEEXEC_SANDBOX_OPTIONS_H_

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass(CJailCtxClass&& x) :
      argv_buf_(std::move(x.argv_buf_)), env_buf_(std::move(x.env_buf_)),
      str_buf_(std::move(x.str_buf_)), mnt_buf_(std::move(x.mnt_buf_)),
      mnt_list_(x.mnt_list_), ctx_(x.ctx_) {
    x.mnt_list_ = nullptr;
  }
  ~CJailCtxClass() {
    if (mnt_list_) mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  int fd_input, fd_output, fd_error; // -1 for not dup; overrides input/output
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss, vss; // KiB; vss = 0 for no address space limit
  int proc_num;
  int file_num;
  long fsize; // KiB
  std::vector<std::string> dirs;

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  SandboxOptions(const std::vector<uint8_t>& serial);

  // every mandatory ceiling is set; the helper refuses to run otherwise
  bool Limited() const;
  // remove bind mounts that don't exist on this machine
  void FilterDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result is invalidated after reassignment/reallocation of any string/vector member
  CJailCtxClass ToCJailCtx() const;
};

#endif  // CODEEXEC_SANDBOX_OPTIONS_H_
