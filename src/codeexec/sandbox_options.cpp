#include "sandbox_options.h"

#include <unistd.h>
#include <cstring>
#include <filesystem>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) : SandboxOptions() {
  size_t cur = 0;
  bool truncated = false;
  // a short read poisons everything after it
  auto ReadInt = [&]() {
    if (truncated || cur + sizeof(Int) > vec.size()) {
      truncated = true;
      return Int(0);
    }
    Int r = *(Int*)(vec.data() + cur);
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (truncated || size < 0 || cur + size > vec.size()) {
      truncated = true;
      return std::string();
    }
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  // every element takes at least sizeof(Int) bytes
  auto ReadCount = [&]() {
    Int size = ReadInt();
    if (size < 0 || (size_t)size > (vec.size() - cur) / sizeof(Int)) {
      truncated = true;
      return Int(0);
    }
    return size;
  };
  boxdir = ReadString();
  command.resize(ReadCount());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadCount());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  input = ReadString();
  output = ReadString();
  error = ReadString();
  fd_input = ReadInt();
  fd_output = ReadInt();
  fd_error = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  dirs.resize(ReadCount());
  for (auto& i : dirs) i = ReadString();
  if (truncated) {
    command.clear();
    wall_time = cpu_time = rss = fsize = 0;
    proc_num = 0;
  }
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto AddLenWrite = [&](size_t len, Int r){
    Int cur = ret.size();
    ret.resize(cur + len);
    *(Int*)(ret.data() + cur) = r;
  };
  auto PushInt = [&](Int r) { AddLenWrite(sizeof(Int), r); };
  auto PushString = [&](const std::string& str){
    Int cur = ret.size();
    AddLenWrite(str.size() + sizeof(Int), str.size());
    memcpy(ret.data() + (cur + sizeof(Int)), str.c_str(), str.size());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushString(input);
  PushString(output);
  PushString(error);
  PushInt(fd_input);
  PushInt(fd_output);
  PushInt(fd_error);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(dirs.size());
  for (auto& i : dirs) PushString(i);
  return ret;
}

bool SandboxOptions::Limited() const {
  return !command.empty() && !boxdir.empty() && uid > 0 && gid > 0 &&
      wall_time > 0 && cpu_time > 0 && rss > 0 && proc_num > 0 && fsize > 0;
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> ndirs;
  for (auto& i : dirs) {
    std::error_code ec;
    if (std::filesystem::is_directory(i, ec)) ndirs.push_back(i);
  }
  dirs.swap(ndirs);
}

CJailCtxClass SandboxOptions::ToCJailCtx() const {
  CJailCtxClass ret;
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  if (!input.empty()) ctx.redir_input = input.data();
  if (!output.empty()) ctx.redir_output = output.data();
  if (!error.empty()) ctx.redir_error = error.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  // default: cgroup_root
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  // default: rlim_stack (no limit)
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // default: cputime_poll_interval
  // default: seccomp_cfg
  // bind mounts
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
  return ret;
}
