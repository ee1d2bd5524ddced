#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codeexec/limits.h>
#include <codeexec/logger.h>
#include <codeexec/pipeline.h>
#include "codeexec/paths.h"
#include "codeexec/sandbox.h"
#include "server.h"

namespace {

bool to_lock = true;
std::string kAddr = "0.0.0.0";
int kPort = 3000;
int kMaxConcurrent = 10;
// both the default and the maximum of every request
ResourceLimits kLimits(256L * 1024 * 1024, 10, 64, 10L * 1024 * 1024, 512L * 1024 * 1024);

const char kDefaultConfig[] = "/etc/codeexec.conf";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  kAddr = ini[""]["addr"] | kAddr;
  kPort = ini[""]["port"] | kPort;
  kMaxConcurrent = ini[""]["max_concurrent"] | kMaxConcurrent;
  kLimits.memory = ini[""]["memory_limit"] | kLimits.memory;
  kLimits.cpu_time = ini[""]["cpu_time_limit"] | kLimits.cpu_time;
  kLimits.processes = ini[""]["max_processes"] | kLimits.processes;
  kLimits.file_size = ini[""]["file_size_limit"] | kLimits.file_size;
  kLimits.disk = ini[""]["disk_space_limit"] | kLimits.disk;
  kMaxTimeout = (ini[""]["max_timeout"] | (kMaxTimeout / 1'000'000)) * 1'000'000;
  return true;
}

bool ParseEnvInt(const char* name, int& val) {
  const char* str = getenv(name);
  if (!str || !*str) return true;
  char* end;
  long x = strtol(str, &end, 10);
  if (*end || x <= 0 || x > 65535) {
    spdlog::error("Invalid value of {}: {}", name, str);
    return false;
  }
  val = x;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codeexec-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default: /etc/codeexec.conf if it exists)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--addr")
    .help("Address to listen on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-j", "--max-concurrent")
    .scan<'d', int>()
    .help("Number of maximum concurrent executions");
  parser.add_argument("--memory-limit")
    .scan<'d', long>()
    .help("Memory limit in bytes");
  parser.add_argument("--cpu-time-limit")
    .scan<'d', long>()
    .help("CPU time limit in seconds");
  parser.add_argument("--max-processes")
    .scan<'d', int>()
    .help("Maximum number of processes");
  parser.add_argument("--file-size-limit")
    .scan<'d', long>()
    .help("Maximum size of a written file in bytes");
  parser.add_argument("--disk-space-limit")
    .scan<'d', long>()
    .help("Disk space of a sandbox in bytes");
  parser.add_argument("--max-timeout")
    .scan<'d', long>()
    .help("Maximum wall-clock timeout of a request in seconds");
  parser.add_argument("--box-root")
    .help("Directory to create sandboxes in");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  // an explicitly given file must exist; the default one is optional
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(config_file.value())) {
      spdlog::error("Failed to parse configuration file {}", config_file.value());
      exit(1);
    }
  } else if (fs::exists(kDefaultConfig) && !ParseConfig(kDefaultConfig)) {
    spdlog::error("Failed to parse configuration file {}", kDefaultConfig);
    exit(1);
  }
  if (!ParseEnvInt("CODE_EXEC_PORT", kPort) || !ParseEnvInt("MAX_CONCURRENT_EXECUTIONS", kMaxConcurrent)) {
    exit(1);
  }
  if (auto val = parser.present("--addr")) kAddr = val.value();
  if (auto val = parser.present<int>("--port")) kPort = val.value();
  if (auto val = parser.present<int>("--max-concurrent")) kMaxConcurrent = val.value();
  if (auto val = parser.present<long>("--memory-limit")) kLimits.memory = val.value();
  if (auto val = parser.present<long>("--cpu-time-limit")) kLimits.cpu_time = val.value();
  if (auto val = parser.present<int>("--max-processes")) kLimits.processes = val.value();
  if (auto val = parser.present<long>("--file-size-limit")) kLimits.file_size = val.value();
  if (auto val = parser.present<long>("--disk-space-limit")) kLimits.disk = val.value();
  if (auto val = parser.present<long>("--max-timeout")) kMaxTimeout = val.value() * 1'000'000;
  if (auto val = parser.present("--box-root")) kBoxRoot = val.value();
  to_lock = parser["--no-lock"] == false;
}

bool CheckConfig() {
  std::string reason;
  if (!ValidateLimits(kLimits, ResourceLimits(), &reason)) {
    spdlog::error("Invalid limits: {}", reason);
    return false;
  }
  if (kPort <= 0 || kPort > 65535) {
    spdlog::error("Invalid port {}", kPort);
    return false;
  }
  // every running sandbox needs its own uid
  if (kMaxConcurrent <= 0 || kMaxConcurrent > kUidPoolSize) {
    spdlog::error("max_concurrent must be between 1 and {} (got {})", kUidPoolSize, kMaxConcurrent);
    return false;
  }
  if (kMaxTimeout <= 0) {
    spdlog::error("max_timeout must be positive");
    return false;
  }
  return true;
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  // the fd is kept open until exit to hold the lock
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  signal(SIGPIPE, SIG_IGN);
  ParseArgs(argc, argv);
  if (!CheckConfig()) return 1;
  if (to_lock && !LockFile()) {
    spdlog::error("Another codeexec instance is running.");
    return 1;
  }
  spdlog::info("Starting: max_concurrent={} memory={} cpu_time={} processes={} file_size={} disk={} box_root={}",
               kMaxConcurrent, kLimits.memory, kLimits.cpu_time, kLimits.processes, kLimits.file_size,
               kLimits.disk, kBoxRoot.c_str());

  ExecutorRegistry registry;
  RegisterDefaultExecutors(registry);
  AdmissionGate gate(kMaxConcurrent);
  ExecutionPipeline pipeline(gate, registry, kLimits);
  return RunServer(kAddr, kPort, pipeline, gate) ? 0 : 1;
}
