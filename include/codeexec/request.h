#ifndef INCLUDE_CODEEXEC_REQUEST_H_
#define INCLUDE_CODEEXEC_REQUEST_H_

#include <map>
#include <utility>
#include <string>
#include <vector>

// identifier, wire status, description
#define ENUM_EXECUTION_STATUS_ \
  X(SUCCESS, "success", "Success") \
  X(RUNTIME_ERROR, "error", "Runtime Error") \
  X(TIMEOUT, "timeout", "Time Limit Exceeded") \
  X(RESOURCE_EXCEEDED, "resource_exceeded", "Resource Limit Exceeded") \
  X(SETUP_ERROR, "setup_error", "Setup Error") \
  X(UNSUPPORTED_LANGUAGE, "setup_error", "Unsupported Language") \
  X(BUSY, "busy", "Service Busy")
enum class ExecutionStatus {
#define X(name, wire, desc) name,
  ENUM_EXECUTION_STATUS_
#undef X
};

struct Dependency {
  std::string name;
  std::string version;
  std::string source; // empty for the default registry

  bool operator==(const Dependency& x) const {
    return name == x.name && version == x.version && source == x.source;
  }
};

// Bytes and seconds; 0 in an override means "use the server value"
struct ResourceLimits {
  long memory;
  long cpu_time;
  int processes;
  long file_size;
  long disk;

  ResourceLimits() : memory(0), cpu_time(0), processes(0), file_size(0), disk(0) {}
  ResourceLimits(long memory, long cpu_time, int processes, long file_size, long disk) :
      memory(memory), cpu_time(cpu_time), processes(processes), file_size(file_size), disk(disk) {}

  bool operator==(const ResourceLimits& x) const {
    return memory == x.memory && cpu_time == x.cpu_time && processes == x.processes &&
        file_size == x.file_size && disk == x.disk;
  }
};

class ExecutionRequest {
 public:
  std::string language;
  std::string code;
  bool has_input;
  std::string input;
  std::vector<Dependency> dependencies;
  long timeout; // us
  std::map<std::string, std::string> env_vars;

  ExecutionRequest() : has_input(false), timeout(30L * 1'000'000) {}
};

struct ProcessStats {
  long peak_memory; // bytes
  long cpu_time, user_time, system_time; // us
  long wall_time; // us, from spawn to termination
  int exit_code;
  int signal; // 0 if exited normally
  int peak_processes;
  long minor_faults, major_faults;
  long block_reads, block_writes;
  long voluntary_switches, involuntary_switches;

  ProcessStats() :
      peak_memory(0), cpu_time(0), user_time(0), system_time(0), wall_time(0),
      exit_code(0), signal(0), peak_processes(0),
      minor_faults(0), major_faults(0), block_reads(0), block_writes(0),
      voluntary_switches(0), involuntary_switches(0) {}
};

class ExecutionResult {
 public:
  ExecutionStatus status;
  std::string stdout_str, stderr_str;
  ProcessStats stats;
  // infrastructure diagnostic; not part of the program output
  std::string message;

  ExecutionResult() : status(ExecutionStatus::SETUP_ERROR) {}
  ExecutionResult(ExecutionStatus status, std::string stderr_msg = "") :
      status(status), stderr_str(std::move(stderr_msg)) {}
};

#endif  // INCLUDE_CODEEXEC_REQUEST_H_
