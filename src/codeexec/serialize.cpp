#include <codeexec/serialize.h>

#include <cmath>
#include <limits>
#include <cstdint>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codeexec/utils.h>

using nlohmann::json;

namespace {

// anything larger is rejected by the pipeline anyway; this only keeps the conversion in range
constexpr double kTimeoutBound = 1e9; // seconds

bool ParseTimeout(const json& val, long& timeout, std::string& error) {
  if (!val.is_number()) {
    error = "timeout must be a number of seconds";
    return false;
  }
  double sec = val.get<double>();
  if (!std::isfinite(sec) || std::fabs(sec) > kTimeoutBound) {
    error = "timeout out of range";
    return false;
  }
  timeout = val.is_number_float() ? std::lround(sec * 1'000'000) : val.get<long>() * 1'000'000;
  return true;
}

// absent or null is 0, which means the server default
template <class T>
bool ParseLimit(const json& lim, const char* name, T& val, std::string& error) {
  val = 0;
  auto it = lim.find(name);
  if (it == lim.end() || it->is_null()) return true;
  constexpr T kMax = std::numeric_limits<T>::max();
  if (it->is_number_unsigned()) {
    if (it->get<uint64_t>() <= (uint64_t)kMax) {
      val = (T)it->get<uint64_t>();
      return true;
    }
  } else if (it->is_number_float()) {
    double v = it->get<double>();
    if (v != std::floor(v)) goto not_integer;
    if (v >= 0 && v < (double)kMax) {
      val = (T)v;
      return true;
    }
  } else if (!it->is_number_integer()) {
    goto not_integer;
  }
  // negative or too large
  error = fmt::format("limits.{} out of range", name);
  return false;
not_integer:
  error = fmt::format("limits.{} must be a non-negative integer", name);
  return false;
}

} // namespace

bool ParseDependency(const std::string& str, Dependency& dep) {
  dep = Dependency();
  if (size_t pos = str.find("=="); pos != std::string::npos) {
    dep.name = str.substr(0, pos);
    dep.version = str.substr(pos + 2);
  } else if (size_t pos = str.find('@', 1); pos != std::string::npos) {
    dep.name = str.substr(0, pos);
    dep.version = str.substr(pos + 1);
  } else {
    dep.name = str;
  }
  return !dep.name.empty();
}

bool RequestFromJson(const json& data, ExecutionRequest& req, ResourceLimits& overrides, std::string& error) {
  req = ExecutionRequest();
  overrides = ResourceLimits();
  try {
    if (!data.is_object()) {
      error = "request body must be a JSON object";
      return false;
    }
    req.language = data.at("language").get<std::string>();
    req.code = data.at("code").get<std::string>();
    if (auto it = data.find("input"); it != data.end() && !it->is_null()) {
      req.input = it->get<std::string>();
      req.has_input = true;
    }
    if (auto it = data.find("timeout"); it != data.end() && !it->is_null()) {
      if (!ParseTimeout(*it, req.timeout, error)) return false;
    }
    if (auto it = data.find("dependencies"); it != data.end() && !it->is_null()) {
      if (!it->is_array()) {
        error = "dependencies must be an array";
        return false;
      }
      for (auto& item : *it) {
        Dependency dep;
        if (item.is_string()) {
          if (!ParseDependency(item.get<std::string>(), dep)) {
            error = "dependency name must not be empty";
            return false;
          }
        } else {
          dep.name = item.at("name").get<std::string>();
          dep.version = item.value("version", "");
          if (auto src = item.find("source"); src != item.end() && !src->is_null()) {
            dep.source = src->get<std::string>();
          }
          if (dep.name.empty()) {
            error = "dependency name must not be empty";
            return false;
          }
        }
        req.dependencies.push_back(std::move(dep));
      }
    }
    if (auto it = data.find("env_vars"); it != data.end() && !it->is_null()) {
      req.env_vars = it->get<std::map<std::string, std::string>>();
    }
    if (auto it = data.find("limits"); it != data.end() && !it->is_null()) {
      auto& lim = *it;
      if (!lim.is_object()) {
        error = "limits must be an object";
        return false;
      }
      if (!ParseLimit(lim, "memory", overrides.memory, error) ||
          !ParseLimit(lim, "cpu_time", overrides.cpu_time, error) ||
          !ParseLimit(lim, "processes", overrides.processes, error) ||
          !ParseLimit(lim, "file_size", overrides.file_size, error) ||
          !ParseLimit(lim, "disk", overrides.disk, error)) {
        return false;
      }
    }
  } catch (json::exception& err) {
    spdlog::debug("Request parsing error: {}", err.what());
    error = err.what();
    return false;
  }
  return true;
}

bool RequestFromJson(const std::string& body, ExecutionRequest& req, ResourceLimits& overrides,
                     std::string& error) {
  json data = json::parse(body, nullptr, false);
  if (data.is_discarded()) {
    error = "malformed JSON";
    return false;
  }
  return RequestFromJson(data, req, overrides, error);
}

json RequestToJson(const ExecutionRequest& req, const ResourceLimits& overrides) {
  json deps = json::array();
  for (auto& i : req.dependencies) {
    json dep{{"name", i.name}, {"version", i.version}};
    if (!i.source.empty()) dep["source"] = i.source;
    deps.push_back(std::move(dep));
  }
  json ret{
    {"language", req.language},
    {"code", req.code},
    {"input", req.has_input ? json(req.input) : json(nullptr)},
    {"dependencies", deps},
    {"env_vars", req.env_vars},
  };
  if (req.timeout % 1'000'000 == 0) {
    ret["timeout"] = req.timeout / 1'000'000;
  } else {
    ret["timeout"] = req.timeout / 1e6;
  }
  if (!(overrides == ResourceLimits())) {
    ret["limits"] = {
      {"memory", overrides.memory},
      {"cpu_time", overrides.cpu_time},
      {"processes", overrides.processes},
      {"file_size", overrides.file_size},
      {"disk", overrides.disk},
    };
  }
  return ret;
}

json ResultToJson(const ExecutionResult& res) {
  const ProcessStats& st = res.stats;
  json ret{
    {"stdout", res.stdout_str},
    {"stderr", res.stderr_str},
    {"status", ExecutionStatusWire(res.status)},
    {"reason", ExecutionStatusReason(res.status)},
    {"execution_time", st.wall_time / 1000},
    {"memory_usage", st.peak_memory},
    {"cpu_time", st.cpu_time / 1000},
    {"exit_code", st.exit_code},
    {"stats", {
      {"peak_memory", st.peak_memory},
      {"cpu_time_us", st.cpu_time},
      {"user_time_us", st.user_time},
      {"system_time_us", st.system_time},
      {"wall_time_us", st.wall_time},
      {"exit_code", st.exit_code},
      {"signal", st.signal},
      {"peak_processes", st.peak_processes},
      {"minor_faults", st.minor_faults},
      {"major_faults", st.major_faults},
      {"block_reads", st.block_reads},
      {"block_writes", st.block_writes},
      {"voluntary_switches", st.voluntary_switches},
      {"involuntary_switches", st.involuntary_switches},
    }},
  };
  if (!res.message.empty()) ret["message"] = res.message;
  return ret;
}

bool ResultFromJson(const json& data, ExecutionResult& res, std::string& error) {
  res = ExecutionResult();
  try {
    res.stdout_str = data.at("stdout").get<std::string>();
    res.stderr_str = data.at("stderr").get<std::string>();
    if (!ReasonToExecutionStatus(data.at("reason").get<std::string>(), res.status)) {
      error = "unknown reason " + data["reason"].get<std::string>();
      return false;
    }
    res.message = data.value("message", "");
    ProcessStats& st = res.stats;
    if (auto it = data.find("stats"); it != data.end()) {
      auto& s = *it;
      st.peak_memory = s.at("peak_memory").get<long>();
      st.cpu_time = s.at("cpu_time_us").get<long>();
      st.user_time = s.at("user_time_us").get<long>();
      st.system_time = s.at("system_time_us").get<long>();
      st.wall_time = s.at("wall_time_us").get<long>();
      st.exit_code = s.at("exit_code").get<int>();
      st.signal = s.at("signal").get<int>();
      st.peak_processes = s.at("peak_processes").get<int>();
      st.minor_faults = s.at("minor_faults").get<long>();
      st.major_faults = s.at("major_faults").get<long>();
      st.block_reads = s.at("block_reads").get<long>();
      st.block_writes = s.at("block_writes").get<long>();
      st.voluntary_switches = s.at("voluntary_switches").get<long>();
      st.involuntary_switches = s.at("involuntary_switches").get<long>();
    } else {
      // only the summary fields
      st.wall_time = data.at("execution_time").get<long>() * 1000;
      st.cpu_time = data.at("cpu_time").get<long>() * 1000;
      st.peak_memory = data.at("memory_usage").get<long>();
      st.exit_code = data.at("exit_code").get<int>();
    }
  } catch (json::exception& err) {
    error = err.what();
    return false;
  }
  return true;
}

json ErrorJson(const std::string& reason, const std::string& message) {
  return json{
    {"stdout", ""},
    {"stderr", message},
    {"status", "error"},
    {"reason", reason},
    {"execution_time", 0},
    {"memory_usage", 0},
    {"cpu_time", 0},
    {"exit_code", -1},
  };
}

std::string DumpJson(const json& data) {
  return data.dump(-1, ' ', false, json::error_handler_t::replace);
}
