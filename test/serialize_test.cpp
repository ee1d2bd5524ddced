#include <gtest/gtest.h>
#include <codeexec/serialize.h>
#include <codeexec/utils.h>

using nlohmann::json;

namespace {

struct DependencyParam {
  std::string name;
  std::string str;
  Dependency expected;
};

std::string ParamName(const ::testing::TestParamInfo<DependencyParam>& info) {
  return info.param.name;
}

bool Parse(const std::string& body, ExecutionRequest& req, ResourceLimits& overrides, std::string& error) {
  return RequestFromJson(body, req, overrides, error);
}

} // namespace

class DependencyString : public testing::TestWithParam<DependencyParam> {};
TEST_P(DependencyString, Parse) {
  auto& param = GetParam();
  Dependency dep;
  ASSERT_TRUE(ParseDependency(param.str, dep));
  EXPECT_EQ(dep.name, param.expected.name);
  EXPECT_EQ(dep.version, param.expected.version);
  EXPECT_EQ(dep.source, "");
}
INSTANTIATE_TEST_SUITE_P(Forms, DependencyString,
    testing::Values(
      (DependencyParam){"bare", "requests", {"requests", "", ""}},
      (DependencyParam){"pinned", "numpy==1.26.0", {"numpy", "1.26.0", ""}},
      (DependencyParam){"at", "lodash@4.17.21", {"lodash", "4.17.21", ""}},
      (DependencyParam){"scoped", "@types/node", {"@types/node", "", ""}},
      (DependencyParam){"scoped_at", "@types/node@20.1.0", {"@types/node", "20.1.0", ""}},
      (DependencyParam){"go_module", "github.com/google/uuid@v1.6.0", {"github.com/google/uuid", "v1.6.0", ""}}
    ),
    ParamName);

TEST(ParseDependency, EmptyName) {
  Dependency dep;
  EXPECT_FALSE(ParseDependency("", dep));
  EXPECT_FALSE(ParseDependency("==1.0", dep));
}

TEST(RequestFromJson, Minimal) {
  ExecutionRequest req;
  ResourceLimits overrides;
  std::string error;
  ASSERT_TRUE(Parse(R"json({"language": "python", "code": "print(1)"})json", req, overrides, error)) << error;
  EXPECT_EQ(req.language, "python");
  EXPECT_EQ(req.code, "print(1)");
  EXPECT_FALSE(req.has_input);
  EXPECT_EQ(req.timeout, 30'000'000);
  EXPECT_TRUE(req.dependencies.empty());
  EXPECT_TRUE(req.env_vars.empty());
  EXPECT_EQ(overrides, ResourceLimits());
}

TEST(RequestFromJson, Full) {
  json body{
    {"language", "javascript"},
    {"code", "console.log(1)"},
    {"input", ""},
    {"timeout", 1.5},
    {"dependencies", json::array({"lodash@4.17.21", {{"name", "left-pad"}, {"source", "https://example.com/left-pad.git"}}})},
    {"env_vars", {{"FOO", "bar"}}},
    {"limits", {{"memory", 1 << 20}, {"processes", 4}}},
  };
  ExecutionRequest req;
  ResourceLimits overrides;
  std::string error;
  ASSERT_TRUE(RequestFromJson(body, req, overrides, error)) << error;
  EXPECT_TRUE(req.has_input);
  EXPECT_EQ(req.input, "");
  EXPECT_EQ(req.timeout, 1'500'000);
  ASSERT_EQ(req.dependencies.size(), 2u);
  EXPECT_EQ(req.dependencies[0], (Dependency{"lodash", "4.17.21", ""}));
  EXPECT_EQ(req.dependencies[1], (Dependency{"left-pad", "", "https://example.com/left-pad.git"}));
  EXPECT_EQ(req.env_vars.at("FOO"), "bar");
  EXPECT_EQ(overrides.memory, 1 << 20);
  EXPECT_EQ(overrides.processes, 4);
  EXPECT_EQ(overrides.cpu_time, 0);
  EXPECT_EQ(overrides.disk, 0);
}

TEST(RequestFromJson, IntegerTimeout) {
  ExecutionRequest req;
  ResourceLimits overrides;
  std::string error;
  ASSERT_TRUE(Parse(R"({"language": "go", "code": "", "timeout": 10})", req, overrides, error)) << error;
  EXPECT_EQ(req.timeout, 10'000'000);
  // out-of-range values are left to the pipeline
  ASSERT_TRUE(Parse(R"({"language": "go", "code": "", "timeout": 0})", req, overrides, error)) << error;
  EXPECT_EQ(req.timeout, 0);
}

TEST(RequestFromJson, BadBodies) {
  ExecutionRequest req;
  ResourceLimits overrides;
  for (const char* body : {
        "",
        "{",
        "[]",
        "\"python\"",
        R"json({"code": "print(1)"})json",
        R"({"language": "python"})",
        R"({"language": 1, "code": ""})",
        R"({"language": "python", "code": "", "timeout": "ten"})",
        R"({"language": "python", "code": "", "timeout": 1e300})",
        R"({"language": "python", "code": "", "dependencies": "requests"})",
        R"({"language": "python", "code": "", "dependencies": [""]})",
        R"({"language": "python", "code": "", "dependencies": [{"version": "1.0"}]})",
        R"({"language": "python", "code": "", "env_vars": {"A": 1}})",
        R"({"language": "python", "code": "", "limits": {"memory": "1G"}})",
        R"({"language": "python", "code": "", "limits": {"processes": 4294967297}})",
        R"({"language": "python", "code": "", "limits": {"memory": 1e30}})",
        R"({"language": "python", "code": "", "limits": {"disk": -1}})",
        R"({"language": "python", "code": "", "limits": {"memory": 1.5}})",
        R"({"language": "python", "code": "", "limits": [1]})",
      }) {
    std::string error;
    EXPECT_FALSE(Parse(body, req, overrides, error)) << body;
    EXPECT_FALSE(error.empty()) << body;
  }
}

TEST(RequestFromJson, LimitRange) {
  ExecutionRequest req;
  ResourceLimits overrides;
  std::string error;
  EXPECT_FALSE(Parse(R"({"language": "go", "code": "", "limits": {"processes": 4294967297}})",
                     req, overrides, error));
  EXPECT_EQ(error, "limits.processes out of range");
  EXPECT_FALSE(Parse(R"({"language": "go", "code": "", "limits": {"file_size": 1.25}})",
                     req, overrides, error));
  EXPECT_EQ(error, "limits.file_size must be a non-negative integer");

  error.clear();
  ASSERT_TRUE(Parse(R"({"language": "go", "code": "", "limits": {"processes": 2147483647, "memory": 2e9, "cpu_time": null}})",
                    req, overrides, error)) << error;
  EXPECT_EQ(overrides.processes, 2147483647);
  EXPECT_EQ(overrides.memory, 2'000'000'000L);
  EXPECT_EQ(overrides.cpu_time, 0);
}

TEST(RequestFromJson, RequestToJsonParsesBack) {
  ExecutionRequest req;
  req.language = "rust";
  req.code = "fn main() {}";
  req.has_input = true;
  req.input = "1 2\n";
  req.timeout = 2'500'000;
  req.dependencies = {{"rand", "0.8", ""}, {"serde", "", "https://github.com/serde-rs/serde"}};
  req.env_vars = {{"RUST_BACKTRACE", "1"}};
  ResourceLimits limits(1 << 26, 2, 8, 1 << 20, 1 << 24);

  ExecutionRequest res;
  ResourceLimits overrides;
  std::string error;
  ASSERT_TRUE(RequestFromJson(RequestToJson(req, limits), res, overrides, error)) << error;
  EXPECT_EQ(res.language, req.language);
  EXPECT_EQ(res.code, req.code);
  EXPECT_EQ(res.input, req.input);
  EXPECT_EQ(res.timeout, req.timeout);
  EXPECT_EQ(res.dependencies, req.dependencies);
  EXPECT_EQ(res.env_vars, req.env_vars);
  EXPECT_EQ(overrides, limits);
}

TEST(ResultToJson, Fields) {
  ExecutionResult res(ExecutionStatus::RUNTIME_ERROR, "Traceback");
  res.stdout_str = "partial";
  res.stats.wall_time = 123'456;
  res.stats.cpu_time = 45'678;
  res.stats.peak_memory = 10 << 20;
  res.stats.exit_code = 1;
  auto data = ResultToJson(res);
  EXPECT_EQ(data["status"], "error");
  EXPECT_EQ(data["reason"], "runtime_error");
  EXPECT_EQ(data["stdout"], "partial");
  EXPECT_EQ(data["stderr"], "Traceback");
  EXPECT_EQ(data["execution_time"], 123);
  EXPECT_EQ(data["cpu_time"], 45);
  EXPECT_EQ(data["memory_usage"], 10 << 20);
  EXPECT_EQ(data["exit_code"], 1);
  EXPECT_EQ(data["stats"]["wall_time_us"], 123'456);
  EXPECT_FALSE(data.contains("message"));
}

TEST(ResultToJson, UnsupportedLanguageKeepsReason) {
  ExecutionResult res(ExecutionStatus::UNSUPPORTED_LANGUAGE);
  res.message = "unsupported language: cobol";
  auto data = ResultToJson(res);
  EXPECT_EQ(data["status"], "setup_error");
  EXPECT_EQ(data["reason"], "unsupported_language");
  EXPECT_EQ(data["message"], "unsupported language: cobol");

  ExecutionResult back;
  std::string error;
  ASSERT_TRUE(ResultFromJson(data, back, error)) << error;
  EXPECT_EQ(back.status, ExecutionStatus::UNSUPPORTED_LANGUAGE);
  EXPECT_EQ(back.message, res.message);
}

TEST(ResultFromJson, SummaryOnly) {
  json data{
    {"stdout", "hi\n"},
    {"stderr", ""},
    {"status", "success"},
    {"reason", "success"},
    {"execution_time", 12},
    {"memory_usage", 4096},
    {"cpu_time", 3},
    {"exit_code", 0},
  };
  ExecutionResult res;
  std::string error;
  ASSERT_TRUE(ResultFromJson(data, res, error)) << error;
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS);
  EXPECT_EQ(res.stats.wall_time, 12'000);
  EXPECT_EQ(res.stats.cpu_time, 3'000);
  EXPECT_EQ(res.stats.peak_memory, 4096);

  data["reason"] = "exploded";
  EXPECT_FALSE(ResultFromJson(data, res, error));
}

TEST(ErrorJson, Shape) {
  auto data = ErrorJson("bad_request", "malformed JSON");
  EXPECT_EQ(data["status"], "error");
  EXPECT_EQ(data["reason"], "bad_request");
  EXPECT_EQ(data["stderr"], "malformed JSON");
  EXPECT_EQ(data["exit_code"], -1);
  EXPECT_EQ(data["stdout"], "");
}

TEST(DumpJson, InvalidUtf8IsReplaced) {
  json data{{"stdout", std::string("ok\xff\xfe")}};
  std::string str;
  ASSERT_NO_THROW(str = DumpJson(data));
  EXPECT_NE(str.find("ok\xEF\xBF\xBD"), std::string::npos) << str;
  EXPECT_EQ(json::parse(str)["stdout"].get<std::string>().substr(0, 2), "ok");
}

TEST(StatusReason, Unique) {
  for (auto status : {ExecutionStatus::SUCCESS, ExecutionStatus::RUNTIME_ERROR, ExecutionStatus::TIMEOUT,
                      ExecutionStatus::RESOURCE_EXCEEDED, ExecutionStatus::SETUP_ERROR,
                      ExecutionStatus::UNSUPPORTED_LANGUAGE, ExecutionStatus::BUSY}) {
    ExecutionStatus res;
    ASSERT_TRUE(ReasonToExecutionStatus(ExecutionStatusReason(status), res));
    EXPECT_EQ(res, status);
  }
  EXPECT_STREQ(ExecutionStatusWire(ExecutionStatus::TIMEOUT), "timeout");
  EXPECT_STREQ(ExecutionStatusWire(ExecutionStatus::RESOURCE_EXCEEDED), "resource_exceeded");
  EXPECT_STREQ(ExecutionStatusWire(ExecutionStatus::BUSY), "busy");
}
