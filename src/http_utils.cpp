#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codeexec/serialize.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  auto it = headers.find("Content-Type");
  return it == headers.end() ? "(no content type)" : it->second;
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

void SetJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(DumpJson(body), "application/json");
}

void SetText(httplib::Response& res, int status, const std::string& body) {
  res.status = status;
  res.set_content(body, "text/plain");
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  auto level = IsSuccess(res.status) ? spdlog::level::debug : spdlog::level::info;
  spdlog::log(level, "{} {} from {} status={} params {} content-type {} size={}",
              req.method, req.path, req.remote_addr, res.status, FormatOneParam(req.params),
              FormatOneParam(req.headers), req.body.size());
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}
