#include "server.h"

#include <spdlog/spdlog.h>
#include <codeexec/limits.h>
#include <codeexec/serialize.h>
#include "http_utils.h"

const int kExtraWorkers = 4;

void SetupRoutes(httplib::Server& server, ExecutionPipeline& pipeline, AdmissionGate& gate) {
  using http_utils::SetJson;
  using http_utils::SetText;

  server.Post("/execute", [&pipeline](const httplib::Request& req, httplib::Response& res) {
    ExecutionRequest request;
    ResourceLimits overrides;
    std::string error;
    if (!RequestFromJson(req.body, request, overrides, error)) {
      SetJson(res, 400, ErrorJson("bad_request", error));
      return;
    }
    auto limits = ResolveLimits(overrides, pipeline.Maxima());
    auto result = pipeline.Execute(request, limits);
    SetJson(res, result.status == ExecutionStatus::BUSY ? 503 : 200, ResultToJson(result));
  });
  server.Get("/health", [&gate](const httplib::Request&, httplib::Response& res) {
    if (gate.Available() > 0) {
      SetText(res, 200, "OK");
    } else {
      SetText(res, 503, "Busy");
    }
  });
  server.set_logger(http_utils::LogRequest);
}

bool RunServer(const std::string& addr, int port, ExecutionPipeline& pipeline, AdmissionGate& gate) {
  httplib::Server server;
  int workers = gate.Capacity() + kExtraWorkers;
  server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
  SetupRoutes(server, pipeline, gate);
  spdlog::info("Listening on {}:{} workers={}", addr, port, workers);
  if (!server.listen(addr.c_str(), port)) {
    spdlog::error("Failed to listen on {}:{}", addr, port);
    return false;
  }
  return true;
}
