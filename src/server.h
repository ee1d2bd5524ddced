#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <httplib.h>
#include <codeexec/gate.h>
#include <codeexec/pipeline.h>

// worker threads beyond the gate capacity, so that health checks and rejections are served
extern const int kExtraWorkers;

// POST /execute and GET /health
void SetupRoutes(httplib::Server&, ExecutionPipeline&, AdmissionGate&);

// Block until the server is stopped. Return false if it cannot listen.
bool RunServer(const std::string& addr, int port, ExecutionPipeline&, AdmissionGate&);

#endif  // SERVER_H_
