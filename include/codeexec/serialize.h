#ifndef INCLUDE_CODEEXEC_SERIALIZE_H_
#define INCLUDE_CODEEXEC_SERIALIZE_H_

#include <string>
#include <nlohmann/json.hpp>

#include "request.h"

// "name==version", "name@version" (a leading @ is part of the name) or "name"
bool ParseDependency(const std::string&, Dependency&);

// Body of POST /execute. overrides gets the "limits" object (absent fields are 0).
// error describes the first problem if false is returned.
bool RequestFromJson(const nlohmann::json&, ExecutionRequest&, ResourceLimits& overrides, std::string& error);
bool RequestFromJson(const std::string& body, ExecutionRequest&, ResourceLimits& overrides, std::string& error);
nlohmann::json RequestToJson(const ExecutionRequest&, const ResourceLimits& overrides = ResourceLimits());

nlohmann::json ResultToJson(const ExecutionResult&);
bool ResultFromJson(const nlohmann::json&, ExecutionResult&, std::string& error);
// response for a request that never reached the pipeline
nlohmann::json ErrorJson(const std::string& reason, const std::string& message);

// program output is not necessarily UTF-8; invalid sequences are replaced
std::string DumpJson(const nlohmann::json&);

#endif  // INCLUDE_CODEEXEC_SERIALIZE_H_
