#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Responses and request logging of the HTTP server

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace http_utils {

std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);

bool IsSuccess(int code);

void SetJson(httplib::Response& res, int status, const nlohmann::json& body);
void SetText(httplib::Response& res, int status, const std::string& body);

// debug for successful requests, info otherwise
void LogRequest(const httplib::Request&, const httplib::Response&);

} // namespace http_utils

bool IsSuccess(const httplib::Result& res);

#endif  // HTTP_UTILS_H_
