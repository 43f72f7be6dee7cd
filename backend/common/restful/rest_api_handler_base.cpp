#include "rest_api_handler_base.hpp"
#include <iostream>

namespace common {

namespace {
template <typename Response>
void finalize(Response& res, unsigned int version, bool keep_alive) {
  res.version(version);
  res.keep_alive(keep_alive);
  res.set(http::field::access_control_allow_origin, "*");
  res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}
} // namespace

ApiResponse RestApiHandlerBase::handleRequest(ApiRequest&& req) {
  auto version = req.version();
  auto keep_alive = req.keep_alive();

  if (req.method() == http::verb::options) {
    StringResponse res{http::status::ok, version};
    finalize(res, version, keep_alive);
    res.prepare_payload();
    return res;
  }

  ApiResponse response;
  try {
    response = doHandleRequest(std::move(req));
  } catch (const std::exception& e) {
    std::cerr << "[http] handler error: " << e.what() << std::endl;
    response = createErrorResponse(http::status::internal_server_error, "Internal server error");
  }
  std::visit([version, keep_alive](auto& res) { finalize(res, version, keep_alive); }, response);
  return response;
}

std::optional<std::filesystem::path> RestApiHandlerBase::uploadTarget(const RequestHeader&) {
  return std::nullopt;
}

ApiResponse RestApiHandlerBase::handleUpload(RequestHeader&& header, const std::filesystem::path& body_file) {
  auto version = header.version();
  auto keep_alive = http::request<http::empty_body>{header}.keep_alive();

  ApiResponse response;
  try {
    response = doHandleUpload(std::move(header), body_file);
  } catch (const std::exception& e) {
    std::cerr << "[http] upload handler error: " << e.what() << std::endl;
    std::error_code ec;
    std::filesystem::remove(body_file, ec);
    response = createErrorResponse(http::status::internal_server_error, "Internal server error");
  }
  std::visit([version, keep_alive](auto& res) { finalize(res, version, keep_alive); }, response);
  return response;
}

ApiResponse RestApiHandlerBase::doHandleUpload(RequestHeader&&, const std::filesystem::path& body_file) {
  std::error_code ec;
  std::filesystem::remove(body_file, ec);
  return createErrorResponse(http::status::not_found, "Not found");
}

StringResponse RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  StringResponse res{status, 11};
  res.set(http::field::content_type, "application/json");
  // Stored text that is not UTF-8 must not turn a listing into a 500.
  res.body() = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.prepare_payload();
  return res;
}

StringResponse RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

}
