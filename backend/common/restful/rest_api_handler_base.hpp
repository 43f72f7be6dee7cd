#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

using StringResponse = http::response<http::string_body>;
// file_body streams from disk in chunks while writing
using FileResponse = http::response<http::file_body>;
using ApiResponse = std::variant<StringResponse, FileResponse>;
using ApiRequest = http::request<http::string_body>;
using RequestHeader = http::request_header<>;

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  ApiResponse handleRequest(ApiRequest&& req);

  // Routes that take large bodies name a file here; the session writes the
  // body straight into it instead of holding it in memory.
  virtual std::optional<std::filesystem::path> uploadTarget(const RequestHeader& header);

  // Called once the body named by uploadTarget is complete on disk. The
  // handler owns the file from here on.
  ApiResponse handleUpload(RequestHeader&& header, const std::filesystem::path& body_file);

protected:
  virtual ApiResponse doHandleRequest(ApiRequest&& req) = 0;
  virtual ApiResponse doHandleUpload(RequestHeader&& header, const std::filesystem::path& body_file);

  StringResponse createJsonResponse(
    http::status status, const nlohmann::json& json);

  StringResponse createErrorResponse(
    http::status status, const std::string& message);
};

}
