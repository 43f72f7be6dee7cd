#pragma once
#include "application/asset_server.hpp"
#include "application/media_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hls_media {

/*
  GET  /api/video/                               asset list
  POST /api/video/upload/?title=..&filename=..   raw body = video bytes, spooled to disk
  GET  /api/video/<id>/thumbnail/
  GET  /api/video/<id>/<quality>/index.m3u8
  GET  /api/video/<id>/<quality>/<segment>[/]
*/
class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<const AssetServer> asset_server,
                 std::shared_ptr<MediaService> media_service);

  // Splits a request path into percent-decoded, non-empty segments.
  // nullopt on a malformed escape.
  static std::optional<std::vector<std::string>> splitPath(std::string_view path);
  static std::map<std::string, std::string> parseQuery(std::string_view query);
  static std::optional<std::string> percentDecode(std::string_view text, bool plus_is_space);

  std::optional<std::filesystem::path> uploadTarget(const common::RequestHeader& header) override;

protected:
  common::ApiResponse doHandleRequest(common::ApiRequest&& req) override;
  common::ApiResponse doHandleUpload(common::RequestHeader&& header,
                                     const std::filesystem::path& body_file) override;

private:
  common::ApiResponse handleList();
  // Splits the target into path and query.
  static std::pair<std::string_view, std::string_view> splitTarget(std::string_view target);
  static bool isUploadRoute(std::string_view path);
  common::ApiResponse handleFile(const MediaResult<ServedFile>& served);

  common::StringResponse notFoundResponse();
  common::StringResponse methodNotAllowed(std::string_view allowed);
  common::StringResponse errorResponse(const MediaError& error);

  std::shared_ptr<const AssetServer> asset_server_;
  std::shared_ptr<MediaService> media_service_;
};

} // namespace hls_media
