#include "rest_api_handler.hpp"
#include <charconv>
#include <iostream>

namespace hls_media {

namespace {
int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<std::int64_t> parseAssetId(std::string_view text) {
  std::int64_t id = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return id;
}

std::string thumbnailUrl(const Asset& asset) {
  if (!asset.hasThumbnail()) {
    return "";
  }
  return "/api/video/" + std::to_string(asset.id) + "/thumbnail/";
}
} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<const AssetServer> asset_server,
                               std::shared_ptr<MediaService> media_service)
  : asset_server_(std::move(asset_server)), media_service_(std::move(media_service)) {}

std::optional<std::string> RestApiHandler::percentDecode(std::string_view text, bool plus_is_space) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%') {
      if (i + 2 >= text.size()) {
        return std::nullopt;
      }
      int hi = hexValue(text[i + 1]);
      int lo = hexValue(text[i + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else if (c == '+' && plus_is_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::optional<std::vector<std::string>> RestApiHandler::splitPath(std::string_view path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    auto raw = path.substr(start, end - start);
    if (!raw.empty()) {
      // Decoded after splitting: an encoded '/' stays inside its segment.
      auto decoded = percentDecode(raw, false);
      if (!decoded) {
        return std::nullopt;
      }
      segments.push_back(std::move(*decoded));
    }
    start = end + 1;
  }
  return segments;
}

std::map<std::string, std::string> RestApiHandler::parseQuery(std::string_view query) {
  std::map<std::string, std::string> params;
  size_t start = 0;
  while (start < query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string_view::npos) end = query.size();
    auto pair = query.substr(start, end - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto key = percentDecode(pair.substr(0, eq), true);
      auto value = eq == std::string_view::npos ? std::optional<std::string>("")
                                                : percentDecode(pair.substr(eq + 1), true);
      if (key && value) {
        params[*key] = *value;
      }
    }
    start = end + 1;
  }
  return params;
}

std::pair<std::string_view, std::string_view> RestApiHandler::splitTarget(std::string_view target) {
  if (auto q = target.find('?'); q != std::string_view::npos) {
    return {target.substr(0, q), target.substr(q + 1)};
  }
  return {target, {}};
}

bool RestApiHandler::isUploadRoute(std::string_view path) {
  auto segments = splitPath(path);
  return segments && segments->size() == 3 && (*segments)[0] == "api" && (*segments)[1] == "video" &&
         (*segments)[2] == "upload";
}

std::optional<std::filesystem::path> RestApiHandler::uploadTarget(const common::RequestHeader& header) {
  if (header.method() != http::verb::post) {
    return std::nullopt;
  }
  std::string_view target(header.target().data(), header.target().size());
  if (!isUploadRoute(splitTarget(target).first)) {
    return std::nullopt;
  }

  auto file = media_service_->reserveUploadFile();
  if (!file) {
    std::cerr << "[http] " << file.error().message << std::endl;
    return std::nullopt;
  }
  return *file;
}

common::ApiResponse RestApiHandler::doHandleRequest(common::ApiRequest&& req) {
  std::string_view target(req.target().data(), req.target().size());
  auto path = splitTarget(target).first;

  auto segments = splitPath(path);
  if (!segments || segments->size() < 2 || (*segments)[0] != "api" || (*segments)[1] != "video") {
    return notFoundResponse();
  }
  const auto& seg = *segments;
  const bool is_get = req.method() == http::verb::get;

  if (seg.size() == 2) {
    if (!is_get) return methodNotAllowed("GET");
    return handleList();
  }

  if (seg.size() == 3 && seg[2] == "upload") {
    if (req.method() != http::verb::post) return methodNotAllowed("POST");
    // Upload bodies are spooled by the session; reaching here means no spool
    // file could be reserved.
    return errorResponse(MediaError{ErrorCode::StorageFailure, "upload body was not spooled"});
  }

  if (seg.size() != 4 && seg.size() != 5) {
    return notFoundResponse();
  }
  auto asset_id = parseAssetId(seg[2]);
  if (!asset_id) {
    return notFoundResponse();
  }

  if (seg.size() == 4) {
    if (seg[3] != "thumbnail") return notFoundResponse();
    if (!is_get) return methodNotAllowed("GET");
    return handleFile(asset_server_->serveThumbnail(*asset_id));
  }

  if (!is_get) return methodNotAllowed("GET");
  if (seg[4] == kManifestName) {
    return handleFile(asset_server_->serveManifest(*asset_id, seg[3]));
  }
  return handleFile(asset_server_->serveSegment(*asset_id, seg[3], seg[4]));
}

common::ApiResponse RestApiHandler::handleList() {
  auto assets = media_service_->listAssets();
  if (!assets) {
    return errorResponse(assets.error());
  }

  nlohmann::json list = nlohmann::json::array();
  for (const auto& asset : *assets) {
    list.push_back({
      {"id", asset.id},
      {"created_at", asset.created_at},
      {"title", asset.title},
      {"description", asset.description},
      {"thumbnail_url", thumbnailUrl(asset)},
      {"category", asset.category},
    });
  }
  return createJsonResponse(http::status::ok, list);
}

common::ApiResponse RestApiHandler::doHandleUpload(common::RequestHeader&& header,
                                                   const std::filesystem::path& body_file) {
  std::string_view target(header.target().data(), header.target().size());
  auto params = parseQuery(splitTarget(target).second);
  UploadRequest upload{
    .title = params["title"],
    .description = params["description"],
    .category = params["category"],
    .filename = params["filename"],
  };

  auto created = media_service_->uploadAsset(upload, body_file);
  if (!created) {
    return errorResponse(created.error());
  }

  std::cout << "[http] uploaded asset " << created->id << std::endl;
  return createJsonResponse(http::status::created, {
    {"id", created->id},
    {"processed", created->processed},
  });
}

common::ApiResponse RestApiHandler::handleFile(const MediaResult<ServedFile>& served) {
  if (!served) {
    return notFoundResponse();
  }

  http::file_body::value_type body;
  beast::error_code ec;
  body.open(served->path.c_str(), beast::file_mode::scan, ec);
  if (ec) {
    // Removed between the existence check and the open.
    return notFoundResponse();
  }

  common::FileResponse res{std::piecewise_construct,
                           std::make_tuple(std::move(body)),
                           std::make_tuple(http::status::ok, 11)};
  res.set(http::field::content_type, served->content_type);
  res.prepare_payload();
  return res;
}

common::StringResponse RestApiHandler::notFoundResponse() {
  return createErrorResponse(http::status::not_found, "Not found");
}

common::StringResponse RestApiHandler::methodNotAllowed(std::string_view allowed) {
  auto res = createErrorResponse(http::status::method_not_allowed, "Method not allowed");
  res.set(http::field::allow, std::string(allowed));
  return res;
}

common::StringResponse RestApiHandler::errorResponse(const MediaError& error) {
  switch (error.code) {
    case ErrorCode::NotFound:
      return notFoundResponse();
    case ErrorCode::InvalidArgument:
      return createErrorResponse(http::status::bad_request, error.message);
    default:
      std::cerr << "[http] " << toString(error.code) << ": " << error.message << std::endl;
      return createErrorResponse(http::status::internal_server_error, "Internal server error");
  }
}

} // namespace hls_media
