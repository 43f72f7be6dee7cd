#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace hls_media {

enum class ErrorCode {
  NotFound,
  EncodingFailure,
  ThumbnailFailure,
  StorageFailure,
  QueueFailure,
  InvalidArgument,
};

struct MediaError {
  ErrorCode code;
  std::string message;
};

template <typename T>
using MediaResult = std::expected<T, MediaError>;

inline std::unexpected<MediaError> makeError(ErrorCode code, std::string message) {
  return std::unexpected(MediaError{code, std::move(message)});
}

// Lookups never say why they failed; callers get the same answer for
// "malformed", "escaping" and "missing".
inline std::unexpected<MediaError> notFound() {
  return makeError(ErrorCode::NotFound, "Not found");
}

constexpr std::string_view toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::EncodingFailure: return "encoding_failure";
    case ErrorCode::ThumbnailFailure: return "thumbnail_failure";
    case ErrorCode::StorageFailure: return "storage_failure";
    case ErrorCode::QueueFailure: return "queue_failure";
    case ErrorCode::InvalidArgument: return "invalid_argument";
  }
  return "unknown";
}

} // namespace hls_media
