#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

struct HttpSessionOptions {
  std::uint64_t body_limit{1024 * 1024};           // bodies held in memory
  std::uint64_t upload_limit{2ull * 1024 * 1024 * 1024};  // bodies spooled to disk
  std::chrono::seconds read_timeout{30};           // per read, so slow uploads survive
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
              const HttpSessionOptions& options);

  void run();

private:
  void doRead();
  void onReadHeader(beast::error_code ec, std::size_t bytes_transferred);
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void startUpload(std::filesystem::path file);
  void doReadUpload();
  void onReadUpload(beast::error_code ec, std::size_t bytes_transferred);
  void dropUpload();
  void sendResponse(ApiResponse&& response);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();
  void sendError(http::status status, const std::string& message);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::empty_body>> header_parser_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::optional<http::request_parser<http::file_body>> upload_parser_;
  std::filesystem::path upload_file_;
  std::shared_ptr<void> res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  HttpSessionOptions options_;
};

class HttpServer {
public:
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler,
             HttpSessionOptions options = {});

  void run();
  tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  HttpSessionOptions options_;
};

}
