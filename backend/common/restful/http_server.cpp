#include "http_server.hpp"
#include <iostream>
#include <utility>
#include <nlohmann/json.hpp>

namespace common {

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       HttpSessionOptions options)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler), options_(options) {

  beast::error_code ec;

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw std::runtime_error("Failed to open acceptor: " + ec.message());
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw std::runtime_error("Failed to set reuse_address: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw std::runtime_error("Failed to bind: " + ec.message());
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen: " + ec.message());
  }
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    std::cerr << "[http] accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, options_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         const HttpSessionOptions& options)
  : stream_(std::move(socket)), api_handler_(api_handler), options_(options) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  parser_.reset();
  upload_parser_.reset();
  header_parser_.emplace();
  // Checked per route once the header is in.
  header_parser_->body_limit(options_.upload_limit);

  stream_.expires_after(options_.read_timeout);

  http::async_read_header(stream_, buffer_, *header_parser_,
                          beast::bind_front_handler(&HttpSession::onReadHeader, shared_from_this()));
}

void HttpSession::onReadHeader(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec == http::error::body_limit) {
    return sendError(http::status::payload_too_large, "Request body too large");
  }

  if (ec) {
    std::cerr << "[http] read error: " << ec.message() << std::endl;
    return;
  }

  if (auto file = api_handler_->uploadTarget(header_parser_->get())) {
    return startUpload(std::move(*file));
  }

  auto length = header_parser_->content_length();
  if (length && *length > options_.body_limit) {
    return sendError(http::status::payload_too_large, "Request body too large");
  }

  parser_.emplace(std::move(*header_parser_));
  header_parser_.reset();
  parser_->body_limit(options_.body_limit);

  stream_.expires_after(options_.read_timeout);
  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::body_limit) {
    return sendError(http::status::payload_too_large, "Request body too large");
  }

  if (ec) {
    std::cerr << "[http] read error: " << ec.message() << std::endl;
    return;
  }

  sendResponse(api_handler_->handleRequest(parser_->release()));
}

void HttpSession::startUpload(std::filesystem::path file) {
  upload_parser_.emplace(std::move(*header_parser_));
  header_parser_.reset();
  upload_parser_->body_limit(options_.upload_limit);

  beast::error_code ec;
  upload_parser_->get().body().open(file.c_str(), beast::file_mode::write, ec);
  if (ec) {
    std::cerr << "[http] cannot open " << file << ": " << ec.message() << std::endl;
    return sendError(http::status::internal_server_error, "Internal server error");
  }
  upload_file_ = std::move(file);

  if (upload_parser_->is_done()) {
    // Header-only request: an empty body still goes to the handler.
    return onReadUpload({}, 0);
  }
  doReadUpload();
}

void HttpSession::doReadUpload() {
  // Deadline per chunk: a large upload only fails when the client stalls.
  stream_.expires_after(options_.read_timeout);
  http::async_read_some(stream_, buffer_, *upload_parser_,
                        beast::bind_front_handler(&HttpSession::onReadUpload, shared_from_this()));
}

void HttpSession::onReadUpload(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::body_limit) {
    dropUpload();
    return sendError(http::status::payload_too_large, "Request body too large");
  }

  if (ec) {
    std::cerr << "[http] upload read error: " << ec.message() << std::endl;
    dropUpload();
    return;
  }

  if (!upload_parser_->is_done()) {
    return doReadUpload();
  }

  auto req = upload_parser_->release();
  req.body().close();
  auto file = std::exchange(upload_file_, {});
  http::request_header<> header(std::move(req.base()));
  sendResponse(api_handler_->handleUpload(std::move(header), file));
}

void HttpSession::dropUpload() {
  if (upload_parser_) {
    upload_parser_->get().body().close();
    upload_parser_.reset();
  }
  if (!upload_file_.empty()) {
    std::error_code ec;
    std::filesystem::remove(upload_file_, ec);
    upload_file_.clear();
  }
}

void HttpSession::sendResponse(ApiResponse&& response) {
  // writes may stream large files; the read deadline must not cut them off
  stream_.expires_never();

  std::visit([this](auto&& res) {
    using Response = std::decay_t<decltype(res)>;
    auto sp = std::make_shared<Response>(std::move(res));
    res_ = sp;
    http::async_write(stream_, *sp,
                      beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                                sp->need_eof()));
  }, std::move(response));
}

void HttpSession::sendError(http::status status, const std::string& message) {
  auto response = std::make_shared<StringResponse>(status, 11);
  response->set(http::field::content_type, "application/json");
  response->body() = nlohmann::json{{"success", false}, {"error", message}}.dump();
  response->keep_alive(false);
  response->prepare_payload();
  res_ = response;

  http::async_write(stream_, *response,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), true));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "[http] write error: " << ec.message() << std::endl;
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
