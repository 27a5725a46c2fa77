#include "http_server.hpp"
#include <iostream>

namespace common {

HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       HttpServerLimits limits)
  : ioc_(ioc), acceptor_(ioc), api_handler_(std::move(api_handler)), limits_(limits) {

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

void HttpServer::stop() {
  net::post(ioc_, [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
  });
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
    return;
  }

  if (ec) {
    std::cerr << "[http] accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, limits_)->run();
  }

  doAccept();
}

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         HttpServerLimits limits)
  : stream_(std::move(socket)), api_handler_(std::move(api_handler)), limits_(limits) {
  parser_.body_limit(limits_.body_limit);
}

void HttpSession::run() {
  stream_.expires_after(limits_.read_timeout);
  http::async_read(stream_, buffer_, parser_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::body_limit) {
    StringResponse response{http::status::payload_too_large, 11};
    response.set(http::field::content_type, "application/json");
    response.body() = R"({"ok":false,"error":"Payload too large"})";
    return respond(std::move(response));
  }

  if (ec) {
    if (ec != http::error::end_of_stream) {
      std::cerr << "[http] read error: " << ec.message() << std::endl;
    }
    return;
  }

  respond(api_handler_->handleRequest(parser_.release()));
}

void HttpSession::respond(StringResponse&& response) {
  res_ = std::move(response);
  res_.keep_alive(false);
  res_.prepare_payload();

  http::async_write(stream_, res_,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this()));
}

void HttpSession::onWrite(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "[http] write error: " << ec.message() << std::endl;
  }

  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
