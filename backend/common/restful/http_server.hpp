#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

struct HttpServerLimits {
  std::size_t body_limit{1024 * 1024};
  std::chrono::seconds read_timeout{30};
};

// Serves exactly one request per connection: read, answer, close. Bodies
// over the limit are answered with 413 without reaching the handler.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler, HttpServerLimits limits);

  void run();

private:
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void respond(StringResponse&& response);
  void onWrite(beast::error_code ec, std::size_t bytes_transferred);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request_parser<http::string_body> parser_;
  StringResponse res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  HttpServerLimits limits_;
};

// Accepts connections on `endpoint` and hands each request to the handler.
// Runs on the caller's io_context; stop() closes the acceptor so the accept
// loop winds down.
class HttpServer {
public:
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler,
             HttpServerLimits limits = {});

  void run();
  void stop();

  tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  HttpServerLimits limits_;
};

}
