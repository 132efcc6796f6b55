#include "api/http_server.h"
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace trackcast {

namespace {
constexpr size_t kMaxBodyBytes = 32 * 1024 * 1024;
}

class HttpServer::Session : public std::enable_shared_from_this<Session> {
public:
  Session(HttpServer &server, tcp::socket socket)
      : server_(server), stream_(std::move(socket)) {
    parser_.body_limit(kMaxBodyBytes);
  }

  void run() { read(); }

  void close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.close();
  }

private:
  void read() {
    stream_.expires_after(server_.request_timeout_);
    http::async_read(stream_, buffer_, parser_,
                     [self = shared_from_this()](beast::error_code ec,
                                                 std::size_t) {
                       self->on_read(ec);
                     });
  }

  void on_read(beast::error_code ec) {
    if (ec) {
      if (ec == beast::error::timeout) {
        LOG_DEBUG(server_.logger_, "closing idle connection");
      } else if (ec != http::error::end_of_stream &&
                 ec != asio::error::operation_aborted) {
        LOG_DEBUG(server_.logger_, "failed to read request: {}",
                  ec.message());
      }
      finish();
      return;
    }

    auto &req = parser_.get();
    ApiRequest request{std::string(req.method_string()),
                       std::string(req.target()), std::move(req.body()),
                       std::string(req[http::field::content_type])};

    auto result = server_.router_.handle(request);

    response_.result(static_cast<http::status>(result.status));
    response_.version(req.version());
    response_.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response_.set(http::field::content_type, result.content_type);
    response_.keep_alive(false);
    response_.body() = std::move(result.body);
    response_.prepare_payload();

    stream_.expires_after(server_.request_timeout_);
    http::async_write(stream_, response_,
                      [self = shared_from_this()](beast::error_code ec,
                                                  std::size_t) {
                        self->on_write(ec);
                      });
  }

  void on_write(beast::error_code ec) {
    if (ec) {
      LOG_DEBUG(server_.logger_, "failed to write response: {}",
                ec.message());
    }
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    finish();
  }

  void finish() {
    if (server_.sessions_.erase(shared_from_this()) > 0) {
      server_.connection_count_--;
    }
  }

  HttpServer &server_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request_parser<http::string_body> parser_;
  http::response<http::string_body> response_;
};

HttpServer::HttpServer(const std::string &address, int port,
                       ApiRouter &router,
                       std::chrono::milliseconds request_timeout)
    : Service("http_server"), address_(address), port_(port),
      router_(router), request_timeout_(request_timeout),
      logger_(Logger::get("http")) {}

HttpServer::~HttpServer() {
  stop();
  shutdown();
}

bool HttpServer::init() {
  boost::system::error_code ec;
  auto address = asio::ip::make_address(address_, ec);
  if (ec) {
    LOG_ERROR(logger_, "invalid listen address {}: {}", address_,
              ec.message());
    return false;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
  tcp::endpoint endpoint(address, static_cast<unsigned short>(port_));

  acceptor_->open(endpoint.protocol(), ec);
  if (ec) {
    LOG_ERROR(logger_, "failed to open acceptor: {}", ec.message());
    acceptor_.reset();
    return false;
  }

  acceptor_->set_option(asio::socket_base::reuse_address(true), ec);
  if (ec) {
    LOG_WARN(logger_, "setsockopt SO_REUSEADDR failed");
  }

  acceptor_->bind(endpoint, ec);
  if (ec) {
    LOG_ERROR(logger_, "bind failed on {}:{}: {}", address_, port_,
              ec.message());
    acceptor_.reset();
    return false;
  }

  acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    LOG_ERROR(logger_, "listen failed: {}", ec.message());
    acceptor_.reset();
    return false;
  }

  port_ = acceptor_->local_endpoint().port();

  LOG_INFO(logger_, "http server initialized on {}:{}", address_, port_);
  return true;
}

bool HttpServer::start() {
  if (!acceptor_) {
    LOG_ERROR(logger_, "http server started before init");
    return false;
  }
  if (running_) {
    return true;
  }

  running_ = true;
  ioc_.restart();
  do_accept();
  io_thread_ = std::thread(&HttpServer::io_loop, this);
  LOG_INFO(logger_, "http server started");
  return true;
}

bool HttpServer::stop() {
  if (!running_ && !io_thread_.joinable()) {
    return true;
  }

  LOG_INFO(logger_, "stopping http server");
  running_ = false;

  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  return true;
}

bool HttpServer::shutdown() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
    LOG_INFO(logger_, "http server shutdown");
  }
  return true;
}

void HttpServer::do_accept() {
  acceptor_->async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      LOG_ERROR(logger_, "accept failed: {}", ec.message());
    } else {
      auto session = std::make_shared<Session>(*this, std::move(socket));
      sessions_.insert(session);
      connection_count_++;
      session->run();
    }

    if (running_) {
      do_accept();
    }
  });
}

void HttpServer::io_loop() {
  while (running_) {
    try {
      ioc_.run_for(std::chrono::milliseconds(100)); // 100ms slice
    } catch (const std::exception &e) {
      LOG_ERROR(logger_, "io loop error: {}", e.what());
    }
  }

  close_sessions();
}

void HttpServer::close_sessions() {
  boost::system::error_code ec;
  acceptor_->cancel(ec);

  if (!sessions_.empty()) {
    LOG_INFO(logger_, "closing {} open connections", sessions_.size());
  }
  for (auto &session : sessions_) {
    session->close();
  }

  // let the aborted handlers run and release their sessions
  ioc_.restart();
  try {
    ioc_.poll();
  } catch (const std::exception &e) {
    LOG_ERROR(logger_, "io loop error: {}", e.what());
  }
  sessions_.clear();
  connection_count_ = 0;
}

} // namespace trackcast
