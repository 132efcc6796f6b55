#pragma once

#include "api/api_router.h"
#include "common/logger.h"
#include "services/service.h"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <set>
#include <thread>

namespace trackcast {

// HTTP/1.1 front end. One io thread drives every connection, so requests
// reach the router one at a time. Each connection serves a single request
// and is dropped when it stays silent past the request timeout.
class HttpServer : public Service {
public:
  static constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};

  HttpServer(const std::string &address, int port, ApiRouter &router,
             std::chrono::milliseconds request_timeout = kDefaultRequestTimeout);
  ~HttpServer() override;

  bool init() override;
  bool start() override;
  bool stop() override;
  bool shutdown() override;

  // the actual port once bound; differs from the configured one for port 0
  int port() const { return port_; }

  size_t open_connections() const { return connection_count_; }

private:
  class Session;

  void io_loop();
  void do_accept();
  void close_sessions();

  std::string address_;
  int port_;
  ApiRouter &router_;
  std::chrono::milliseconds request_timeout_;

  std::shared_ptr<spdlog::logger> logger_;

  boost::asio::io_context ioc_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // touched only on the io thread
  std::set<std::shared_ptr<Session>> sessions_;
  std::atomic<size_t> connection_count_{0};

  std::atomic<bool> running_{false};
  std::thread io_thread_;
};

} // namespace trackcast
