#include "api/http_server.hpp"

#include "api/control_api.hpp"
#include "core/logging/logger.hpp"

#include <httplib.h>

#include <exception>
#include <utility>

#if !defined(_WIN32)
#include <sys/socket.h>
#endif

namespace camgate::api {

namespace {

ApiRequest ToApiRequest(const httplib::Request& request) {
  ApiRequest api_request;
  api_request.method = request.method;
  api_request.path = request.path;
  // First value wins for repeated keys.
  for (const auto& [key, value] : request.params) {
    api_request.query.emplace(key, value);
  }
  return api_request;
}

} // namespace

struct HttpControlServer::Impl {
  Impl(ControlApi& api_in, core::logging::Logger& logger_in, std::size_t worker_count_in)
      : api(api_in), logger(logger_in), worker_count(worker_count_in == 0U ? 1U : worker_count_in) {}

  ControlApi& api;
  core::logging::Logger& logger;
  std::size_t worker_count = 1U;
  httplib::Server server;
  std::string host;
  std::uint16_t port = 0U;
  bool bound = false;
};

HttpControlServer::HttpControlServer(ControlApi& api, core::logging::Logger& logger,
                                     std::size_t worker_count)
    : impl_(std::make_unique<Impl>(api, logger, worker_count)) {
  Impl* impl = impl_.get();

  // Plain SO_REUSEADDR: a port already held by another listener must fail
  // to bind instead of being shared.
  impl->server.set_socket_options([](auto sock) {
    int yes = 1;
#if defined(_WIN32)
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes),
                     sizeof(yes));
#else
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#endif
  });

  impl->server.new_task_queue = [impl] { return new httplib::ThreadPool(impl->worker_count); };

  impl->server.Get(R"(/.*)", [impl](const httplib::Request& request, httplib::Response& response) {
    const ApiResponse api_response = impl->api.Handle(ToApiRequest(request));
    response.status = api_response.status;
    if (!api_response.body.empty()) {
      response.set_content(api_response.body, api_response.content_type);
    }
  });

  impl->server.set_exception_handler(
      [impl](const httplib::Request& request, httplib::Response& response, std::exception_ptr) {
        impl->logger.Error("unhandled error in request handler", {{"path", request.path}});
        response.status = 500;
        response.set_content("Internal Server Error", "text/plain");
      });
}

HttpControlServer::~HttpControlServer() {
  Stop();
}

bool HttpControlServer::Bind(const std::string& host, std::uint16_t port, std::string& error) {
  if (impl_->bound) {
    error = "server is already bound";
    return false;
  }

  if (port == 0U) {
    const int bound_port = impl_->server.bind_to_any_port(host);
    if (bound_port <= 0) {
      error = "failed to bind " + host + " on an ephemeral port";
      impl_->logger.Error("HTTP bind failed", {{"host", host}, {"port", "0"}});
      return false;
    }
    impl_->port = static_cast<std::uint16_t>(bound_port);
  } else {
    if (!impl_->server.bind_to_port(host, port)) {
      error = "failed to bind " + host + ":" + std::to_string(port);
      impl_->logger.Error("HTTP bind failed", {{"host", host}, {"port", std::to_string(port)}});
      return false;
    }
    impl_->port = port;
  }

  impl_->host = host;
  impl_->bound = true;
  impl_->logger.Info("HTTP API bound",
                     {{"host", host}, {"port", std::to_string(impl_->port)}});
  return true;
}

std::uint16_t HttpControlServer::BoundPort() const {
  return impl_->port;
}

bool HttpControlServer::Serve(std::string& error) {
  if (!impl_->bound) {
    error = "server must be bound before serving";
    return false;
  }

  impl_->logger.Info("HTTP API started", {{"port", std::to_string(impl_->port)}});
  const bool clean = impl_->server.listen_after_bind();
  impl_->logger.Info("HTTP API stopped", {{"port", std::to_string(impl_->port)}});
  if (!clean) {
    error = "listener on port " + std::to_string(impl_->port) + " stopped with an error";
    return false;
  }
  return true;
}

void HttpControlServer::Stop() {
  if (impl_ != nullptr && impl_->server.is_running()) {
    impl_->server.stop();
  }
}

bool HttpControlServer::IsRunning() const {
  return impl_->server.is_running();
}

} // namespace camgate::api
