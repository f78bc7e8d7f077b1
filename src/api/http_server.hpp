#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::api {

class ControlApi;

// HTTP listener in front of `ControlApi`.
//
// Usage: `Bind` once, then `Serve` blocks until `Stop` is called from another
// thread. Each worker handles one request at a time; a capture request keeps
// its worker busy for up to the capture timeout.
class HttpControlServer {
public:
  HttpControlServer(ControlApi& api, core::logging::Logger& logger, std::size_t worker_count = 4U);
  ~HttpControlServer();

  HttpControlServer(const HttpControlServer&) = delete;
  HttpControlServer& operator=(const HttpControlServer&) = delete;

  // Port 0 binds an ephemeral port; read it back with `BoundPort`.
  bool Bind(const std::string& host, std::uint16_t port, std::string& error);
  std::uint16_t BoundPort() const;

  bool Serve(std::string& error);
  void Stop();
  bool IsRunning() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace camgate::api
