#pragma once
#include "dropwire.hpp"
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace dropwire {

using Millis = std::chrono::milliseconds;

class ITransport {
public:
  virtual ~ITransport() = default;

  // Blocking exact send
  virtual void send_all(const std::uint8_t* data, std::size_t n) = 0;

  // Reads whatever is available, up to n bytes. Returns 0 if nothing
  // arrived within timeout; throws Error(Transport) on EOF or failure.
  virtual std::size_t recv_some(std::uint8_t* out, std::size_t n, Millis timeout) = 0;

  virtual bool is_open() const noexcept = 0;
  virtual void close() noexcept = 0;
};

// POSIX TCP transport (Linux/macOS)
class TcpTransport final : public ITransport {
public:
  TcpTransport();
  explicit TcpTransport(int connected_fd);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  // Client-side connect, bounded by timeout
  void connect(const std::string& host, std::uint16_t port, Millis timeout);

  void send_all(const std::uint8_t* data, std::size_t n) override;
  std::size_t recv_some(std::uint8_t* out, std::size_t n, Millis timeout) override;

  bool is_open() const noexcept override { return fd_ >= 0; }
  void close() noexcept override;

  std::string peer_address() const;

private:
  int fd_{-1};
};

// Bound listening socket; connections are accepted one at a time.
class TcpListener {
public:
  TcpListener() = default;
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Empty bind_host binds all interfaces. Port 0 picks an ephemeral port.
  void listen(const std::string& bind_host, std::uint16_t port);

  // nullptr if no client connected within timeout
  std::unique_ptr<TcpTransport> accept(Millis timeout);

  std::uint16_t local_port() const;
  bool is_open() const noexcept { return fd_ >= 0; }
  void close() noexcept;

private:
  int fd_{-1};
};

struct LoopbackPipe;

// In-process duplex byte stream; make_pair() returns both connected ends.
class LoopbackTransport final : public ITransport {
public:
  static std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>> make_pair();

  LoopbackTransport(std::shared_ptr<LoopbackPipe> in, std::shared_ptr<LoopbackPipe> out);
  ~LoopbackTransport() override;

  void send_all(const std::uint8_t* data, std::size_t n) override;
  std::size_t recv_some(std::uint8_t* out, std::size_t n, Millis timeout) override;

  bool is_open() const noexcept override { return open_; }
  void close() noexcept override;

private:
  std::shared_ptr<LoopbackPipe> in_;
  std::shared_ptr<LoopbackPipe> out_;
  bool open_{true};
};

} // namespace dropwire
