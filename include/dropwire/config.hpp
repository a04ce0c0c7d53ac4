#pragma once
#include "dropwire.hpp"
#include "transport.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace dropwire {

struct RetryPolicy {
  unsigned max_attempts = 3;  // sends per chunk, first one included
  Millis backoff{200};        // multiplied by the attempt number
};

struct Timeouts {
  Millis connect{10000};
  Millis handshake{30000};
  Millis key_exchange{30000};
  Millis chunk_ack{10000};
  Millis idle{60000};  // receiver: longest silence tolerated mid-session
};

struct SenderConfig {
  std::string receiver_host = "127.0.0.1";
  std::uint16_t receiver_port = kDefaultPort;
  bool encryption_enabled = false;
  std::string peer_name = "sender";
  RetryPolicy retry;
  Timeouts timeouts;
};

struct ReceiverConfig {
  std::string listen_host;  // empty: all interfaces
  std::uint16_t listen_port = kDefaultPort;
  std::string receive_directory = "received";
  bool encryption_allowed = true;
  std::uint64_t max_file_size = 0;  // 0: unlimited
  RetryPolicy retry;
  Timeouts timeouts;
};

} // namespace dropwire
