#include "dropwire/agent.hpp"
#include "dropwire/util.hpp"

#include <csignal>
#include <iostream>
#include <string>

using namespace dropwire;

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_sigint(int) { g_interrupted = 1; }

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  dropwire-send <host> <port> <file> <encrypt> [-v]\n\n";
  std::cerr << "encrypt:\n";
  std::cerr << "  0  = plaintext\n";
  std::cerr << "  1  = X25519 + AES-256-GCM (falls back to plaintext if the receiver declines)\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  dropwire-send 192.168.1.20 9876 report.pdf 1\n";
}

int main(int argc, char** argv) {
  if (argc != 5 && argc != 6) {
    usage();
    return 1;
  }
  if (argc == 6) {
    if (std::string(argv[5]) != "-v") {
      usage();
      return 1;
    }
    set_verbose(true);
  }

  try {
    SendRequest req;
    req.receiver_host = argv[1];
    if (!parse_port(argv[2], 1, req.receiver_port)) {
      std::cerr << "[sender] invalid port: " << argv[2] << "\n";
      usage();
      return 1;
    }
    req.file_path = argv[3];
    req.encryption_enabled = std::stoi(argv[4]) != 0;

    std::signal(SIGINT, on_sigint);

    SendAgent agent(SenderConfig{});
    ensure(agent.submit(req), "sender is busy");

    bool cancel_sent = false;
    for (;;) {
      if (g_interrupted && !cancel_sent) {
        std::cerr << "[sender] cancelling\n";
        agent.cancel();
        cancel_sent = true;
      }

      std::optional<Event> ev = agent.events().pop_for(Millis(200));
      if (!ev) continue;

      if (const auto* p = std::get_if<ProgressUpdate>(&*ev)) {
        std::cerr << "\r[sender] " << p->chunks_sent << "/" << p->chunks_total << " chunks, "
                  << p->bytes_sent << "/" << p->bytes_total << " bytes" << std::flush;
        if (p->chunks_sent == p->chunks_total) std::cerr << "\n";
      } else if (const auto* r = std::get_if<TransferResult>(&*ev)) {
        if (r->outcome == Outcome::Success) {
          std::cerr << "[sender] transfer complete\n";
          return 0;
        }
        std::cerr << "\n[sender] transfer " << to_string(r->outcome) << " (" << to_string(r->reason)
                  << "): " << r->detail << "\n";
        return r->outcome == Outcome::Aborted ? 130 : 2;
      }
    }

  } catch (const std::exception& e) {
    std::cerr << "[sender] error: " << e.what() << "\n";
    return 1;
  }
}
