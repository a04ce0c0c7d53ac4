#include "dropwire/agent.hpp"
#include "dropwire/util.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace dropwire;

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_sigint(int) { g_interrupted = 1; }

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  dropwire-recv <bind_host> <port> <receive_dir> <allow_encrypt> [cleanup_days] [-v]\n\n";
  std::cerr << "allow_encrypt:\n";
  std::cerr << "  0  = decline encryption requests\n";
  std::cerr << "  1  = accept encryption requests\n\n";
  std::cerr << "cleanup_days:\n";
  std::cerr << "  delete received files older than this many days at startup (0 = keep)\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  dropwire-recv 0.0.0.0 9876 received 1 7\n";
}

static void print_received(const FileStore& store) {
  for (const std::string& name : store.list_received()) {
    std::cerr << "[receiver]   " << name << "\n";
  }
}

int main(int argc, char** argv) {
  int nargs = argc;
  if (nargs > 1 && std::string(argv[nargs - 1]) == "-v") {
    set_verbose(true);
    --nargs;
  }
  if (nargs != 5 && nargs != 6) {
    usage();
    return 1;
  }

  try {
    ReceiverConfig cfg;
    cfg.listen_host = argv[1];
    if (cfg.listen_host == "0.0.0.0") cfg.listen_host.clear();
    if (!parse_port(argv[2], 0, cfg.listen_port)) {
      std::cerr << "[receiver] invalid port: " << argv[2] << "\n";
      usage();
      return 1;
    }
    cfg.receive_directory = argv[3];
    cfg.encryption_allowed = std::stoi(argv[4]) != 0;
    const int cleanup_days = nargs == 6 ? std::stoi(argv[5]) : 0;
    ensure(cleanup_days >= 0, ErrorKind::Validation, "cleanup_days must not be negative");

    ReceiverServer server(cfg);
    if (cleanup_days > 0) {
      std::size_t n = server.store().cleanup_old(std::chrono::hours(24 * cleanup_days));
      std::cerr << "[receiver] removed " << n << " files older than " << cleanup_days << " days\n";
    }
    server.bind();
    std::cerr << "[receiver] listening on port " << server.port() << ", storing in "
              << server.store().dir() << "\n";
    print_received(server.store());

    std::signal(SIGINT, on_sigint);

    std::atomic<bool> done{false};
    std::thread printer([&] {
      bool stop_sent = false;
      while (!done.load()) {
        if (g_interrupted && !stop_sent) {
          std::cerr << "[receiver] shutting down\n";
          server.stop();
          stop_sent = true;
        }

        std::optional<Event> ev = server.events().pop_for(Millis(200));
        if (!ev) continue;

        if (const auto* f = std::get_if<FileReceived>(&*ev)) {
          std::cerr << "[receiver] received " << f->path << " (" << f->size << " bytes)\n";
        } else if (const auto* r = std::get_if<TransferResult>(&*ev)) {
          if (r->outcome != Outcome::Success) {
            std::cerr << "[receiver] transfer " << to_string(r->outcome) << " ("
                      << to_string(r->reason) << "): " << r->detail << "\n";
          }
        }
      }
    });

    int rc = 0;
    try {
      server.serve();
    } catch (const std::exception& e) {
      std::cerr << "[receiver] error: " << e.what() << "\n";
      rc = 1;
    }
    done.store(true);
    printer.join();
    return rc;

  } catch (const std::exception& e) {
    std::cerr << "[receiver] error: " << e.what() << "\n";
    return 1;
  }
}
