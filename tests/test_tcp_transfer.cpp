#include "dropwire/agent.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

using namespace dropwire;
namespace fs = std::filesystem;

namespace {

// Pops events until a TransferResult arrives.
std::optional<TransferResult> wait_result(BoundedQueue<Event>& q, Millis limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    auto ev = q.pop_for(Millis(100));
    if (!ev) continue;
    if (const auto* r = std::get_if<TransferResult>(&*ev)) return *r;
  }
  return std::nullopt;
}

}  // namespace

class TcpTransferTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            (std::string("dropwire_tcp_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_);

    rcfg_.listen_host = "127.0.0.1";
    rcfg_.listen_port = 0;
    rcfg_.receive_directory = (root_ / "recv").string();
    rcfg_.timeouts.idle = Millis(3000);

    scfg_.timeouts.chunk_ack = Millis(2000);
    scfg_.timeouts.handshake = Millis(2000);
    scfg_.timeouts.connect = Millis(2000);
  }

  void TearDown() override { fs::remove_all(root_); }

  std::string make_file(const std::string& name, std::size_t size) {
    content_.resize(size);
    for (std::size_t i = 0; i < size; ++i) content_[i] = (std::uint8_t)(i % 251);
    fs::path p = root_ / name;
    std::ofstream f(p, std::ios::binary);
    f.write((const char*)content_.data(), (std::streamsize)content_.size());
    return p.string();
  }

  fs::path root_;
  SenderConfig scfg_;
  ReceiverConfig rcfg_;
  Bytes content_;
};

TEST_F(TcpTransferTest, EncryptedTransferOverLocalhost) {
  ReceiverServer server(rcfg_);
  server.bind();
  ASSERT_NE(server.port(), 0);

  std::optional<TransferResult> served;
  std::thread rx([&] { served = server.serve_one(Millis(5000)); });

  SendAgent agent(scfg_);
  SendRequest req;
  req.file_path = make_file("movie.mkv", 5 * kChunkSize + 123);
  req.receiver_host = "127.0.0.1";
  req.receiver_port = server.port();
  req.encryption_enabled = true;
  ASSERT_TRUE(agent.submit(req));

  std::optional<TransferResult> sent = wait_result(agent.events(), Millis(10000));
  rx.join();

  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ(sent->outcome, Outcome::Success) << sent->detail;
  ASSERT_TRUE(served.has_value());
  EXPECT_EQ(served->outcome, Outcome::Success) << served->detail;

  std::vector<std::string> files = server.store().list_received();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(fs::path(files[0]).filename().string(), "movie.mkv");
  std::ifstream f(files[0], std::ios::binary);
  Bytes got((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  EXPECT_EQ(got, content_);
}

TEST_F(TcpTransferTest, AgentRefusesSecondRequestWhileBusy) {
  TcpListener silent;
  silent.listen("127.0.0.1", 0);

  // the listener never answers the handshake, so the first request stays busy
  scfg_.timeouts.handshake = Millis(1000);
  SendAgent agent(scfg_);
  SendRequest req;
  req.file_path = make_file("a.bin", 100);
  req.receiver_host = "127.0.0.1";
  req.receiver_port = silent.local_port();

  ASSERT_TRUE(agent.submit(req));
  EXPECT_TRUE(agent.busy());
  EXPECT_FALSE(agent.submit(req));

  std::optional<TransferResult> r = wait_result(agent.events(), Millis(5000));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->outcome, Outcome::Failed);
  EXPECT_EQ(r->reason, FailureReason::Timeout);
}

TEST_F(TcpTransferTest, ConnectionRefused) {
  std::uint16_t port = 0;
  {
    TcpListener l;
    l.listen("127.0.0.1", 0);
    port = l.local_port();
  }

  SenderSession s(scfg_);
  SendRequest req;
  req.file_path = make_file("a.bin", 100);
  req.receiver_host = "127.0.0.1";
  req.receiver_port = port;

  TransferResult r = s.run(req);
  EXPECT_EQ(r.outcome, Outcome::Failed);
  EXPECT_EQ(r.reason, FailureReason::TransportError);
  EXPECT_EQ(s.state(), State::Failed);
}

TEST_F(TcpTransferTest, ServerStopEndsServe) {
  ReceiverServer server(rcfg_);
  server.bind();
  std::thread loop([&] { server.serve(); });
  std::this_thread::sleep_for(Millis(100));
  server.stop();
  loop.join();
  SUCCEED();
}

TEST_F(TcpTransferTest, BindRemovesStaleTempFiles) {
  fs::create_directories(rcfg_.receive_directory);
  { std::ofstream(fs::path(rcfg_.receive_directory) / ".dropwire-00000000deadbeef.part") << "x"; }

  ReceiverServer server(rcfg_);
  server.bind();
  EXPECT_TRUE(fs::is_empty(rcfg_.receive_directory));
}

TEST_F(TcpTransferTest, AgentAcceptsNextRequestOnceResultIsSeen) {
  ReceiverServer server(rcfg_);
  server.bind();
  std::thread loop([&] { server.serve(); });

  // host and port come from the config
  scfg_.receiver_host = "127.0.0.1";
  scfg_.receiver_port = server.port();
  SendAgent agent(scfg_);
  SendRequest req;
  req.file_path = make_file("batch.bin", 2000);

  // stop on the first failure so the serve thread is still joined
  std::size_t ok = 0;
  bool submitted = agent.submit(req);
  EXPECT_TRUE(submitted);
  for (int i = 0; submitted && i < 6; ++i) {
    std::optional<TransferResult> r = wait_result(agent.events(), Millis(10000));
    if (!r || r->outcome != Outcome::Success) break;
    ++ok;
    EXPECT_FALSE(agent.busy());
    if (i < 5) {
      submitted = agent.submit(req);
      EXPECT_TRUE(submitted) << "refused after result " << i;
    }
  }
  EXPECT_EQ(ok, 6u);

  server.stop();
  loop.join();
  EXPECT_EQ(server.store().list_received().size(), 6u);
}
