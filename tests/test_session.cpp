#include "dropwire/session.hpp"
#include "fault_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <thread>

using namespace dropwire;
using dropwire::test::FaultTransport;
using dropwire::test::chunk_index_of;
using dropwire::test::first_matching;
namespace fs = std::filesystem;

namespace {

Timeouts fast_timeouts() {
  Timeouts t;
  t.connect = Millis(1000);
  t.handshake = Millis(2000);
  t.key_exchange = Millis(2000);
  t.chunk_ack = Millis(300);
  t.idle = Millis(3000);
  return t;
}

std::size_t count_sent(const FaultTransport& t, MsgType type, std::uint32_t index) {
  std::size_t n = 0;
  for (const Message& m : t.sent()) {
    if (m.type == type && chunk_index_of(m) == index) ++n;
  }
  return n;
}

Inbound recv_verified(Channel& ch) {
  Inbound in = ch.recv(Millis(2000));
  EXPECT_EQ(in.status, RecvStatus::Ok);
  return in;
}

}  // namespace

class SessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            (std::string("dropwire_session_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_ / "src");

    auto ends = LoopbackTransport::make_pair();
    a_ = std::move(ends.first);
    b_ = std::move(ends.second);

    scfg_.timeouts = fast_timeouts();
    scfg_.retry.backoff = Millis(10);
    rcfg_.timeouts = fast_timeouts();
    rcfg_.retry.backoff = Millis(10);
    rcfg_.receive_directory = (root_ / "recv").string();
    store_ = std::make_unique<FileStore>(rcfg_.receive_directory);
  }

  void TearDown() override { fs::remove_all(root_); }

  std::string make_file(const std::string& name, std::size_t size) {
    content_.resize(size);
    for (std::size_t i = 0; i < size; ++i) content_[i] = (std::uint8_t)((i * 31 + 7) & 0xFF);
    fs::path p = root_ / "src" / name;
    std::ofstream f(p, std::ios::binary);
    f.write((const char*)content_.data(), (std::streamsize)content_.size());
    return p.string();
  }

  static Bytes read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  }

  SendRequest request(const std::string& path, bool encrypt) {
    SendRequest req;
    req.file_path = path;
    req.encryption_enabled = encrypt;
    return req;
  }

  struct Results {
    TransferResult sender;
    TransferResult receiver;
  };

  // Runs both sessions to completion; the sender's end is closed afterwards
  // so a receiver left waiting sees the link drop.
  Results run_both(SenderSession& s, const SendRequest& req, ITransport& st,
                   ReceiverSession& r, ITransport& rt) {
    Results out;
    std::thread rx([&] { out.receiver = r.run(rt); });
    out.sender = s.run(req, st);
    a_->close();
    rx.join();
    return out;
  }

  fs::path root_;
  std::unique_ptr<LoopbackTransport> a_;  // sender end
  std::unique_ptr<LoopbackTransport> b_;  // receiver end
  SenderConfig scfg_;
  ReceiverConfig rcfg_;
  std::unique_ptr<FileStore> store_;
  Bytes content_;
};

TEST_F(SessionTest, PlainTransferAcksEveryChunkOnce) {
  const std::string path = make_file("photo.jpg", 200 * 1024);
  BoundedQueue<Event> sender_events(64);
  BoundedQueue<Event> receiver_events(64);
  SenderSession s(scfg_, &sender_events);
  ReceiverSession r(rcfg_, *store_, &receiver_events);
  FaultTransport rt(*b_);

  Results res = run_both(s, request(path, false), *a_, r, rt);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_EQ(res.receiver.outcome, Outcome::Success);
  EXPECT_EQ(s.state(), State::Complete);
  EXPECT_EQ(r.state(), State::Complete);
  EXPECT_TRUE(is_terminal(s.state()));
  EXPECT_FALSE(s.encrypted());

  std::vector<std::uint32_t> acks;
  for (const Message& m : rt.sent()) {
    if (m.type != MsgType::ChunkAck) continue;
    ChunkAckPayload ack = ChunkAckPayload::parse(m.payload);
    EXPECT_EQ(ack.status, AckStatus::Ok);
    acks.push_back(ack.index);
  }
  EXPECT_EQ(acks, (std::vector<std::uint32_t>{kNoChunk, 0, 1, 2, 3}));

  ASSERT_TRUE(r.received().has_value());
  EXPECT_EQ(r.received()->path, (fs::path(rcfg_.receive_directory) / "photo.jpg").string());
  EXPECT_EQ(r.received()->size, 200u * 1024);
  EXPECT_EQ(read_all(r.received()->path), content_);

  // four progress updates, then the result
  std::vector<ProgressUpdate> progress;
  for (;;) {
    auto ev = sender_events.pop_for(Millis(10));
    ASSERT_TRUE(ev.has_value());
    if (const auto* p = std::get_if<ProgressUpdate>(&*ev)) {
      progress.push_back(*p);
      continue;
    }
    EXPECT_EQ(std::get<TransferResult>(*ev).outcome, Outcome::Success);
    break;
  }
  ASSERT_EQ(progress.size(), 4u);
  EXPECT_EQ(progress.back().chunks_sent, 4u);
  EXPECT_EQ(progress.back().chunks_total, 4u);
  EXPECT_EQ(progress.back().bytes_sent, 200u * 1024);

  auto first = receiver_events.pop_for(Millis(10));
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(std::holds_alternative<FileReceived>(*first));
  auto second = receiver_events.pop_for(Millis(10));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(std::get<TransferResult>(*second).outcome, Outcome::Success);
}

TEST_F(SessionTest, LostAckResendsWithoutDuplicateWrite) {
  const std::string path = make_file("notes.txt", 200 * 1024);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport st(*a_);
  FaultTransport rt(*b_);
  rt.set_rule(first_matching(
    [](const Message& m) { return m.type == MsgType::ChunkAck && chunk_index_of(m) == 2; },
    FaultTransport::Action::Drop));

  Results res = run_both(s, request(path, false), st, r, rt);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_EQ(res.receiver.outcome, Outcome::Success);
  EXPECT_EQ(count_sent(st, MsgType::ChunkData, 2), 2u);
  EXPECT_EQ(count_sent(rt, MsgType::ChunkAck, 2), 2u);
  ASSERT_TRUE(r.received().has_value());
  EXPECT_EQ(read_all(r.received()->path), content_);
}

TEST_F(SessionTest, CorruptedChunkIsRetriedOnce) {
  const std::string path = make_file("archive.tar", 200 * 1024);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport st(*a_);
  FaultTransport rt(*b_);
  st.set_rule(first_matching(
    [](const Message& m) { return m.type == MsgType::ChunkData && chunk_index_of(m) == 1; },
    FaultTransport::Action::Corrupt));

  Results res = run_both(s, request(path, false), st, r, rt);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_EQ(count_sent(st, MsgType::ChunkData, 1), 2u);

  bool nack_seen = false;
  for (const Message& m : rt.sent()) {
    if (m.type != MsgType::ChunkAck) continue;
    ChunkAckPayload ack = ChunkAckPayload::parse(m.payload);
    if (ack.index == 1 && ack.status == AckStatus::Retry) nack_seen = true;
  }
  EXPECT_TRUE(nack_seen);
  ASSERT_TRUE(r.received().has_value());
  EXPECT_EQ(read_all(r.received()->path), content_);
}

TEST_F(SessionTest, EncryptedTransfer) {
  const std::string path = make_file("secret.bin", 300 * 1024 + 17);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport st(*a_);

  Results res = run_both(s, request(path, true), st, r, *b_);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_EQ(res.receiver.outcome, Outcome::Success);
  EXPECT_TRUE(s.encrypted());
  EXPECT_TRUE(r.encrypted());

  for (const Message& m : st.sent()) {
    const bool setup = m.type == MsgType::Handshake || m.type == MsgType::KeyExchange;
    EXPECT_EQ(m.encrypted, !setup) << to_string(m.type);
  }
  ASSERT_TRUE(r.received().has_value());
  EXPECT_EQ(read_all(r.received()->path), content_);
}

TEST_F(SessionTest, EncryptedCorruptionIsRetried) {
  const std::string path = make_file("secret.bin", 100 * 1024);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport st(*a_);
  st.set_rule(first_matching([](const Message& m) { return m.type == MsgType::ChunkData; },
                             FaultTransport::Action::Corrupt));

  Results res = run_both(s, request(path, true), st, r, *b_);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  std::size_t chunk_frames = 0;
  for (const Message& m : st.sent()) {
    if (m.type == MsgType::ChunkData) ++chunk_frames;
  }
  EXPECT_EQ(chunk_frames, 3u);
  ASSERT_TRUE(r.received().has_value());
  EXPECT_EQ(read_all(r.received()->path), content_);
}

TEST_F(SessionTest, ReceiverDeclinesEncryption) {
  rcfg_.encryption_allowed = false;
  const std::string path = make_file("plain.txt", 1000);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport st(*a_);

  Results res = run_both(s, request(path, true), st, r, *b_);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_FALSE(s.encrypted());
  EXPECT_FALSE(r.encrypted());
  for (const Message& m : st.sent()) {
    EXPECT_FALSE(m.encrypted);
    EXPECT_NE(m.type, MsgType::KeyExchange);
  }
}

TEST_F(SessionTest, SenderCancelAbortsBothSides) {
  const std::string path = make_file("big.iso", 200 * 1024);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport rt(*b_);
  rt.set_hook([&s](const Message& m) {
    if (m.type == MsgType::ChunkAck && chunk_index_of(m) == 1) s.cancel();
  });

  Results res = run_both(s, request(path, false), *a_, r, rt);

  EXPECT_EQ(res.sender.outcome, Outcome::Aborted);
  EXPECT_EQ(res.sender.reason, FailureReason::UserCancelled);
  EXPECT_EQ(s.state(), State::Aborted);
  EXPECT_EQ(res.receiver.outcome, Outcome::Aborted);
  EXPECT_EQ(r.state(), State::Aborted);
  EXPECT_FALSE(r.received().has_value());
  EXPECT_TRUE(store_->list_received().empty());
  EXPECT_TRUE(fs::is_empty(rcfg_.receive_directory));
}

TEST_F(SessionTest, ReceiverCancelAbortsSender) {
  const std::string path = make_file("a.txt", 10);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  r.cancel();

  Results res = run_both(s, request(path, false), *a_, r, *b_);

  EXPECT_EQ(res.receiver.outcome, Outcome::Aborted);
  EXPECT_EQ(res.sender.outcome, Outcome::Aborted);
  EXPECT_EQ(res.sender.reason, FailureReason::UserCancelled);
}

TEST_F(SessionTest, RetryCeilingFailsTransfer) {
  const std::string path = make_file("stuck.bin", 100 * 1024);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  FaultTransport st(*a_);
  FaultTransport rt(*b_);
  rt.set_rule(first_matching(
    [](const Message& m) { return m.type == MsgType::ChunkAck && chunk_index_of(m) == 0; },
    FaultTransport::Action::Drop, 100));

  Results res = run_both(s, request(path, false), st, r, rt);

  EXPECT_EQ(res.sender.outcome, Outcome::Failed);
  EXPECT_EQ(res.sender.reason, FailureReason::RetryLimitExceeded);
  EXPECT_EQ(count_sent(st, MsgType::ChunkData, 0), 3u);
  EXPECT_EQ(count_sent(st, MsgType::ChunkData, 1), 0u);
  EXPECT_EQ(res.receiver.outcome, Outcome::Failed);
  EXPECT_EQ(res.receiver.reason, FailureReason::RetryLimitExceeded);
  EXPECT_TRUE(store_->list_received().empty());
}

TEST_F(SessionTest, ConfiguredEncryptionAppliesWhenRequestLeavesItUnset) {
  scfg_.encryption_enabled = true;
  const std::string path = make_file("default.bin", 5000);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);
  SendRequest req;
  req.file_path = path;

  Results res = run_both(s, req, *a_, r, *b_);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_TRUE(s.encrypted());
  EXPECT_TRUE(r.encrypted());
}

TEST_F(SessionTest, RequestOverridesConfiguredEncryption) {
  scfg_.encryption_enabled = true;
  const std::string path = make_file("plain.bin", 5000);
  SenderSession s(scfg_);
  ReceiverSession r(rcfg_, *store_);

  Results res = run_both(s, request(path, false), *a_, r, *b_);

  EXPECT_EQ(res.sender.outcome, Outcome::Success);
  EXPECT_FALSE(s.encrypted());
}

TEST(StateTest, TerminalStates) {
  EXPECT_TRUE(is_terminal(State::Complete));
  EXPECT_TRUE(is_terminal(State::Aborted));
  EXPECT_TRUE(is_terminal(State::Failed));
  EXPECT_FALSE(is_terminal(State::Idle));
  EXPECT_FALSE(is_terminal(State::Transferring));
  EXPECT_FALSE(is_terminal(State::Completing));
}

TEST_F(SessionTest, EmptyFileIsRejectedBeforeConnecting) {
  const std::string path = make_file("empty.txt", 0);
  SenderSession s(scfg_);
  FaultTransport st(*a_);

  TransferResult res = s.run(request(path, false), st);

  EXPECT_EQ(res.outcome, Outcome::Failed);
  EXPECT_EQ(res.reason, FailureReason::ValidationError);
  EXPECT_TRUE(st.sent().empty());
}

TEST_F(SessionTest, MissingFileIsRejected) {
  SenderSession s(scfg_);
  TransferResult res = s.run(request((root_ / "src" / "nope.txt").string(), false), *a_);
  EXPECT_EQ(res.outcome, Outcome::Failed);
  EXPECT_EQ(res.reason, FailureReason::ValidationError);
}

// The tests below drive the receiver with a hand-written peer.

class ReceiverPeerTest : public SessionTest {
protected:
  void SetUp() override {
    SessionTest::SetUp();
    session_ = std::make_unique<ReceiverSession>(rcfg_, *store_);
    rx_ = std::thread([this] { result_ = session_->run(*b_); });
    ch_ = std::make_unique<Channel>(*a_, "peer");
  }

  void TearDown() override {
    a_->close();
    if (rx_.joinable()) rx_.join();
    SessionTest::TearDown();
  }

  // Sends metadata after the handshake and expects a ValidationError
  // before any chunk is accepted.
  void expect_rejected(const FileMetadata& meta) {
    handshake();
    EXPECT_EQ(recv_verified(*ch_).type, MsgType::Handshake);
    ch_->send(MsgType::Metadata, meta.serialize());

    Inbound err = recv_verified(*ch_);
    ASSERT_EQ(err.type, MsgType::Error);
    EXPECT_EQ(ErrorPayload::parse(err.payload).code, FailureReason::ValidationError);

    TransferResult res = finish();
    EXPECT_EQ(res.outcome, Outcome::Failed);
    EXPECT_EQ(res.reason, FailureReason::ValidationError);
    EXPECT_EQ(session_->state(), State::Failed);
    EXPECT_TRUE(fs::is_empty(rcfg_.receive_directory));
  }

  TransferResult finish() {
    a_->close();
    rx_.join();
    return result_;
  }

  void handshake(std::uint8_t version = kVersion) {
    HandshakePayload hs;
    hs.protocol_version = version;
    hs.peer_name = "peer";
    ch_->send(MsgType::Handshake, hs.serialize());
  }

  std::unique_ptr<ReceiverSession> session_;
  std::unique_ptr<Channel> ch_;
  std::thread rx_;
  TransferResult result_;
};

TEST_F(ReceiverPeerTest, FileHashMismatchFailsWithoutFinalFile) {
  make_file("forged.bin", 100 * 1024);
  handshake();
  EXPECT_EQ(recv_verified(*ch_).type, MsgType::Handshake);

  FileMetadata meta;
  meta.filename = "forged.bin";
  meta.total_size = content_.size();
  meta.chunk_count = chunk_count_for(meta.total_size);
  meta.file_hash = hash(Bytes{'n', 'o', 'p', 'e'});
  ch_->send(MsgType::Metadata, meta.serialize());
  EXPECT_EQ(ChunkAckPayload::parse(recv_verified(*ch_).payload).index, kNoChunk);

  for (std::uint32_t i = 0; i < meta.chunk_count; ++i) {
    const std::size_t off = (std::size_t)i * kChunkSize;
    const std::size_t len = std::min(kChunkSize, content_.size() - off);
    ChunkDataPayload cd{i, Bytes(content_.begin() + off, content_.begin() + off + len)};
    ch_->send(MsgType::ChunkData, cd.serialize());
    EXPECT_EQ(ChunkAckPayload::parse(recv_verified(*ch_).payload).index, i);
  }
  ch_->send(MsgType::Complete, Bytes{});

  Inbound err = recv_verified(*ch_);
  ASSERT_EQ(err.type, MsgType::Error);
  EXPECT_EQ(ErrorPayload::parse(err.payload).code, FailureReason::IntegrityMismatch);

  TransferResult res = finish();
  EXPECT_EQ(res.outcome, Outcome::Failed);
  EXPECT_EQ(res.reason, FailureReason::IntegrityMismatch);
  EXPECT_FALSE(session_->received().has_value());
  EXPECT_TRUE(store_->list_received().empty());
  EXPECT_TRUE(fs::is_empty(rcfg_.receive_directory));
}

TEST_F(ReceiverPeerTest, VersionMismatchIsReported) {
  handshake(kVersion + 1);

  Inbound err = recv_verified(*ch_);
  ASSERT_EQ(err.type, MsgType::Error);
  EXPECT_EQ(ErrorPayload::parse(err.payload).code, FailureReason::VersionMismatch);

  TransferResult res = finish();
  EXPECT_EQ(res.outcome, Outcome::Failed);
  EXPECT_EQ(res.reason, FailureReason::VersionMismatch);
}

TEST_F(ReceiverPeerTest, InconsistentMetadataIsRejected) {
  handshake();
  EXPECT_EQ(recv_verified(*ch_).type, MsgType::Handshake);

  FileMetadata meta;
  meta.filename = "../../etc/cron.d/job";
  meta.total_size = 200 * 1024;
  meta.chunk_count = 2;
  ch_->send(MsgType::Metadata, meta.serialize());

  Inbound err = recv_verified(*ch_);
  ASSERT_EQ(err.type, MsgType::Error);
  EXPECT_EQ(ErrorPayload::parse(err.payload).code, FailureReason::ValidationError);

  TransferResult res = finish();
  EXPECT_EQ(res.outcome, Outcome::Failed);
  EXPECT_EQ(res.reason, FailureReason::ValidationError);
}

TEST_F(ReceiverPeerTest, DuplicateMetadataIsAckedAgain) {
  make_file("twice.txt", 10);
  handshake();
  EXPECT_EQ(recv_verified(*ch_).type, MsgType::Handshake);

  FileMetadata meta;
  meta.filename = "dir/twice.txt";
  meta.total_size = content_.size();
  meta.chunk_count = 1;
  meta.file_hash = hash(content_);
  ch_->send(MsgType::Metadata, meta.serialize());
  EXPECT_EQ(ChunkAckPayload::parse(recv_verified(*ch_).payload).index, kNoChunk);
  ch_->send(MsgType::Metadata, meta.serialize());
  EXPECT_EQ(ChunkAckPayload::parse(recv_verified(*ch_).payload).index, kNoChunk);

  ch_->send(MsgType::ChunkData, ChunkDataPayload{0, content_}.serialize());
  EXPECT_EQ(ChunkAckPayload::parse(recv_verified(*ch_).payload).index, 0u);
  // resent after a lost ack: acknowledged, not written again
  ch_->send(MsgType::ChunkData, ChunkDataPayload{0, content_}.serialize());
  EXPECT_EQ(ChunkAckPayload::parse(recv_verified(*ch_).payload).index, 0u);

  ch_->send(MsgType::Complete, Bytes{});
  EXPECT_EQ(recv_verified(*ch_).type, MsgType::Complete);

  TransferResult res = finish();
  EXPECT_EQ(res.outcome, Outcome::Success);
  ASSERT_TRUE(session_->received().has_value());
  EXPECT_EQ(session_->received()->path, (fs::path(rcfg_.receive_directory) / "twice.txt").string());
  EXPECT_EQ(read_all(session_->received()->path), content_);
}

TEST_F(ReceiverPeerTest, SizeBeyondChunkIndexSpaceIsRejected) {
  FileMetadata meta;
  meta.filename = "huge.bin";
  meta.total_size = std::numeric_limits<std::uint64_t>::max();
  meta.chunk_count = 0;
  expect_rejected(meta);
}

TEST_F(ReceiverPeerTest, ZeroSizeIsRejected) {
  FileMetadata meta;
  meta.filename = "empty.txt";
  meta.total_size = 0;
  meta.chunk_count = 0;
  meta.file_hash = hash(Bytes{});
  expect_rejected(meta);
}

TEST_F(ReceiverPeerTest, DotDotNameIsRejected) {
  FileMetadata meta;
  meta.filename = "..";
  meta.total_size = 10;
  meta.chunk_count = 1;
  expect_rejected(meta);
}

TEST_F(ReceiverPeerTest, DirectoryNameIsRejected) {
  FileMetadata meta;
  meta.filename = "dir/";
  meta.total_size = 10;
  meta.chunk_count = 1;
  expect_rejected(meta);
}
