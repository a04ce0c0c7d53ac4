#include "dropwire/file_store.hpp"
#include "dropwire/errors.hpp"
#include "dropwire/util.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace dropwire {

static const char kTempPrefix[] = ".dropwire-";
static const char kTempSuffix[] = ".part";

static bool is_temp_name(const std::string& name) {
  const std::string prefix = kTempPrefix;
  const std::string suffix = kTempSuffix;
  return name.size() > prefix.size() + suffix.size() &&
         name.compare(0, prefix.size(), prefix) == 0 &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string sanitize_filename(const std::string& name) {
  std::string base = name;
  auto cut = base.find_last_of("/\\");
  if (cut != std::string::npos) base = base.substr(cut + 1);

  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    if ((unsigned char)c < 0x20 || c == 0x7F) continue;
    out.push_back(c);
  }
  if (out == "." || out == "..") return "";
  // never collide with the store's own temp files
  if (is_temp_name(out)) out.erase(0, 1);
  return out;
}

// ------------------------------ FileStore ------------------------------

FileStore::FileStore(std::string dir) : dir_(std::move(dir)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) fail(ErrorKind::Storage, "cannot create " + dir_ + ": " + ec.message());
}

std::string FileStore::make_temp_path() const {
  std::uint8_t rnd[8];
  rand_bytes(rnd, sizeof(rnd));
  static const char kHex[] = "0123456789abcdef";
  std::string tag;
  for (std::uint8_t b : rnd) {
    tag.push_back(kHex[b >> 4]);
    tag.push_back(kHex[b & 0x0F]);
  }
  return (fs::path(dir_) / (kTempPrefix + tag + kTempSuffix)).string();
}

std::string FileStore::unique_path(const std::string& name) const {
  fs::path target = fs::path(dir_) / name;
  if (!fs::exists(target)) return target.string();

  const std::string stem = target.stem().string();
  const std::string ext = target.extension().string();
  for (unsigned n = 1;; ++n) {
    target = fs::path(dir_) / (stem + "_" + std::to_string(n) + ext);
    if (!fs::exists(target)) return target.string();
  }
}

std::string FileStore::finalize(const std::string& temp_path, const std::string& name) const {
  const std::string final_path = unique_path(name);
  std::error_code ec;
  fs::rename(temp_path, final_path, ec);
  if (ec) fail(ErrorKind::Storage, "rename to " + final_path + " failed: " + ec.message());
  return final_path;
}

void FileStore::discard(const std::string& temp_path) const noexcept {
  std::error_code ec;
  fs::remove(temp_path, ec);
}

std::vector<std::string> FileStore::list_received() const {
  std::vector<std::string> out;
  std::error_code ec;
  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    if (is_temp_name(it->path().filename().string())) continue;
    out.push_back(it->path().string());
  }
  if (ec) log_warn("store", "listing " + dir_ + " failed: " + ec.message());
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t FileStore::cleanup_old(std::chrono::hours max_age) const {
  const auto cutoff = fs::file_time_type::clock::now() - max_age;
  std::size_t removed = 0;
  for (const auto& path : list_received()) {
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec || mtime >= cutoff) continue;
    if (fs::remove(path, ec)) {
      ++removed;
    } else {
      log_warn("store", "could not remove " + path + ": " + ec.message());
    }
  }
  log_line("store", "cleaned up " + std::to_string(removed) + " old files");
  return removed;
}

std::size_t FileStore::remove_stale_temp_files() const {
  std::size_t removed = 0;
  std::error_code ec;
  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!is_temp_name(it->path().filename().string())) continue;
    std::error_code rm_ec;
    if (fs::remove(it->path(), rm_ec)) ++removed;
  }
  return removed;
}

// ------------------------------ IncomingFile ------------------------------

IncomingFile::IncomingFile(const FileStore& store, FileMetadata meta)
  : store_(store), meta_(std::move(meta)), temp_path_(store.make_temp_path()) {
  std::ofstream f(temp_path_, std::ios::binary | std::ios::trunc);
  if (!f) fail(ErrorKind::Storage, "cannot create " + temp_path_);
}

IncomingFile::~IncomingFile() {
  if (!done_) store_.discard(temp_path_);
}

void IncomingFile::append(const Bytes& data) {
  {
    std::ofstream f(temp_path_, std::ios::binary | std::ios::app);
    if (!f) fail(ErrorKind::Storage, "cannot open " + temp_path_);
    f.write((const char*)data.data(), (std::streamsize)data.size());
    f.flush();
    if (!f) fail(ErrorKind::Storage, "write to " + temp_path_ + " failed");
  }
  hasher_.update(data);
  bytes_written_ += data.size();
}

std::string IncomingFile::finalize() {
  ensure(!done_, "file already finalized");
  if (bytes_written_ != meta_.total_size) {
    fail(ErrorKind::Integrity, "size mismatch: got " + std::to_string(bytes_written_) +
         " of " + std::to_string(meta_.total_size) + " bytes", FailureReason::IntegrityMismatch);
  }
  Digest got = hasher_.finish();
  if (!digest_equal(got, meta_.file_hash)) {
    fail(ErrorKind::Integrity, "file hash mismatch: got " + to_hex(got) +
         ", declared " + to_hex(meta_.file_hash), FailureReason::IntegrityMismatch);
  }
  std::string final_path = store_.finalize(temp_path_, meta_.filename);
  done_ = true;
  return final_path;
}

} // namespace dropwire
