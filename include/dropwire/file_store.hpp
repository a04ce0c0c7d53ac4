#pragma once
#include "codec.hpp"
#include "integrity.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dropwire {

// Last path component with separators and control characters removed.
// Returns "" for names that cannot be stored ("", ".", "..").
std::string sanitize_filename(const std::string& name);

// Receive directory: temp files, final names, listing and retention.
class FileStore {
public:
  explicit FileStore(std::string dir);

  const std::string& dir() const { return dir_; }

  // Fresh hidden temp path: <dir>/.dropwire-<random>.part
  std::string make_temp_path() const;

  // <dir>/<name>, or <dir>/<stem>_N<ext> with the first free N >= 1.
  std::string unique_path(const std::string& name) const;

  // Renames temp to a unique final path; returns that path.
  std::string finalize(const std::string& temp_path, const std::string& name) const;

  void discard(const std::string& temp_path) const noexcept;

  // Sorted received files; temp files are excluded.
  std::vector<std::string> list_received() const;

  // Deletes received files last modified more than max_age ago.
  std::size_t cleanup_old(std::chrono::hours max_age) const;

  // Deletes temp files left behind by an interrupted run.
  std::size_t remove_stale_temp_files() const;

private:
  std::string dir_;
};

// One file being received. The data lives under a temp name until
// finalize(); the destructor discards it otherwise.
class IncomingFile {
public:
  IncomingFile(const FileStore& store, FileMetadata meta);
  ~IncomingFile();

  IncomingFile(const IncomingFile&) = delete;
  IncomingFile& operator=(const IncomingFile&) = delete;

  // Appends one chunk in a scoped write: opened, written, flushed, closed.
  void append(const Bytes& data);

  std::uint64_t bytes_written() const { return bytes_written_; }
  const FileMetadata& metadata() const { return meta_; }
  const std::string& temp_path() const { return temp_path_; }

  // Size and whole-file hash must match the metadata, otherwise the temp
  // file is discarded and Error(Integrity, IntegrityMismatch) is thrown.
  std::string finalize();

private:
  const FileStore& store_;
  FileMetadata meta_;
  std::string temp_path_;
  StreamHasher hasher_;
  std::uint64_t bytes_written_{0};
  bool done_{false};
};

} // namespace dropwire
