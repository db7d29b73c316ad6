#pragma once

#include "switchboard/common/result.hpp"

#include <filesystem>

namespace switchboard::daemon {

/// Single-instance guard: a file holding the pid of the running process.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  /// Fails while another live process holds the file. A stale file left
  /// by a dead process is replaced.
  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] bool acquired() const { return acquired_; }

  /// Pid recorded in the file, 0 when missing or unreadable.
  [[nodiscard]] static int read_pid(const std::filesystem::path &path);
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace switchboard::daemon
