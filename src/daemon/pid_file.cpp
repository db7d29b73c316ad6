#include "switchboard/daemon/pid_file.hpp"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <unistd.h>

namespace switchboard::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

int PidFile::read_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  int pid = 0;
  if (!(in >> pid)) {
    return 0;
  }
  return pid;
}

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create pid directory: " + ec.message());
    }
  }

  if (std::filesystem::exists(path_, ec)) {
    const int existing_pid = read_pid(path_);
    if (existing_pid > 0 && is_process_running(existing_pid)) {
      return common::Status::error("switchboard already running with pid " +
                                   std::to_string(existing_pid));
    }
    std::cerr << "[daemon] replacing stale pid file " << path_.string() << "\n";
    std::filesystem::remove(path_, ec);
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to write pid file " + path_.string());
  }
  out << getpid() << "\n";
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    std::cerr << "[daemon] cannot remove pid file " << path_.string() << ": " << ec.message()
              << "\n";
  }
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace switchboard::daemon
