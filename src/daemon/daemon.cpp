#include "switchboard/daemon/daemon.hpp"

#include "switchboard/config/config.hpp"

#include <iostream>

namespace switchboard::daemon {

Daemon::Daemon(config::Config config) : config_(std::move(config)) {}

Daemon::~Daemon() {
  if (!running_) {
    return;
  }
  const auto status = stop();
  if (!status.ok()) {
    std::cerr << "[daemon] stopped with error: " << status.error() << "\n";
  }
}

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::success();
  }

  std::filesystem::path pid_path = options.pid_file;
  if (pid_path.empty()) {
    const auto dir = config::config_dir();
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
    pid_path = dir.value() / "switchboard.pid";
  }
  pid_file_ = std::make_unique<PidFile>(pid_path);
  if (auto status = pid_file_->acquire(); !status.ok()) {
    return status;
  }

  store_ = std::make_unique<store::SqliteMessageStore>(
      config_.database.path, static_cast<int>(config_.database.busy_timeout_ms));
  if (auto status = store_->status(); !status.ok()) {
    pid_file_->release();
    return status.with_context("opening " + config_.database.path);
  }

  if (!config_.directory.url.empty()) {
    if (options.directory_dialer) {
      directory_ = directory::start_managed(directory::settings_from_config(config_.directory),
                                            options.directory_dialer,
                                            directory::broker_options(config_.directory));
    } else {
      std::cerr << "[daemon] directory " << config_.directory.url
                << " configured but no directory transport is available\n";
    }
  }

  registry_ = accounts::default_client_registry(options.http);
  manager_ = std::make_unique<accounts::AccountManager>(config_.accounts, *store_, *registry_);
  if (auto status = manager_->start(); !status.ok()) {
    close_directory();
    pid_file_->release();
    return status;
  }

  std::cerr << "[daemon] running with database " << config_.database.path << "\n";
  running_ = true;
  return common::Status::success();
}

common::Status Daemon::stop() {
  if (!running_.exchange(false)) {
    return common::Status::success();
  }
  auto status = manager_->stop();
  close_directory();
  manager_.reset();
  registry_.reset();
  store_.reset();
  pid_file_->release();
  std::cerr << "[daemon] stopped\n";
  return status;
}

void Daemon::close_directory() {
  if (directory_ == nullptr) {
    return;
  }
  directory_->close();
  directory_.reset();
}

std::stop_token Daemon::dying() const {
  if (manager_ == nullptr) {
    return {};
  }
  return manager_->dying();
}

} // namespace switchboard::daemon
