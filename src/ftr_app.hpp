#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "command_line_parser.hpp"
#include "discovery.hpp"
#include "upload_handler.hpp"

class Logger;
class Server;
class SettingsManager;

// The four subcommands, wired to settings, discovery and the transfer core.
class FtrApp {
public:
  struct Options {
    std::shared_ptr<DiscoveryAdapter> discovery;
    bool handle_signals = true;
  };

  FtrApp(std::shared_ptr<SettingsManager> settings,
         Options options,
         std::shared_ptr<Logger> logger = nullptr);
  ~FtrApp();

  int run(const ParsedCommand& command);

  // Blocks until stop() or SIGINT/SIGTERM.
  int run_join();
  int run_list();
  int run_send(const std::string& source, const std::string& peer);
  int run_help();

  void stop();

  bool receiving() const { return receiving_; }
  uint16_t listen_port() const { return listen_port_; }
  std::string advertised_key() const;
  std::shared_ptr<Logger> logger() const { return logger_; }

  ReceiverConfig receiver_config() const;
  std::string advertised_name() const;

private:
  std::chrono::milliseconds timeout_setting(const std::string& key) const;

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex server_mutex_;
  std::shared_ptr<Server> server_;
  bool stop_requested_ = false;
  std::atomic<bool> receiving_{false};
  std::atomic<uint16_t> listen_port_{0};
  std::string key_;
};
