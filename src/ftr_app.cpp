#include "ftr_app.hpp"

#include <fmt/format.h>

#include <csignal>
#include <filesystem>
#include <stdexcept>

#include "errors.hpp"
#include "log.hpp"
#include "sender.hpp"
#include "server.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kPassKeyLength = 6;

std::string first_or_empty(const std::vector<std::string>& values) {
  return values.empty() ? std::string() : values.front();
}

const char* failure_prefix(const std::string& command) {
  if(command == "join") return "Receiver server error";
  if(command == "list") return "Failed to list peers";
  if(command == "send") return "Failed to send the file";
  return "Error";
}

} // namespace

FtrApp::FtrApp(std::shared_ptr<SettingsManager> settings,
               Options options,
               std::shared_ptr<Logger> logger)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ftr")) {}

FtrApp::~FtrApp() {
  stop();
}

int FtrApp::run(const ParsedCommand& command) {
  if(command.command == "help" || settings_->help_requested()) {
    return run_help();
  }
  try {
    if(command.command == "join") return run_join();
    if(command.command == "list") return run_list();
    if(command.command == "send") {
      if(command.positionals.size() != 2) {
        throw CommandLineError("Usage: ftr send [--key <key>] <path> <peer>");
      }
      return run_send(command.positionals[0], command.positionals[1]);
    }
  } catch(const FtrError& e) {
    logger_->print_err("{}: {}", failure_prefix(command.command), e.what());
    logger_->debug("error kind {}", to_string(e.kind()));
    return 1;
  }
  throw CommandLineError("Unrecognized subcommand: " + command.command);
}

std::chrono::milliseconds FtrApp::timeout_setting(const std::string& key) const {
  int value = settings_->get<int>(key);
  if(value <= 0) {
    throw CommandLineError(fmt::format("{} must be positive (got {})", key, value));
  }
  return std::chrono::milliseconds(value);
}

std::string FtrApp::advertised_name() const {
  auto name = settings_->get<std::string>("name");
  if(name.empty()) {
    name = trim_host_name(local_host_name());
  }
  return name;
}

std::string FtrApp::advertised_key() const {
  std::lock_guard lock(server_mutex_);
  return key_;
}

ReceiverConfig FtrApp::receiver_config() const {
  int port = settings_->get<int>("port");
  if(port < 0 || port > 65535) {
    throw CommandLineError(fmt::format("Invalid port '{}'", port));
  }
  ReceiverConfig config;
  config.drop_dir = settings_->get<std::string>("dropdir");
  if(config.drop_dir.empty()) config.drop_dir = default_drop_dir();
  config.pass_key = settings_->get<std::string>("key");
  config.port = static_cast<uint16_t>(port);
  config.listen_ip = settings_->get<std::string>("listen_ip");
  return config;
}

int FtrApp::run_join() {
  if(!options_.discovery) {
    throw std::logic_error("join needs a discovery adapter");
  }
  auto name = advertised_name();
  auto config = receiver_config();
  if(config.pass_key.empty()) {
    config.pass_key = random_alphanumeric(kPassKeyLength);
  }

  std::error_code ec;
  if(!std::filesystem::exists(config.drop_dir, ec)) {
    logger_->print("The directory {} does not exist, creating it", config.drop_dir.string());
  }
  config = prepare_receiver_config(std::move(config));

  auto handler = std::make_shared<const UploadHandler>(config, logger_);
  auto server = std::make_shared<Server>(handler, logger_);
  server->start();
  uint16_t port = server->port();

  auto advertisement = options_.discovery->advertise(name, port, {config.drop_dir.string()});
  logger_->print("Advertise within the network with name {}, port {} and key {}", name, port, config.pass_key);

  std::unique_ptr<asio::signal_set> signals;
  if(options_.handle_signals) {
    signals = std::make_unique<asio::signal_set>(server->io(), SIGINT, SIGTERM);
    signals->async_wait([this, server](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger_->info("Received signal {}, shutting down", signal_number);
      server->stop();
    });
  }

  {
    std::lock_guard lock(server_mutex_);
    key_ = config.pass_key;
    server_ = server;
    if(stop_requested_) server->stop();
  }
  listen_port_ = port;
  receiving_ = true;

  server->run();

  receiving_ = false;
  {
    std::lock_guard lock(server_mutex_);
    server_.reset();
    stop_requested_ = false;
  }
  signals.reset();
  advertisement.reset();
  logger_->info("Stopped receiving on port {}", port);
  return 0;
}

void FtrApp::stop() {
  std::lock_guard lock(server_mutex_);
  if(server_) {
    server_->stop();
  } else {
    stop_requested_ = true;
  }
}

int FtrApp::run_list() {
  if(!options_.discovery) {
    throw std::logic_error("list needs a discovery adapter");
  }
  auto timeout = timeout_setting("list_timeout_ms");
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto stream = options_.discovery->browse(timeout);

  logger_->print("{:<20} {:<15} {:<5} {:<20}", "HostName", "IPv4", "Port", "DropDir");
  while(auto entry = stream->next_until(deadline)) {
    logger_->print("{:<20} {:<15} {:<5} {:<20}",
                   entry->host_name,
                   first_or_empty(entry->addresses),
                   entry->port,
                   first_or_empty(entry->metadata));
  }
  return 0;
}

int FtrApp::run_send(const std::string& source, const std::string& peer) {
  if(!options_.discovery) {
    throw std::logic_error("send needs a discovery adapter");
  }
  auto key = settings_->get<std::string>("key");
  if(key.empty()) {
    logger_->warn("No --key given; the receiver will reject the transfer");
  }
  // Fail on a missing source before spending time on the lookup.
  classify_source(source);

  auto entry = options_.discovery->resolve(peer, timeout_setting("lookup_timeout_ms"));
  logger_->print("Found the peer {} with ip {} and port {}",
                 entry.host_name, first_or_empty(entry.addresses), entry.port);
  logger_->print("Start sending the file...");

  auto request = make_transfer_request(source, key, entry);
  Sender sender(logger_);
  sender.send(request);
  logger_->print("File sent successfully");
  return 0;
}

int FtrApp::run_help() {
  CommandLineParser parser;
  parser.usage(logger_.get());
  return 0;
}
