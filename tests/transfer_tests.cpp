#include "test_runner_utils.hpp"

#include "errors.hpp"
#include "ftr_app.hpp"
#include "sender.hpp"
#include "server.hpp"
#include "settings_manager.hpp"
#include "upload_handler.hpp"

#include <fmt/format.h>

namespace ftr::test {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

const std::string kKey = "Zx98Yw";

// Receiver on an ephemeral loopback port for the lifetime of the fixture.
struct Receiver {
  TempDir tmp{"receiver"};
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("receiver");
  std::shared_ptr<Server> server;

  explicit Receiver(TestContext& ctx) {
    ctx.logs.attach(logger, "receiver");
    ReceiverConfig config;
    config.drop_dir = tmp / "drop";
    config.pass_key = kKey;
    config.listen_ip = "127.0.0.1";
    config.port = 0;
    auto handler = std::make_shared<const UploadHandler>(prepare_receiver_config(config), logger);
    server = std::make_shared<Server>(handler, logger);
    server->start();
    server->start_background();
  }

  ~Receiver() {
    server->stop();
  }

  fs::path drop() const { return tmp / "drop"; }

  PeerEntry entry() const {
    return PeerEntry{"receiver", {"127.0.0.1"}, server->port(), {drop().string()}};
  }
};

std::optional<ErrorKind> send_error(Sender& sender, const TransferRequest& request) {
  try {
    sender.send(request);
  } catch(const FtrError& e) {
    return e.kind();
  }
  return std::nullopt;
}

bool test_send_file(TestContext& ctx) {
  Receiver receiver(ctx);
  TempDir src("send_file");
  std::string content(200000, '\0');
  for(std::size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 31);
  write_file(src / "blob.bin", content);

  Sender sender(receiver.logger);
  auto result = sender.send(make_transfer_request(src / "blob.bin", kKey, receiver.entry()));
  expect(result.upload_name == "blob.bin", "upload name");
  expect(read_file(receiver.drop() / "blob.bin") == content, "bytes arrive intact");
  return true;
}

bool test_send_directory(TestContext& ctx) {
  Receiver receiver(ctx);
  TempDir src("send_dir");
  write_file(src / "project" / "README" , "readme");
  write_file(src / "project" / "src" / "main.c", "int main(){}");

  Sender sender(receiver.logger);
  auto request = make_transfer_request(src / "project", kKey, receiver.entry());
  expect(request.kind == TransferKind::Directory, "classified as a directory");
  sender.send(request);
  expect(read_file(receiver.drop() / "project" / "README") == "readme", "README extracted");
  expect(read_file(receiver.drop() / "project" / "src" / "main.c") == "int main(){}", "main.c extracted");
  expect(!fs::exists(src / "project.tar.gz"), "temporary archive removed");
  return true;
}

bool test_send_error_kinds(TestContext& ctx) {
  Receiver receiver(ctx);
  TempDir src("send_errors");
  write_file(src / "a.txt", "a");
  Sender sender(receiver.logger);

  expect(send_error(sender, make_transfer_request(src / "a.txt", "wrong!", receiver.entry())) == ErrorKind::AuthRejected,
         "bad key maps to AuthRejected");
  expect(!fs::exists(receiver.drop() / "a.txt"), "nothing stored on 401");

  sender.send(make_transfer_request(src / "a.txt", kKey, receiver.entry()));
  expect(send_error(sender, make_transfer_request(src / "a.txt", kKey, receiver.entry())) == ErrorKind::NameCollision,
         "second send collides");

  bool missing = false;
  try {
    make_transfer_request(src / "nope.txt", kKey, receiver.entry());
  } catch(const FtrError& e) {
    missing = e.kind() == ErrorKind::IOError;
  }
  expect(missing, "missing source is an IO error");

  PeerEntry unreachable{"gone", {}, 1, {}};
  bool no_address = false;
  try {
    make_transfer_request(src / "a.txt", kKey, unreachable);
  } catch(const FtrError& e) {
    no_address = e.kind() == ErrorKind::PeerNotFound;
  }
  expect(no_address, "peer without addresses");

  // The kind recorded when the request was built decides whether to pack.
  fs::create_directories(src / "later_dir");
  auto stale = make_transfer_request(src / "a.txt", kKey, receiver.entry());
  stale.source_path = src / "later_dir";
  expect(send_error(sender, stale) == ErrorKind::IOError, "directory sent as a file is refused");
  expect(!fs::exists(src / "later_dir.tar.gz"), "no archive packed for a file request");

  expect(error_kind_for_status(400) == ErrorKind::InvalidUpload, "400 mapping");
  expect(error_kind_for_status(405) == ErrorKind::InvalidUpload, "405 mapping");
  expect(error_kind_for_status(500) == ErrorKind::IOError, "500 mapping");
  return true;
}

std::shared_ptr<SettingsManager> app_settings(const nlohmann::json& values) {
  auto settings = std::make_shared<SettingsManager>();
  for(const auto& [key, value] : values.items()) {
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  }
  return settings;
}

bool test_app_join_send_list(TestContext& ctx) {
  TempDir tmp("app");
  auto discovery = std::make_shared<FakeDiscovery>();

  FtrApp::Options options;
  options.discovery = discovery;
  options.handle_signals = false;

  auto join_logger = std::make_shared<Logger>("join");
  ctx.logs.attach(join_logger, "join");
  FtrApp receiver(app_settings({{"name", "alice"},
                                {"port", 0},
                                {"listen_ip", "127.0.0.1"},
                                {"dropdir", (tmp / "inbox").string()}}),
                  options, join_logger);
  std::atomic<int> join_rc{-1};
  std::thread join_thread([&]{ join_rc = receiver.run_join(); });
  // Stops the receiver however the test body ends.
  struct JoinGuard {
    FtrApp& app;
    std::thread& thread;
    ~JoinGuard() {
      app.stop();
      if(thread.joinable()) thread.join();
    }
  } guard{receiver, join_thread};

  bool up = wait_for_condition([&]{ return receiver.receiving() && discovery->advertised() == 1; }, 5s);
  expect(up, "receiver came up");
  auto key = receiver.advertised_key();
  expect(key.size() == 6, "generated six character key");
  expect(ctx.logs.contains("The directory " + (tmp / "inbox").string() + " does not exist, creating it"),
         "drop dir creation announced");
  expect(ctx.logs.contains("Advertise within the network with name alice, port " +
                           std::to_string(receiver.listen_port()) + " and key " + key),
         "advertisement announced");

  write_file(tmp / "outbox" / "hello.txt", "hi alice");
  auto send_logger = std::make_shared<Logger>("send");
  ctx.logs.attach(send_logger, "send");
  FtrApp sender(app_settings({{"key", key}}), options, send_logger);
  int rc = sender.run_send((tmp / "outbox" / "hello.txt").string(), "ALICE");
  expect(rc == 0, "send succeeded");
  expect(ctx.logs.contains("Found the peer alice with ip 127.0.0.1 and port " +
                           std::to_string(receiver.listen_port())), "peer reported");
  expect(ctx.logs.contains("File sent successfully"), "success reported");
  expect(read_file(tmp / "inbox" / "hello.txt") == "hi alice", "file delivered");

  auto list_logger = std::make_shared<Logger>("list");
  ctx.logs.attach(list_logger, "list");
  FtrApp lister(app_settings({{"list_timeout_ms", 200}}), options, list_logger);
  expect(lister.run_list() == 0, "list succeeded");
  expect(ctx.logs.contains(fmt::format("{:<20} {:<15} {:<5}", "HostName", "IPv4", "Port")), "table header");
  expect(ctx.logs.contains(fmt::format("{:<20} {:<15} {:<5} {}", "alice", "127.0.0.1",
                                       receiver.listen_port(), (tmp / "inbox").string())), "alice listed");

  receiver.stop();
  join_thread.join();
  expect(join_rc == 0, "join exits cleanly");
  expect(discovery->advertised() == 0, "advertisement withdrawn");
  return true;
}

bool test_app_send_failures(TestContext& ctx) {
  TempDir tmp("app_fail");
  auto discovery = std::make_shared<FakeDiscovery>();
  FtrApp::Options options;
  options.discovery = discovery;
  options.handle_signals = false;

  auto logger = std::make_shared<Logger>("send");
  ctx.logs.attach(logger, "send");
  write_file(tmp / "a.txt", "a");

  FtrApp app(app_settings({{"key", "abcdef"}, {"lookup_timeout_ms", 100}}), options, logger);
  ParsedCommand command;
  command.command = "send";
  command.positionals = {(tmp / "a.txt").string(), "nobody"};
  expect(app.run(command) == 1, "unknown peer exits 1");
  expect(ctx.logs.contains("Failed to send the file: peer 'nobody' not found"), "reason printed");

  command.positionals = {(tmp / "missing.txt").string(), "nobody"};
  expect(app.run(command) == 1, "missing source exits 1");
  return true;
}

bool test_app_stop_before_join(TestContext& ctx) {
  TempDir tmp("app_stop");
  FtrApp::Options options;
  options.discovery = std::make_shared<FakeDiscovery>();
  options.handle_signals = false;
  auto logger = std::make_shared<Logger>("join");
  ctx.logs.attach(logger, "join");
  FtrApp app(app_settings({{"name", "early"}, {"port", 0}, {"listen_ip", "127.0.0.1"},
                           {"dropdir", tmp.path().string()}, {"key", "Qq11Ww"}}),
             options, logger);
  app.stop();
  expect(app.run_join() == 0, "join returns right away after an early stop");
  expect(app.advertised_key() == "Qq11Ww", "configured key kept");
  return true;
}

} // namespace

void add_transfer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"send_file", test_send_file});
  tests.push_back({"send_directory", test_send_directory});
  tests.push_back({"send_error_kinds", test_send_error_kinds});
  tests.push_back({"app_join_send_list", test_app_join_send_list});
  tests.push_back({"app_send_failures", test_app_send_failures});
  tests.push_back({"app_stop_before_join", test_app_stop_before_join});
}

} // namespace ftr::test
