#include "test_runner_utils.hpp"

#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

#include <cctype>

namespace ftr::test {
namespace {

std::optional<std::string> parse_error(const std::vector<std::string>& args) {
  try {
    CommandLineParser().parse(args);
  } catch(const CommandLineError& e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

bool test_settings_defaults(TestContext&) {
  SettingsManager settings;
  expect(settings.get<int>("port") == 8844, "default port");
  expect(settings.get<int>("list_timeout_ms") == 3000, "default list timeout");
  expect(settings.get<std::string>("key").empty(), "no default key");
  expect(!settings.help_requested(), "help off");
  return true;
}

bool test_settings_string_values(TestContext&) {
  SettingsManager settings;
  std::string error;
  expect(settings.set_from_string("p", "9000", error), "alias accepted");
  expect(settings.get<int>("port") == 9000, "port stored");
  expect(!settings.set_from_string("port", "90x", error), "partial integer rejected");
  expect(!settings.set_from_string("verbose", "maybe", error), "bad bool rejected");
  expect(settings.set_from_string("drop_dir", " /srv/in box ", error), "second alias");
  expect(settings.get<std::string>("dropdir") == " /srv/in box ", "strings kept verbatim");
  expect(!settings.set_from_string("colour", "red", error) && error == "unknown setting", "unknown key");
  return true;
}

bool test_settings_file(TestContext&) {
  TempDir tmp("settings");
  write_file(tmp / "settings.json",
             R"({"port": 9100, "name": "studio", "help": true, "unknown": 1, "list_timeout_ms": "slow"})");
  SettingsManager settings;
  expect(settings.load_from_file(tmp / "settings.json"), "file loaded");
  expect(settings.get<int>("port") == 9100, "port from file");
  expect(settings.get<std::string>("name") == "studio", "name from file");
  expect(!settings.help_requested(), "help cannot come from a file");
  expect(settings.get<int>("list_timeout_ms") == 3000, "invalid value skipped");
  expect(!settings.load_from_file(tmp / "absent.json"), "missing file reported");

  write_file(tmp / "broken.json", "{ not json");
  bool threw = false;
  try {
    settings.load_from_file(tmp / "broken.json");
  } catch(const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "parse error raised");

  std::string error;
  settings.set_from_string("key", "Secret", error);
  expect(settings.get_json()["key"] == "<set>", "key masked in dumps");
  return true;
}

bool test_parse_join(TestContext&) {
  CommandLineParser parser;
  auto parsed = parser.parse({"join", "--name", "alice", "-p", "9001", "--dropdir=/tmp/in", "-k", "Ab12Cd"});
  expect(parsed.command == "join", "command");
  expect(parsed.option("name").value_or("") == "alice", "name");
  expect(parsed.option("port").value_or("") == "9001", "port via alias");
  expect(parsed.option("dropdir").value_or("") == "/tmp/in", "inline value");
  expect(parsed.option("key").value_or("") == "Ab12Cd", "key via alias");

  SettingsManager settings;
  parser.apply(parsed, settings);
  expect(settings.get<int>("port") == 9001, "applied port");
  expect(settings.get<std::string>("name") == "alice", "applied name");
  return true;
}

bool test_parse_send(TestContext&) {
  CommandLineParser parser;
  auto parsed = parser.parse({"--verbose", "send", "--key", "Ab12Cd", "./photos", "alice"});
  expect(parsed.command == "send", "command");
  expect(parsed.positionals == std::vector<std::string>{"./photos", "alice"}, "positionals");
  expect(parsed.option("verbose").value_or("") == "true", "bare bool flag");

  parsed = parser.parse({"send", "--", "-odd-name", "alice"});
  expect(parsed.positionals[0] == "-odd-name", "-- ends options");
  return true;
}

bool test_parse_errors(TestContext&) {
  expect(parse_error({}).value_or("") == "Subcommand is not provided", "no subcommand");
  expect(parse_error({"fetch"}).value_or("").find("Unknown subcommand 'fetch'") == 0, "unknown subcommand");
  expect(parse_error({"send", "only-path"}).value_or("").find("Usage: ftr send") == 0, "missing peer");
  expect(parse_error({"list", "extra"}).has_value(), "unexpected positional");
  expect(parse_error({"join", "--bogus", "1"}).value_or("").find("Unknown option") == 0, "unknown option");
  expect(parse_error({"join", "--port"}).value_or("").find("Missing value") == 0, "missing value");

  CommandLineParser parser;
  auto parsed = parser.parse({"join", "--port", "lots"});
  SettingsManager settings;
  bool threw = false;
  try {
    parser.apply(parsed, settings);
  } catch(const CommandLineError&) {
    threw = true;
  }
  expect(threw, "bad integer rejected on apply");
  return true;
}

bool test_parse_help(TestContext& ctx) {
  CommandLineParser parser;
  expect(parser.parse({"--help"}).command == "help", "bare --help");
  expect(parser.parse({"help"}).command == "help", "help subcommand");
  auto parsed = parser.parse({"send", "-h"});
  expect(parsed.command == "send" && parsed.option("help"), "help skips positional checks");

  auto logger = std::make_shared<Logger>("usage");
  ctx.logs.attach(logger);
  parser.usage(logger.get());
  expect(ctx.logs.contains("ftr send [--key <key>] [--lookup_timeout_ms <lookup_timeout_ms>] <path> <peer>"),
         "send synopsis");
  expect(ctx.logs.contains("ftr join [--name <name>]"), "join synopsis");
  expect(ctx.logs.contains("--dropdir"), "options listed");
  return true;
}

bool test_utils(TestContext&) {
  auto key = random_alphanumeric(6);
  expect(key.size() == 6, "key length");
  expect(std::all_of(key.begin(), key.end(), [](char c){ return std::isalnum(static_cast<unsigned char>(c)); }),
         "alphanumeric");
  expect(secure_equals("Ab12Cd", "Ab12Cd") && !secure_equals("Ab12Cd", "ab12cd") && !secure_equals("Ab12Cd", "Ab12C"),
         "exact comparison");
  expect(trim_host_name("alice.local") == "alice", "host name trimmed");
  Sha256 digest;
  digest.update("a", 1);
  digest.update("bc", 2);
  expect(digest.hex_digest() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "sha256 over split input");
  return true;
}

} // namespace

void add_cli_tests(std::vector<TestCase>& tests) {
  tests.push_back({"settings_defaults", test_settings_defaults});
  tests.push_back({"settings_string_values", test_settings_string_values});
  tests.push_back({"settings_file", test_settings_file});
  tests.push_back({"parse_join", test_parse_join});
  tests.push_back({"parse_send", test_parse_send});
  tests.push_back({"parse_errors", test_parse_errors});
  tests.push_back({"parse_help", test_parse_help});
  tests.push_back({"utils", test_utils});
}

} // namespace ftr::test
