#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "settings_manager.hpp"

inline const nlohmann::json COMMAND_SPECIFICATION = nlohmann::json::array({
  {{"name","join"}, {"description","Advertise this machine and receive files into the drop dir"}, {"positionals", nlohmann::json::array()}},
  {{"name","list"}, {"description","List receivers on the local network"},                      {"positionals", nlohmann::json::array()}},
  {{"name","send"}, {"description","Send a file or directory to a receiver"},                   {"positionals", {"path","peer"}}},
  {{"name","help"}, {"description","Show this help"},                                           {"positionals", nlohmann::json::array()}}
});

class CommandLineError : public std::runtime_error {
public:
  explicit CommandLineError(const std::string& message) : std::runtime_error(message) {}
};

struct ParsedCommand {
  std::string command;
  // resolved setting key and the raw value given for it, in argv order
  std::vector<std::pair<std::string, std::string>> options;
  std::vector<std::string> positionals;

  std::optional<std::string> option(const std::string& key) const;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "ftr",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json command_spec = COMMAND_SPECIFICATION);

  // Throws CommandLineError on an unknown subcommand or option, a missing
  // option value or the wrong number of positional arguments.
  ParsedCommand parse(int argc, char* argv[]) const;
  ParsedCommand parse(const std::vector<std::string>& args) const;

  // Stores the parsed options; command line values win over anything loaded
  // before. Throws CommandLineError on a value of the wrong type.
  void apply(const ParsedCommand& parsed, SettingsManager& settings) const;

  void usage(Logger* logger = nullptr) const;
  std::string command_synopsis(const std::string& command) const;

private:
  struct CommandSpec {
    std::string name;
    std::string description;
    std::vector<std::string> positionals;
  };

  std::vector<CommandSpec> build_command_specs(const nlohmann::json& spec) const;
  const CommandSpec* find_command(const std::string& name) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  SettingsManager probe_;
  std::vector<CommandSpec> commands_;
};
