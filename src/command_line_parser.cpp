#include "command_line_parser.hpp"

#include <algorithm>
#include <sstream>

#include "log.hpp"

std::optional<std::string> ParsedCommand::option(const std::string& key) const {
  std::optional<std::string> found;
  for(const auto& [name, value] : options) {
    if(name == key) found = value;
  }
  return found;
}

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json command_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    probe_(settings_spec_),
    commands_(build_command_specs(command_spec)) {}

std::vector<CommandLineParser::CommandSpec> CommandLineParser::build_command_specs(const nlohmann::json& spec) const {
  std::vector<CommandSpec> result;
  for(const auto& entry : spec) {
    CommandSpec out;
    out.name = entry.at("name").get<std::string>();
    out.description = entry.value("description", "");
    out.positionals = entry.value("positionals", std::vector<std::string>());
    result.push_back(std::move(out));
  }
  return result;
}

const CommandLineParser::CommandSpec* CommandLineParser::find_command(const std::string& name) const {
  for(const auto& command : commands_) {
    if(command.name == name) return &command;
  }
  return nullptr;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

ParsedCommand CommandLineParser::parse(int argc, char* argv[]) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args);
}

ParsedCommand CommandLineParser::parse(const std::vector<std::string>& args) const {
  ParsedCommand parsed;
  const CommandSpec* command = nullptr;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }

    if(!options_done && is_option_token(token)) {
      bool long_form = token.rfind("--", 0) == 0;
      std::string name = token.substr(long_form ? 2 : 1);
      std::optional<std::string> inline_value;
      if(auto eq = name.find('='); long_form && eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
      }
      auto resolved = probe_.resolve_key(name);
      if(!resolved) {
        throw CommandLineError("Unknown option " + token);
      }
      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else if(probe_.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option '" + token + "'");
        }
        value = args[++i];
      }
      parsed.options.emplace_back(*resolved, value);
      continue;
    }

    if(!command) {
      command = find_command(token);
      if(!command) {
        throw CommandLineError("Unknown subcommand '" + token + "'");
      }
      parsed.command = command->name;
      continue;
    }

    if(parsed.positionals.size() >= command->positionals.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'\nUsage: " + command_synopsis(command->name));
    }
    parsed.positionals.push_back(token);
  }

  if(!command) {
    if(parsed.option("help")) {
      parsed.command = "help";
      return parsed;
    }
    throw CommandLineError("Subcommand is not provided");
  }
  bool wants_help = parsed.option("help").has_value();
  if(!wants_help && parsed.positionals.size() != command->positionals.size()) {
    throw CommandLineError("Usage: " + command_synopsis(command->name));
  }
  return parsed;
}

void CommandLineParser::apply(const ParsedCommand& parsed, SettingsManager& settings) const {
  for(const auto& [key, value] : parsed.options) {
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw CommandLineError("Invalid value for option '--" + key + "': " + error);
    }
  }
}

std::string CommandLineParser::command_synopsis(const std::string& name) const {
  std::ostringstream out;
  out << process_name_ << " " << name;
  for(const auto& entry : settings_spec_) {
    if(!entry.contains("commands")) continue;
    auto commands = entry.at("commands").get<std::vector<std::string>>();
    if(std::find(commands.begin(), commands.end(), name) == commands.end()) continue;
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    out << " [--" << key;
    if(type != "bool") out << " <" << key << ">";
    out << "]";
  }
  if(const auto* command = find_command(name)) {
    for(const auto& positional : command->positionals) {
      out << " <" << positional << ">";
    }
  }
  return out.str();
}

void CommandLineParser::usage(Logger* logger) const {
  print_out(logger, "{} - send files and directories to peers on the local network", process_name_);
  print_out(logger, "Usage:");
  for(const auto& command : commands_) {
    print_out(logger, "  {}", command_synopsis(command.name));
  }
  print_out(logger, "");
  print_out(logger, "Commands:");
  for(const auto& command : commands_) {
    print_out(logger, "  {:<6} {}", command.name, command.description);
  }
  print_out(logger, "");
  print_out(logger, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(logger, "  --{:<18} {:<12} {}{}{}",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str.empty() ? std::string() : " (default: " + default_str + ")");
  }
  print_out(logger, "");
}
