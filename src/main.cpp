#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "ftr_app.hpp"
#include "log.hpp"
#include "mdns_discovery.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  init(false);
  try {
    CommandLineParser parser("ftr");
    ParsedCommand command;
    try {
      command = parser.parse(argc, argv);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      print_err(nullptr, "Run 'ftr help' for usage");
      return 1;
    }

    auto settings = std::make_shared<SettingsManager>();
    std::filesystem::path config_path = SettingsManager::default_settings_path();
    if(auto explicit_path = command.option("config")) {
      config_path = *explicit_path;
      if(!settings->load_from_file(config_path)) {
        print_err(nullptr, "Config file {} not found", config_path.string());
        return 1;
      }
    } else if(!config_path.empty()) {
      settings->load_from_file(config_path);
    }

    try {
      parser.apply(command, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      return 1;
    }

    bool verbose = settings->get<bool>("verbose");
    init(verbose);
    auto logger = std::make_shared<Logger>("ftr");
    if(verbose) {
      logger->debug("Verbose logging enabled, settings {}", settings->get_json().dump());
    }

    if(command.command == "help" || settings->help_requested()) {
      parser.usage(logger.get());
      return 0;
    }

    FtrApp::Options options;
    options.discovery = std::make_shared<MdnsDiscovery>(MdnsOptions{}, logger);
    FtrApp app(settings, options, logger);
    return app.run(command);
  } catch(const CommandLineError& e) {
    print_err(nullptr, "{}", e.what());
    return 1;
  } catch(const FtrError& e) {
    print_err(nullptr, "{}: {}", to_string(e.kind()), e.what());
    return 1;
  } catch(const std::exception& e) {
    Logger logger("ftr-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
