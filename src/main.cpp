#include <cpptrace/cpptrace.hpp>
#include <chrono>
#include <filesystem>

#include "sharing_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "protocol.hpp"
#include "utils.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    SharingEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "voiceshare");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init(false);
      print_err(nullptr, "{}", error);
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    int port = settings->get<int>("sharing_port");
    if(port < 0 || port > 65535) {
      init(false);
      print_err(nullptr, "Invalid sharing_port '{}'", port);
      return 2;
    }

    SharingEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    logger->print("voiceshare {} on {} (machine {}). Type 'help' for commands.",
                  protocol_version(), local_host_name(), local_machine_id().substr(0, 8));
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("voiceshare-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
