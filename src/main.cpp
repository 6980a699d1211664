#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <memory>

#include "command_line_parser.hpp"
#include "config_manager.hpp"
#include "console.hpp"
#include "landrop_node.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    auto config = std::make_shared<ConfigManager>();
    config->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "landrop");
    if(!parser.parse(argc, argv, *config)) {
      parser.usage(*config);
      return 2;
    }
    if(config->help_requested()) {
      parser.usage(*config);
      return 0;
    }

    init_logging(config->get<bool>("verbose"));

    if(config->save_requested()) {
      if(!config->save()) {
        log_error(nullptr, "Unable to persist settings to {}", config->config_path().string());
      }
    }

    LandropNode node(config);
    auto logger = node.logger();
    if(config->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    Console console(node, [&node](){ node.stop(); });
    node.set_events(console.events());

    node.start();
    if(auto address = node.own_address()) {
      logger->print("Local address: {}", *address);
    }
    console.start();
    node.run();
    node.stop();
    console.stop();

    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("landrop-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
