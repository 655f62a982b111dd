#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "node_config.hpp"
#include "settings_manager.hpp"
#include "sync_node.hpp"

int main(int argc, char** argv){
  try {
    const auto workspace_root = std::filesystem::current_path();

    SettingsManager settings;
    settings.set_settings_path(workspace_root / kConfigDirName / "settings.json");
    const bool loaded = settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "lansync");
    std::string error;
    if(!parser.parse(argc, argv, settings, error)) {
      init(false);
      print_err("{}", error);
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      init(false);
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    Logger logger("lansync-main");
    if(!loaded) {
      logger.debug("No settings at {}, using defaults", settings.settings_path().string());
    }

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger.error("Unable to persist settings to {}", settings.settings_path().string());
      } else {
        logger.info("Settings saved to {}", settings.settings_path().string());
      }
    }

    auto config = NodeConfig::from_settings(settings, workspace_root);

    SyncNode node(config, SyncNode::Options{});
    node.start_background();
    logger.print("lansync {} listening on port {}, sharing {}",
                 node.token(), node.listen_port(), node.share_root().string());

    asio::io_context signals_io;
    asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signo){
      if(ec) return;
      logger.info("Signal {} received, shutting down", signo);
    });
    signals_io.run();

    node.stop();
    auto status = node.status();
    logger.print("{} cycle(s), {} transfer(s) ok, {} failed",
                 status.cycles_completed, status.transfers_ok, status.transfers_failed);
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("lansync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
