#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

class SettingsManager;

// Typed, validated view of the settings consumed by the sync core.
struct NodeConfig {
  std::filesystem::path share_root;
  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 5005;
  std::string multicast_group = "239.255.255.250";
  uint16_t multicast_port = 5007;
  int multicast_ttl = 2;
  bool multicast_loopback = true;
  std::chrono::milliseconds announce_interval{5000};
  std::chrono::milliseconds expiry_window{15000};
  std::chrono::milliseconds removal_window{60000};
  std::chrono::milliseconds sync_interval{30000};
  std::size_t chunk_size = 64 * 1024;
  std::chrono::milliseconds io_timeout{5000};
  std::chrono::milliseconds catalog_cache{5000};
  std::size_t transfer_log_size = 256;
  bool verbose = false;

  // share_dir is resolved against workspace_root when relative. Throws
  // std::invalid_argument when an address does not parse.
  static NodeConfig from_settings(const SettingsManager& settings,
                                  const std::filesystem::path& workspace_root);
};
