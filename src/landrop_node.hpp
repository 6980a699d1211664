#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "log.hpp"
#include "net_interfaces.hpp"
#include "offer_broker.hpp"
#include "peer_registry.hpp"
#include "transfer_client.hpp"
#include "transfer_events.hpp"

class ConfigManager;
class DiscoveryService;
class TransferServer;

// One running instance: owns the I/O threads, the peer registry, the offer
// table, discovery and both transfer directions, and exposes the control
// operations a front-end needs.
class LandropNode {
public:
  struct Events {
    std::function<void()> on_peers_updated;
    TransferCallbacks transfer;
  };

  explicit LandropNode(std::shared_ptr<ConfigManager> config = nullptr);
  ~LandropNode();

  LandropNode(const LandropNode&) = delete;
  LandropNode& operator=(const LandropNode&) = delete;

  // Must be called before start().
  void set_events(Events events);

  // Binds the discovery and transfer ports. Throws when either is unavailable
  // or the configuration is invalid.
  void start();
  // Runs the I/O pool with the calling thread as one of its threads.
  void run();
  void start_background();
  // Aborts open transfers, rejects pending offers and waits briefly for the
  // I/O threads to deliver the resulting events before joining them.
  void stop();

  std::vector<Peer> list_peers() const;
  Settings get_settings() const;
  void update_settings(Settings settings);

  // `recipient` is "host" or "host:port"; the port defaults to transfer_port.
  // Fails with asio::error::not_connected unless the node is running.
  void send_files_async(const std::string& recipient,
                        std::vector<std::filesystem::path> paths,
                        TransferClient::CompletionHandler handler);
  // Blocks until the transfer ends. Never call from a callback.
  std::error_code send_files(const std::string& recipient,
                             std::vector<std::filesystem::path> paths);

  ResolveResult accept_offer(const std::string& offer_id);
  ResolveResult reject_offer(const std::string& offer_id);
  std::vector<std::string> pending_offers() const;

  std::vector<NetworkInterfaceInfo> network_interfaces() const;
  std::optional<std::string> own_address();

  uint16_t discovery_port() const { return discovery_port_; }
  uint16_t transfer_port() const { return transfer_port_; }

  std::shared_ptr<ConfigManager> config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  LogListenerHandle add_log_listener(Logger::Listener listener);

private:
  std::optional<std::filesystem::path> resolve_download_dir() const;
  uint16_t port_setting(const std::string& key) const;
  void spawn_io_thread();

  std::shared_ptr<ConfigManager> config_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> io_threads_;

  std::shared_ptr<PeerRegistry> registry_;
  std::shared_ptr<OfferBroker> broker_;
  std::shared_ptr<DiscoveryService> discovery_;
  std::shared_ptr<TransferServer> server_;
  std::unique_ptr<TransferClient> client_;
  Events events_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> started_{false};
  std::atomic<int> active_runners_{0};
  std::size_t thread_count_ = 2;
  uint16_t discovery_port_ = 0;
  uint16_t transfer_port_ = 0;
};
