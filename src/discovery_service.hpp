#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"

struct DiscoveryOptions {
  std::string listen_ip = "0.0.0.0";
  uint16_t port = kDiscoveryPort;            // 0 picks a free port
  uint16_t announce_port = 0;                // destination port; 0 = same as bound port
  std::chrono::milliseconds heartbeat{1000};
  std::chrono::milliseconds peer_timeout{0};  // 0 = twice the heartbeat
};

// Drives the presence protocol: every heartbeat it evicts stale peers and
// announces this host; in between it folds received announcements into the
// registry. Heartbeat and receive share one strand.
class DiscoveryService : public std::enable_shared_from_this<DiscoveryService> {
public:
  using MembershipCallback = std::function<void()>;
  using LocalAddressProvider = std::function<std::vector<asio::ip::address>()>;
  using BroadcastTargetProvider = std::function<std::vector<asio::ip::address_v4>()>;

  DiscoveryService(asio::io_context& io,
                   std::shared_ptr<PeerRegistry> registry,
                   DiscoveryOptions options,
                   std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryService();

  void set_membership_callback(MembershipCallback cb);
  // Replace interface enumeration (defaults: local_addresses(), broadcast_addresses()).
  void set_local_address_provider(LocalAddressProvider provider);
  void set_broadcast_target_provider(BroadcastTargetProvider provider);

  // Binds the socket and starts both activities. Throws std::system_error
  // when the port is unavailable.
  void start();
  void stop();

  uint16_t port() const { return port_; }
  std::chrono::milliseconds heartbeat_interval() const { return options_.heartbeat; }
  std::chrono::milliseconds peer_timeout() const { return options_.peer_timeout; }

  // Folds one datagram from `from` into the registry. Returns true when the
  // membership visibly changed (new peer or new username).
  bool handle_datagram(const char* data, std::size_t size, const asio::ip::address& from);

private:
  void schedule_heartbeat();
  void heartbeat();
  void announce(const Settings& settings);
  void do_receive();
  void refresh_local_addresses();
  bool is_local_address(const asio::ip::address& address) const;
  void notify_membership_changed();

  asio::strand<asio::io_context::executor_type> strand_;
  asio::ip::udp::socket socket_;
  asio::steady_timer timer_;
  std::shared_ptr<PeerRegistry> registry_;
  DiscoveryOptions options_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> running_{false};
  uint16_t port_ = 0;

  std::array<char, kMaxDatagramSize> recv_buf_{};
  asio::ip::udp::endpoint remote_;

  mutable std::mutex local_mutex_;
  std::vector<asio::ip::address> local_addresses_;
  LocalAddressProvider local_provider_;
  BroadcastTargetProvider broadcast_provider_;

  std::mutex callback_mutex_;
  MembershipCallback membership_callback_;
};
