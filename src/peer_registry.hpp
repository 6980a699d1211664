#pragma once
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct Peer {
  std::string username;
  std::string address;   // IP of the announcing host; identifies the peer
  std::optional<std::chrono::steady_clock::time_point> last_seen; // never serialized
};

void to_json(nlohmann::json& j, const Peer& peer);

struct Settings {
  std::string username;
  bool broadcasting_enabled = true;
  std::string broadcast_address;

  // Hostname as username, broadcasting on, all-interfaces mode.
  static Settings defaults();
};

void to_json(nlohmann::json& j, const Settings& settings);
void from_json(const nlohmann::json& j, Settings& settings);

enum class UpsertResult {
  Inserted,
  UpdatedWithChange,   // same address, different username
  UpdatedNoChange
};

// Membership table plus local settings. Every call takes the one lock for the
// in-memory update only.
class PeerRegistry {
public:
  using Clock = std::chrono::steady_clock;

  PeerRegistry();
  explicit PeerRegistry(Settings settings);

  std::vector<Peer> list_peers() const;
  std::size_t peer_count() const;

  Settings get_settings() const;
  void set_settings(Settings settings);

  UpsertResult upsert_peer(Peer candidate);

  // Drops every peer seen `timeout` or longer before `now`, and every peer
  // that was never timestamped. Returns how many were removed.
  std::size_t evict_stale(Clock::duration timeout, Clock::time_point now = Clock::now());

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, Peer> peers_; // address -> peer
  Settings settings_;
};
