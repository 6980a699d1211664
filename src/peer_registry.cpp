#include "peer_registry.hpp"
#include "protocol.hpp"
#include "utils.hpp"

void to_json(nlohmann::json& j, const Peer& peer){
  j = nlohmann::json{{"username", peer.username}, {"address", peer.address}};
}

Settings Settings::defaults(){
  Settings s;
  s.username = local_hostname();
  s.broadcasting_enabled = true;
  s.broadcast_address = kAllInterfacesBroadcast;
  return s;
}

void to_json(nlohmann::json& j, const Settings& settings){
  j = nlohmann::json{
    {"username", settings.username},
    {"broadcasting_enabled", settings.broadcasting_enabled},
    {"broadcast_address", settings.broadcast_address}
  };
}

void from_json(const nlohmann::json& j, Settings& settings){
  j.at("username").get_to(settings.username);
  j.at("broadcasting_enabled").get_to(settings.broadcasting_enabled);
  j.at("broadcast_address").get_to(settings.broadcast_address);
}

PeerRegistry::PeerRegistry() : PeerRegistry(Settings::defaults()) {}

PeerRegistry::PeerRegistry(Settings settings) : settings_(std::move(settings)) {}

std::vector<Peer> PeerRegistry::list_peers() const {
  std::lock_guard lg(m_);
  std::vector<Peer> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::size_t PeerRegistry::peer_count() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

Settings PeerRegistry::get_settings() const {
  std::lock_guard lg(m_);
  return settings_;
}

void PeerRegistry::set_settings(Settings settings){
  std::lock_guard lg(m_);
  settings_ = std::move(settings);
}

UpsertResult PeerRegistry::upsert_peer(Peer candidate){
  std::lock_guard lg(m_);
  auto it = peers_.find(candidate.address);
  if(it == peers_.end()){
    auto key = candidate.address;
    peers_.emplace(std::move(key), std::move(candidate));
    return UpsertResult::Inserted;
  }
  bool renamed = it->second.username != candidate.username;
  it->second = std::move(candidate);
  return renamed ? UpsertResult::UpdatedWithChange : UpsertResult::UpdatedNoChange;
}

std::size_t PeerRegistry::evict_stale(Clock::duration timeout, Clock::time_point now){
  std::lock_guard lg(m_);
  std::size_t removed = 0;
  for(auto it = peers_.begin(); it != peers_.end();){
    const auto& seen = it->second.last_seen;
    if(!seen || now - *seen >= timeout){
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}
