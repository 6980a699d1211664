#include "discovery_service.hpp"
#include "net_interfaces.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

DiscoveryService::DiscoveryService(asio::io_context& io,
                                   std::shared_ptr<PeerRegistry> registry,
                                   DiscoveryOptions options,
                                   std::shared_ptr<Logger> logger)
  : strand_(asio::make_strand(io)),
    socket_(strand_),
    timer_(strand_),
    registry_(std::move(registry)),
    options_(std::move(options)),
    logger_(std::move(logger)),
    local_provider_([](){ return local_addresses(); }),
    broadcast_provider_([](){ return broadcast_addresses(); }) {
  if(options_.heartbeat.count() <= 0) options_.heartbeat = std::chrono::milliseconds(1000);
  if(options_.peer_timeout.count() <= 0) options_.peer_timeout = 2 * options_.heartbeat;
}

DiscoveryService::~DiscoveryService(){
  std::error_code ignored;
  socket_.close(ignored);
}

void DiscoveryService::set_membership_callback(MembershipCallback cb){
  std::lock_guard lg(callback_mutex_);
  membership_callback_ = std::move(cb);
}

void DiscoveryService::set_local_address_provider(LocalAddressProvider provider){
  {
    std::lock_guard lg(local_mutex_);
    local_provider_ = std::move(provider);
  }
  refresh_local_addresses();
}

void DiscoveryService::set_broadcast_target_provider(BroadcastTargetProvider provider){
  std::lock_guard lg(local_mutex_);
  broadcast_provider_ = std::move(provider);
}

void DiscoveryService::start(){
  if(running_) return;
  using udp = asio::ip::udp;
  udp::endpoint endpoint(asio::ip::make_address(options_.listen_ip), options_.port);
  socket_.open(endpoint.protocol());
  socket_.set_option(udp::socket::reuse_address(true));
  socket_.set_option(asio::socket_base::broadcast(true));
  socket_.bind(endpoint);
  port_ = socket_.local_endpoint().port();
  if(options_.announce_port == 0) options_.announce_port = port_;
  running_ = true;
  refresh_local_addresses();
  log_info(logger_.get(), "Discovery on {}:{} (heartbeat {} ms, peer timeout {} ms)",
           options_.listen_ip, port_, options_.heartbeat.count(), options_.peer_timeout.count());

  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self](){
    do_receive();
    heartbeat();
    schedule_heartbeat();
  });
}

void DiscoveryService::stop(){
  if(!running_.exchange(false)) return;
  auto self = shared_from_this();
  asio::post(strand_, [this, self](){
    std::error_code ignored;
    timer_.cancel();
    socket_.close(ignored);
  });
}

void DiscoveryService::schedule_heartbeat(){
  auto self = shared_from_this();
  timer_.expires_after(options_.heartbeat);
  timer_.async_wait([this, self](const std::error_code& ec){
    if(ec || !running_) return;
    heartbeat();
    schedule_heartbeat();
  });
}

void DiscoveryService::heartbeat(){
  refresh_local_addresses();

  auto removed = registry_->evict_stale(options_.peer_timeout);
  if(removed > 0){
    log_debug(logger_.get(), "Evicted {} stale peer(s)", removed);
    notify_membership_changed();
  }

  auto settings = registry_->get_settings();
  if(settings.broadcasting_enabled){
    announce(settings);
  }
}

void DiscoveryService::announce(const Settings& settings){
  auto payload = encode_discovery_message(PresenceMessage{settings.username});

  std::vector<asio::ip::address_v4> targets;
  if(settings.broadcast_address == kAllInterfacesBroadcast){
    BroadcastTargetProvider provider;
    {
      std::lock_guard lg(local_mutex_);
      provider = broadcast_provider_;
    }
    if(provider) targets = provider();
  } else {
    std::error_code ec;
    auto addr = asio::ip::make_address_v4(settings.broadcast_address, ec);
    if(ec){
      log_warn(logger_.get(), "Invalid broadcast address '{}'", settings.broadcast_address);
      return;
    }
    targets.push_back(addr);
  }

  for(const auto& target : targets){
    asio::ip::udp::endpoint endpoint(target, options_.announce_port);
    std::error_code ec;
    socket_.send_to(asio::buffer(payload), endpoint, 0, ec);
    if(ec){
      log_warn(logger_.get(), "Failed to send broadcast to {}:{}: {}",
               target.to_string(), options_.announce_port, ec.message());
    }
  }
}

void DiscoveryService::do_receive(){
  auto self = shared_from_this();
  socket_.async_receive_from(asio::buffer(recv_buf_), remote_,
    [this, self](std::error_code ec, std::size_t n){
      if(ec == asio::error::operation_aborted || !running_) return;
      if(ec){
        log_warn(logger_.get(), "Discovery receive error: {}", ec.message());
      } else {
        handle_datagram(recv_buf_.data(), n, remote_.address());
      }
      do_receive();
    });
}

bool DiscoveryService::handle_datagram(const char* data,
                                       std::size_t size,
                                       const asio::ip::address& from){
  if(is_local_address(from)) return false;

  auto message = decode_discovery_message(data, size);
  if(!message){
    log_debug(logger_.get(), "Discarding malformed datagram from {}", from.to_string());
    return false;
  }

  bool changed = std::visit([&](const auto& m){
    using T = std::decay_t<decltype(m)>;
    static_assert(std::is_same_v<T, PresenceMessage>, "unhandled discovery message");
    Peer peer;
    peer.username = m.username;
    peer.address = from.to_string();
    peer.last_seen = PeerRegistry::Clock::now();
    switch(registry_->upsert_peer(peer)){
      case UpsertResult::Inserted:
        log_info(logger_.get(), "Discovered {} ({})", peer.username, peer.address);
        return true;
      case UpsertResult::UpdatedWithChange:
        log_info(logger_.get(), "{} is now known as {}", peer.address, peer.username);
        return true;
      case UpsertResult::UpdatedNoChange:
        break;
    }
    return false;
  }, *message);

  if(changed) notify_membership_changed();
  return changed;
}

void DiscoveryService::refresh_local_addresses(){
  LocalAddressProvider provider;
  {
    std::lock_guard lg(local_mutex_);
    provider = local_provider_;
  }
  auto addresses = provider ? provider() : std::vector<asio::ip::address>{};
  std::lock_guard lg(local_mutex_);
  local_addresses_ = std::move(addresses);
}

bool DiscoveryService::is_local_address(const asio::ip::address& address) const {
  std::lock_guard lg(local_mutex_);
  return std::find(local_addresses_.begin(), local_addresses_.end(), address) != local_addresses_.end();
}

void DiscoveryService::notify_membership_changed(){
  MembershipCallback cb;
  {
    std::lock_guard lg(callback_mutex_);
    cb = membership_callback_;
  }
  if(cb) cb();
}
