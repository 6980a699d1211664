#include "landrop_node.hpp"

#include <chrono>
#include <cstdlib>
#include <future>
#include <stdexcept>

#include "config_manager.hpp"
#include "discovery_service.hpp"
#include "transfer_server.hpp"

namespace {

constexpr auto kStopDrainTimeout = std::chrono::seconds(2);

// "host", "host:port" or "[v6]:port".
bool split_recipient(const std::string& recipient,
                     uint16_t default_port,
                     std::string& host,
                     uint16_t& port) {
  host = recipient;
  port = default_port;
  std::string port_text;
  if(!recipient.empty() && recipient.front() == '[') {
    auto close = recipient.find(']');
    if(close == std::string::npos) return false;
    host = recipient.substr(1, close - 1);
    if(close + 1 < recipient.size()) {
      if(recipient[close + 1] != ':') return false;
      port_text = recipient.substr(close + 2);
    }
  } else if(auto pos = recipient.find(':');
            pos != std::string::npos && recipient.find(':', pos + 1) == std::string::npos) {
    host = recipient.substr(0, pos);
    port_text = recipient.substr(pos + 1);
  }
  if(host.empty()) return false;
  if(!port_text.empty()) {
    try {
      std::size_t used = 0;
      int value = std::stoi(port_text, &used);
      if(used != port_text.size() || value <= 0 || value > 65535) return false;
      port = static_cast<uint16_t>(value);
    } catch(const std::exception&) {
      return false;
    }
  }
  return true;
}

} // namespace

LandropNode::LandropNode(std::shared_ptr<ConfigManager> config)
  : config_(config ? std::move(config) : std::make_shared<ConfigManager>()),
    logger_(std::make_shared<Logger>("landrop")),
    registry_(std::make_shared<PeerRegistry>()) {}

LandropNode::~LandropNode() {
  stop();
}

void LandropNode::set_events(Events events) {
  events_ = std::move(events);
}

uint16_t LandropNode::port_setting(const std::string& key) const {
  int value = config_->get<int>(key);
  if(value < 0 || value > 65535) {
    logger_->error("Invalid {} '{}'", key, value);
    throw std::runtime_error("Invalid " + key);
  }
  return static_cast<uint16_t>(value);
}

std::optional<std::filesystem::path> LandropNode::resolve_download_dir() const {
  auto configured = config_->get<std::string>("download_dir");
  if(!configured.empty()) return std::filesystem::path(configured);
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / "Downloads";
  }
  return std::nullopt;
}

void LandropNode::start() {
  if(started_) return;
  if(io_.stopped()) io_.restart();

  init_logging(config_->get<bool>("verbose"));

  Settings settings = Settings::defaults();
  auto username = config_->get<std::string>("username");
  if(!username.empty()) settings.username = username;
  settings.broadcasting_enabled = config_->get<bool>("broadcasting_enabled");
  auto broadcast = config_->get<std::string>("broadcast_address");
  if(!broadcast.empty()) settings.broadcast_address = broadcast;
  registry_->set_settings(settings);
  logger_->set_name(settings.username);

  auto listen_ip = config_->get<std::string>("listen_ip");
  std::error_code addr_ec;
  asio::ip::make_address(listen_ip, addr_ec);
  if(addr_ec) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip, addr_ec.message());
    throw std::runtime_error("Invalid listen_ip");
  }

  int threads = config_->get<int>("io_threads");
  thread_count_ = threads > 0 ? static_cast<std::size_t>(threads) : 1;

  int pending_cap = config_->get<int>("max_pending_offers");
  broker_ = std::make_shared<OfferBroker>(pending_cap > 0 ? static_cast<std::size_t>(pending_cap) : 0);

  DiscoveryOptions discovery_options;
  discovery_options.listen_ip = listen_ip;
  discovery_options.port = port_setting("discovery_port");
  discovery_options.heartbeat = std::chrono::milliseconds(config_->get<int>("heartbeat_ms"));
  discovery_options.peer_timeout = std::chrono::milliseconds(config_->get<int>("peer_timeout_ms"));

  TransferServerOptions server_options;
  server_options.listen_ip = listen_ip;
  server_options.port = port_setting("transfer_port");
  int offer_timeout = config_->get<int>("offer_timeout_s");
  server_options.offer_timeout = std::chrono::seconds(offer_timeout > 0 ? offer_timeout : 0);
  server_options.download_dir = [this](){ return resolve_download_dir(); };

  discovery_ = std::make_shared<DiscoveryService>(io_, registry_, discovery_options, logger_);
  discovery_->set_membership_callback(events_.on_peers_updated);
  server_ = std::make_shared<TransferServer>(io_, broker_, server_options, events_.transfer, logger_);
  client_ = std::make_unique<TransferClient>(io_, events_.transfer, logger_);

  try {
    discovery_->start();
    server_->start();
  } catch(const std::exception& e) {
    logger_->error("Failed to start: {}", e.what());
    discovery_->stop();
    server_->stop();
    throw;
  }

  discovery_port_ = discovery_->port();
  transfer_port_ = server_->port();
  work_.emplace(asio::make_work_guard(io_));
  {
    std::lock_guard lg(lifecycle_mutex_);
    started_ = true;
  }
  logger_->info("Ready as '{}' (discovery {}, transfer {})",
                settings.username, discovery_port_, transfer_port_);
}

void LandropNode::spawn_io_thread() {
  ++active_runners_;
  io_threads_.emplace_back([this](){
    io_.run();
    --active_runners_;
  });
}

void LandropNode::run() {
  if(!started_) start();
  for(std::size_t i = 1; i < thread_count_; ++i) {
    spawn_io_thread();
  }
  ++active_runners_;
  io_.run();
  --active_runners_;
}

void LandropNode::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  for(std::size_t i = 0; i < thread_count_; ++i) {
    spawn_io_thread();
  }
}

void LandropNode::stop() {
  {
    std::lock_guard lg(lifecycle_mutex_);
    if(!started_.exchange(false)) return;
  }

  if(discovery_) discovery_->stop();
  if(server_) server_->stop();
  if(client_) client_->stop();
  if(broker_) broker_->clear();
  work_.reset();

  // With the sockets closed the pool runs dry once every aborted transfer
  // has reported on its own strand.
  if(!io_.get_executor().running_in_this_thread()) {
    auto deadline = std::chrono::steady_clock::now() + kStopDrainTimeout;
    while(active_runners_ > 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  io_.stop();
  auto self_id = std::this_thread::get_id();
  for(auto& t : io_threads_) {
    if(t.get_id() == self_id) {
      t.detach();
    } else if(t.joinable()) {
      t.join();
    }
  }
  io_threads_.clear();
}

std::vector<Peer> LandropNode::list_peers() const {
  return registry_->list_peers();
}

Settings LandropNode::get_settings() const {
  return registry_->get_settings();
}

void LandropNode::update_settings(Settings settings) {
  std::string error;
  if(!config_->set_from_json("username", settings.username, error) ||
     !config_->set_from_json("broadcasting_enabled", settings.broadcasting_enabled, error) ||
     !config_->set_from_json("broadcast_address", settings.broadcast_address, error)) {
    logger_->warn("Settings not mirrored into configuration: {}", error);
  }
  logger_->set_name(settings.username);
  registry_->set_settings(std::move(settings));
}

void LandropNode::send_files_async(const std::string& recipient,
                                   std::vector<std::filesystem::path> paths,
                                   TransferClient::CompletionHandler handler) {
  std::string host;
  uint16_t port = 0;
  int configured_port = config_->get<int>("transfer_port");
  uint16_t default_port = (configured_port > 0 && configured_port <= 65535)
                            ? static_cast<uint16_t>(configured_port) : kTransferPort;
  if(!split_recipient(recipient, default_port, host, port)) {
    logger_->error("Invalid recipient '{}'", recipient);
    if(handler) handler(asio::error::invalid_argument);
    return;
  }
  {
    std::lock_guard lg(lifecycle_mutex_);
    if(started_ && client_) {
      client_->async_send(host, port, std::move(paths), std::move(handler));
      return;
    }
  }
  logger_->warn("Not sending to {}: node is not running", recipient);
  if(handler) handler(asio::error::not_connected);
}

std::error_code LandropNode::send_files(const std::string& recipient,
                                        std::vector<std::filesystem::path> paths) {
  auto done = std::make_shared<std::promise<std::error_code>>();
  auto result = done->get_future();
  send_files_async(recipient, std::move(paths), [done](const std::error_code& ec){
    done->set_value(ec);
  });
  return result.get();
}

ResolveResult LandropNode::accept_offer(const std::string& offer_id) {
  if(!broker_) return ResolveResult::AlreadyGoneOrUnknown;
  return broker_->resolve(offer_id, true);
}

ResolveResult LandropNode::reject_offer(const std::string& offer_id) {
  if(!broker_) return ResolveResult::AlreadyGoneOrUnknown;
  return broker_->resolve(offer_id, false);
}

std::vector<std::string> LandropNode::pending_offers() const {
  if(!broker_) return {};
  return broker_->pending_ids();
}

std::vector<NetworkInterfaceInfo> LandropNode::network_interfaces() const {
  return list_network_interfaces();
}

std::optional<std::string> LandropNode::own_address() {
  return ::own_address(io_);
}

LogListenerHandle LandropNode::add_log_listener(Logger::Listener listener) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener));
}
