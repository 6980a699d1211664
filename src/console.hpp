#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "config_manager.hpp"
#include "landrop_node.hpp"
#include "transfer_error.hpp"
#include "utils.hpp"

// Line-oriented front-end on stdin/stdout. Owns its reader thread; the node
// is borrowed and must outlive the console.
class Console {
public:
  using QuitHandler = std::function<void()>;

  explicit Console(LandropNode& node, QuitHandler on_quit = nullptr)
    : node_(node), on_quit_(std::move(on_quit)), running_(false) {}

  ~Console() {
    stop();
  }

  // Observers that print to the console. Hand them to the node before start().
  LandropNode::Events events() {
    LandropNode::Events events;
    events.on_peers_updated = [this](){ on_peers_updated(); };
    events.transfer.on_offer = [this](const IncomingOffer& offer){ on_offer(offer); };
    events.transfer.on_progress = [this](const TransferProgress& p){ on_progress(p); };
    events.transfer.on_complete = [this](const TransferComplete& c){ on_complete(c); };
    events.transfer.on_incoming_finished = [this](const std::string& id, const std::error_code& ec){
      on_incoming_finished(id, ec);
    };
    return events;
  }

  void start() {
    if(running_.exchange(true)) return;
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  // Returns false once the user asked to quit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    std::string args;
    std::getline(iss, args);
    trim(args);

    if(cmd.empty()) {
      return true;
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "peers" || cmd == "p") {
      list_peers();
    } else if(cmd == "whoami") {
      whoami();
    } else if(cmd == "interfaces" || cmd == "ifaces") {
      list_interfaces();
    } else if(cmd == "settings" || cmd == "s") {
      show_settings();
    } else if(cmd == "name") {
      rename(args);
    } else if(cmd == "broadcast") {
      set_broadcasting(args);
    } else if(cmd == "iface") {
      select_interface(args);
    } else if(cmd == "send") {
      send_command(args);
    } else if(cmd == "offers") {
      list_offers();
    } else if(cmd == "accept" || cmd == "a") {
      decide(args, true);
    } else if(cmd == "reject" || cmd == "r") {
      decide(args, false);
    } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
      out("Quitting...");
      return false;
    } else {
      print_help();
      out("Unknown command: " + cmd);
    }
    return true;
  }

private:
  void run_loop() {
    while(running_) {
      {
        std::lock_guard lg(out_mutex_);
        std::cout << "> ";
        std::cout.flush();
      }
      std::string line;
      if(!std::getline(std::cin, line)) break;
      if(!execute_command(line)) break;
    }
    running_ = false;
    if(on_quit_) on_quit_();
  }

  void out(const std::string& text) {
    std::lock_guard lg(out_mutex_);
    std::cout << text << "\n";
    std::cout.flush();
  }

  static void trim(std::string& value) {
    value = ConfigManager::trim_copy(std::move(value));
  }

  static std::vector<std::string> split_words(const std::string& text) {
    std::istringstream iss(text);
    std::vector<std::string> words;
    std::string word;
    while(iss >> word) words.push_back(word);
    return words;
  }

  void print_help() {
    std::ostringstream oss;
    oss << "Available commands:\n";
    oss << "  help|h|?                      Show this help message\n";
    oss << "  peers|p                       List peers seen on the network\n";
    oss << "  whoami                        Show own name and address\n";
    oss << "  interfaces                    List broadcast-capable interfaces\n";
    oss << "  settings|s                    Show current settings\n";
    oss << "  name <username>               Change the announced name\n";
    oss << "  broadcast on|off              Toggle presence announcements\n";
    oss << "  iface <broadcast-ip|All>      Announce on one interface or all\n";
    oss << "  send <peer> <file> [file...]  Offer files to a peer (name or host[:port])\n";
    oss << "  offers                        List offers awaiting a decision\n";
    oss << "  accept|a <offer-id>           Accept an incoming offer\n";
    oss << "  reject|r <offer-id>           Reject an incoming offer\n";
    oss << "  quit|q                        Exit the application";
    out(oss.str());
  }

  void list_peers() {
    auto peers = node_.list_peers();
    if(peers.empty()) {
      out("No peers");
      return;
    }
    std::ostringstream oss;
    oss << "Peers (" << peers.size() << "):";
    for(const auto& peer : peers) {
      oss << "\n  " << peer.username << " @ " << peer.address;
    }
    out(oss.str());
  }

  void whoami() {
    auto settings = node_.get_settings();
    auto address = node_.own_address();
    out(settings.username + " @ " + address.value_or("unknown address"));
  }

  void list_interfaces() {
    std::ostringstream oss;
    oss << "Interfaces:";
    for(const auto& iface : node_.network_interfaces()) {
      oss << "\n  " << iface.name;
      if(!iface.ip.empty()) oss << " " << iface.ip;
      oss << " (broadcast " << iface.broadcast << ")";
    }
    out(oss.str());
  }

  void show_settings() {
    nlohmann::json j = node_.get_settings();
    out(j.dump(2));
  }

  void rename(const std::string& name) {
    if(name.empty()) {
      out("Usage: name <username>");
      return;
    }
    auto settings = node_.get_settings();
    settings.username = name;
    node_.update_settings(settings);
    out("Now announcing as " + name);
  }

  void set_broadcasting(const std::string& value) {
    auto lowered = ConfigManager::to_lower(value);
    auto settings = node_.get_settings();
    if(lowered == "on" || lowered == "true" || lowered == "1") {
      settings.broadcasting_enabled = true;
    } else if(lowered == "off" || lowered == "false" || lowered == "0") {
      settings.broadcasting_enabled = false;
    } else {
      out(std::string("Broadcasting is ") + (settings.broadcasting_enabled ? "on" : "off"));
      return;
    }
    node_.update_settings(settings);
    out(std::string("Broadcasting ") + (settings.broadcasting_enabled ? "enabled" : "disabled"));
  }

  void select_interface(const std::string& value) {
    auto settings = node_.get_settings();
    if(value.empty()) {
      out("Broadcast address: " + settings.broadcast_address);
      return;
    }
    std::optional<std::string> chosen;
    for(const auto& iface : node_.network_interfaces()) {
      if(ConfigManager::to_lower(iface.name) == ConfigManager::to_lower(value) ||
         iface.broadcast == value || iface.ip == value) {
        chosen = iface.broadcast;
        break;
      }
    }
    if(!chosen) {
      std::error_code ec;
      asio::ip::make_address_v4(value, ec);
      if(ec) {
        out("Unknown interface or address: " + value);
        return;
      }
      chosen = value;
    }
    settings.broadcast_address = *chosen;
    node_.update_settings(settings);
    out("Broadcast address set to " + *chosen);
  }

  // A peer's username maps to its address; anything else is used as a host.
  std::string resolve_recipient(const std::string& target) {
    for(const auto& peer : node_.list_peers()) {
      if(peer.username == target) return peer.address;
    }
    return target;
  }

  void send_command(const std::string& args) {
    auto words = split_words(args);
    if(words.size() < 2) {
      out("Usage: send <peer> <file> [file...]");
      return;
    }
    auto recipient = resolve_recipient(words.front());
    std::vector<std::filesystem::path> paths(words.begin() + 1, words.end());
    out("Offering " + std::to_string(paths.size()) + " file(s) to " + recipient + "...");
    node_.send_files_async(recipient, std::move(paths), [this, recipient](const std::error_code& ec){
      if(!ec) {
        out("Transfer to " + recipient + " finished");
      } else if(ec == transfer_error::rejected) {
        out(recipient + " declined the transfer");
      } else {
        out("Transfer to " + recipient + " failed: " + ec.message());
      }
    });
  }

  void list_offers() {
    auto ids = node_.pending_offers();
    if(ids.empty()) {
      out("No pending offers");
      return;
    }
    std::ostringstream oss;
    oss << "Pending offers:";
    {
      std::lock_guard lg(offer_mutex_);
      for(const auto& id : ids) {
        oss << "\n  " << id;
        if(auto it = offer_summaries_.find(id); it != offer_summaries_.end()) {
          oss << "  " << it->second;
        }
      }
    }
    out(oss.str());
  }

  void decide(const std::string& id, bool accepted) {
    if(id.empty()) {
      out(std::string("Usage: ") + (accepted ? "accept" : "reject") + " <offer-id>");
      return;
    }
    auto result = accepted ? node_.accept_offer(id) : node_.reject_offer(id);
    if(result == ResolveResult::AlreadyGoneOrUnknown) {
      out("No pending offer " + id);
      return;
    }
    out(std::string(accepted ? "Accepted " : "Rejected ") + id);
  }

  void on_peers_updated() {
    auto peers = node_.list_peers();
    std::ostringstream oss;
    oss << "[peers] " << peers.size() << " online";
    for(const auto& peer : peers) {
      oss << "\n  " << peer.username << " @ " << peer.address;
    }
    out(oss.str());
  }

  void on_offer(const IncomingOffer& offer) {
    std::ostringstream summary;
    summary << offer.from << ", " << offer.files.size() << " file(s), "
            << format_bytes(offer.total_size);
    {
      std::lock_guard lg(offer_mutex_);
      offer_summaries_[offer.id] = summary.str();
    }
    std::ostringstream oss;
    oss << "[offer] " << offer.id << " from " << summary.str();
    for(const auto& file : offer.files) {
      oss << "\n  " << file.name << " (" << format_bytes(file.size) << ")";
    }
    oss << "\n  accept " << offer.id << "  |  reject " << offer.id;
    out(oss.str());
  }

  void on_progress(const TransferProgress& p) {
    int step = static_cast<int>(p.progress / 10.0);
    auto key = p.file_path.string();
    {
      std::lock_guard lg(progress_mutex_);
      auto [it, inserted] = progress_steps_.try_emplace(key, -1);
      if(!inserted && it->second == step) return;
      it->second = step;
    }
    std::ostringstream oss;
    oss << (p.direction == TransferDirection::Outgoing ? "[send] " : "[recv] ")
        << p.file_name << " " << static_cast<int>(p.progress) << "% ("
        << format_bytes(p.bytes_done) << " / " << format_bytes(p.bytes_total) << ")";
    out(oss.str());
  }

  void on_complete(const TransferComplete& c) {
    {
      std::lock_guard lg(progress_mutex_);
      progress_steps_.erase(c.file_path.string());
    }
    if(c.direction == TransferDirection::Incoming) {
      out("[recv] " + c.file_name + " saved to " + c.saved_path.value_or(c.file_path).string());
    } else {
      out("[send] " + c.file_name + " sent");
    }
  }

  void on_incoming_finished(const std::string& id, const std::error_code& ec) {
    {
      std::lock_guard lg(offer_mutex_);
      offer_summaries_.erase(id);
    }
    if(!ec) {
      out("[offer] " + id + " received");
    } else if(ec != transfer_error::rejected) {
      out("[offer] " + id + " failed: " + ec.message());
    }
  }

  LandropNode& node_;
  QuitHandler on_quit_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
  std::mutex out_mutex_;
  std::mutex offer_mutex_;
  std::unordered_map<std::string, std::string> offer_summaries_;
  std::mutex progress_mutex_;
  std::unordered_map<std::string, int> progress_steps_;
};
