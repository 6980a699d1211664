#include "config_manager.hpp"
#include "console.hpp"
#include "landrop_node.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <thread>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "landrop_node_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "peerA", ec);
  fs::create_directories(base / "peerB" / "inbox", ec);

  auto configure = [](const std::shared_ptr<ConfigManager>& config,
                      const std::string& key,
                      const nlohmann::json& value){
    std::string error;
    if(!config->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  auto make_config = [&](const std::string& name, const fs::path& root){
    auto config = std::make_shared<ConfigManager>();
    config->set_config_path(root / ".config" / "settings.json");
    configure(config, "username", name);
    configure(config, "listen_ip", "127.0.0.1");
    configure(config, "discovery_port", 0);
    configure(config, "transfer_port", 0);
    configure(config, "broadcasting_enabled", false);
    configure(config, "download_dir", (root / "inbox").string());
    return config;
  };

  LandropNode node_a(make_config("sample-a", base / "peerA"));
  LandropNode node_b(make_config("sample-b", base / "peerB"));
  Console console_a(node_a);
  Console console_b(node_b);
  node_a.set_events(console_a.events());
  node_b.set_events(console_b.events());

  node_a.start();
  node_a.start_background();
  node_b.start();
  node_b.start_background();

  auto file = base / "peerA" / "hello.txt";
  {
    std::ofstream out(file, std::ios::binary);
    out << "hello from sample-a";
  }

  console_a.execute_command("settings");
  console_a.execute_command("whoami");
  console_a.execute_command("interfaces");
  console_b.execute_command("name sample-b-renamed");
  console_a.execute_command("send 127.0.0.1:" + std::to_string(node_b.transfer_port()) + " " + file.string());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while(node_b.pending_offers().empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  console_b.execute_command("offers");
  for(const auto& id : node_b.pending_offers()) {
    console_b.execute_command("accept " + id);
  }

  auto received = base / "peerB" / "inbox" / "hello.txt";
  std::string content;
  while(std::chrono::steady_clock::now() < deadline) {
    std::ifstream in(received, std::ios::binary);
    if(in) {
      content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
      if(content == "hello from sample-a") break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  bool renamed = node_b.get_settings().username == "sample-b-renamed";
  node_b.stop();
  node_a.stop();

  fs::remove_all(base, ec);
  if(content != "hello from sample-a" || !renamed) {
    std::cerr << "sample transfer failed\n";
    return 1;
  }
  return 0;
}
