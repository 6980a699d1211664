#pragma once
#include <asio.hpp>

#include <optional>
#include <string>
#include <vector>

struct NetworkInterfaceInfo {
  std::string name;
  std::string ip;
  std::string broadcast;
};

// IPv4 interfaces that have a broadcast address (loopback excluded), followed
// by an "All" entry selecting every interface.
std::vector<NetworkInterfaceInfo> list_network_interfaces();

// Broadcast address of every IPv4 interface that has one.
std::vector<asio::ip::address_v4> broadcast_addresses();

// Every IPv4 and IPv6 address assigned to this machine, loopback included.
std::vector<asio::ip::address> local_addresses();

// Local address the routing table picks for outbound traffic. No packet is
// sent. Empty when there is no route.
std::optional<std::string> own_address(asio::io_context& io);
