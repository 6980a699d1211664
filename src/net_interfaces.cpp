#include "net_interfaces.hpp"
#include "log.hpp"
#include "protocol.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

namespace {

using IfAddrsPtr = std::unique_ptr<ifaddrs, decltype(&freeifaddrs)>;

IfAddrsPtr query_interfaces(){
  ifaddrs* head = nullptr;
  if(getifaddrs(&head) != 0){
    log_warn(nullptr, "getifaddrs failed: {}", std::strerror(errno));
    return IfAddrsPtr(nullptr, &freeifaddrs);
  }
  return IfAddrsPtr(head, &freeifaddrs);
}

asio::ip::address_v4 to_address_v4(const sockaddr* sa){
  const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
  return asio::ip::address_v4(ntohl(in->sin_addr.s_addr));
}

asio::ip::address_v6 to_address_v6(const sockaddr* sa){
  const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
  asio::ip::address_v6::bytes_type bytes;
  std::memcpy(bytes.data(), in6->sin6_addr.s6_addr, bytes.size());
  return asio::ip::address_v6(bytes, in6->sin6_scope_id);
}

bool has_broadcast(const ifaddrs* ifa){
  return ifa->ifa_addr && ifa->ifa_addr->sa_family == AF_INET &&
         (ifa->ifa_flags & IFF_BROADCAST) && ifa->ifa_broadaddr &&
         ifa->ifa_broadaddr->sa_family == AF_INET;
}

} // namespace

std::vector<NetworkInterfaceInfo> list_network_interfaces(){
  std::vector<NetworkInterfaceInfo> out;
  auto ifaces = query_interfaces();
  for(const ifaddrs* ifa = ifaces.get(); ifa != nullptr; ifa = ifa->ifa_next){
    if(!has_broadcast(ifa)) continue;
    if(std::strcmp(ifa->ifa_name, "lo") == 0) continue;
    NetworkInterfaceInfo info;
    info.name = ifa->ifa_name;
    info.ip = to_address_v4(ifa->ifa_addr).to_string();
    info.broadcast = to_address_v4(ifa->ifa_broadaddr).to_string();
    out.push_back(std::move(info));
  }
  out.push_back({"All", kAllInterfacesBroadcast, kAllInterfacesBroadcast});
  return out;
}

std::vector<asio::ip::address_v4> broadcast_addresses(){
  std::vector<asio::ip::address_v4> out;
  auto ifaces = query_interfaces();
  for(const ifaddrs* ifa = ifaces.get(); ifa != nullptr; ifa = ifa->ifa_next){
    if(!has_broadcast(ifa)) continue;
    auto addr = to_address_v4(ifa->ifa_broadaddr);
    if(std::find(out.begin(), out.end(), addr) == out.end()) out.push_back(addr);
  }
  return out;
}

std::vector<asio::ip::address> local_addresses(){
  std::vector<asio::ip::address> out;
  auto ifaces = query_interfaces();
  for(const ifaddrs* ifa = ifaces.get(); ifa != nullptr; ifa = ifa->ifa_next){
    if(!ifa->ifa_addr) continue;
    switch(ifa->ifa_addr->sa_family){
      case AF_INET:
        out.emplace_back(to_address_v4(ifa->ifa_addr));
        break;
      case AF_INET6:
        out.emplace_back(to_address_v6(ifa->ifa_addr));
        break;
      default:
        break;
    }
  }
  return out;
}

std::optional<std::string> own_address(asio::io_context& io){
  asio::ip::udp::socket socket(io);
  std::error_code ec;
  socket.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("8.8.8.8"), 80), ec);
  if(ec){
    log_debug(nullptr, "Unable to determine own address: {}", ec.message());
    return std::nullopt;
  }
  auto local = socket.local_endpoint(ec);
  if(ec){
    log_debug(nullptr, "Unable to read local endpoint: {}", ec.message());
    return std::nullopt;
  }
  return local.address().to_string();
}
