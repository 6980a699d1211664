#include "protocol.hpp"

#include <numeric>
#include <stdexcept>
#include <type_traits>

namespace {

constexpr const char* kPresenceTag = "Presence";

template<typename>
inline constexpr bool always_false_v = false;

} // namespace

std::string encode_discovery_message(const DiscoveryMessage& message){
  json j = std::visit([](const auto& m) -> json {
    using T = std::decay_t<decltype(m)>;
    if constexpr(std::is_same_v<T, PresenceMessage>) {
      return json{{kPresenceTag, m.username}};
    } else {
      static_assert(always_false_v<T>, "unhandled discovery message");
    }
  }, message);
  return j.dump();
}

std::optional<DiscoveryMessage> decode_discovery_message(const char* data, std::size_t size){
  auto j = json::parse(data, data + size, nullptr, false);
  if(j.is_discarded() || !j.is_object() || j.size() != 1) return std::nullopt;

  auto it = j.find(kPresenceTag);
  if(it != j.end() && it->is_string()) {
    return DiscoveryMessage{PresenceMessage{it->get<std::string>()}};
  }
  return std::nullopt;
}

void to_json(json& j, const FileMetadata& meta){
  j = json{{"name", meta.name}, {"size", meta.size}};
}

void from_json(const json& j, FileMetadata& meta){
  j.at("name").get_to(meta.name);
  const auto& size = j.at("size");
  if(!size.is_number_unsigned()) {
    throw std::invalid_argument("file size must be an unsigned integer");
  }
  meta.size = size.get<uint64_t>();
}

std::string encode_metadata(const std::vector<FileMetadata>& files){
  json arr = files;
  return arr.dump();
}

std::vector<FileMetadata> decode_metadata(const std::string& body){
  auto j = json::parse(body);
  if(!j.is_array()) {
    throw std::invalid_argument("file metadata must be a JSON array");
  }
  return j.get<std::vector<FileMetadata>>();
}

LengthPrefix encode_length_prefix(uint64_t length){
  LengthPrefix out{};
  for(std::size_t i = 0; i < out.size(); ++i) {
    out[out.size() - 1 - i] = static_cast<uint8_t>(length >> (8 * i));
  }
  return out;
}

uint64_t decode_length_prefix(const LengthPrefix& prefix){
  uint64_t value = 0;
  for(auto b : prefix) {
    value = (value << 8) | b;
  }
  return value;
}

uint64_t total_size(const std::vector<FileMetadata>& files){
  return std::accumulate(files.begin(), files.end(), uint64_t{0},
    [](uint64_t acc, const FileMetadata& f){ return acc + f.size; });
}

bool is_plain_file_name(const std::string& name){
  if(name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos &&
         name.find('\\') == std::string::npos &&
         name.find('\0') == std::string::npos;
}
