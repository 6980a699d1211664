#pragma once
#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

inline constexpr uint16_t kDiscoveryPort = 5000;
inline constexpr uint16_t kTransferPort = 5001;

inline constexpr std::size_t kTransferChunkSize = 1024 * 1024;
inline constexpr std::size_t kMaxDatagramSize = 65536;
// Upper bound for the JSON header of one batch.
inline constexpr uint64_t kMaxMetadataLength = 16 * 1024 * 1024;

inline constexpr uint8_t kOfferRejected = 0x00;
inline constexpr uint8_t kOfferAccepted = 0x01;

// Broadcast address that selects "announce on every interface" mode.
inline constexpr const char* kAllInterfacesBroadcast = "255.255.255.255";

// ---- discovery channel ----------------------------------------------------

struct PresenceMessage {
  std::string username;
};

// Every datagram on the discovery port carries one of these. Encoded as an
// externally tagged JSON object: {"Presence":"alice"}.
using DiscoveryMessage = std::variant<PresenceMessage>;

std::string encode_discovery_message(const DiscoveryMessage& message);
std::optional<DiscoveryMessage> decode_discovery_message(const char* data, std::size_t size);

// ---- transfer channel -----------------------------------------------------

struct FileMetadata {
  std::string name;
  uint64_t size = 0;
};

void to_json(json& j, const FileMetadata& meta);
void from_json(const json& j, FileMetadata& meta);

std::string encode_metadata(const std::vector<FileMetadata>& files);
// Throws (nlohmann::json::exception or std::invalid_argument) on malformed input.
std::vector<FileMetadata> decode_metadata(const std::string& body);

using LengthPrefix = std::array<uint8_t, 8>;

LengthPrefix encode_length_prefix(uint64_t length);
uint64_t decode_length_prefix(const LengthPrefix& prefix);

uint64_t total_size(const std::vector<FileMetadata>& files);

// A name the receiver can use as-is inside its download directory: one
// path component, not empty, not "." or "..".
bool is_plain_file_name(const std::string& name);
