#pragma once
#include "protocol.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

enum class TransferDirection { Outgoing, Incoming };

struct IncomingOffer {
  std::string id;
  std::string from;            // sender IP
  std::vector<FileMetadata> files;
  uint64_t total_size = 0;
};

// Events name the file being moved the same way in both directions: by its
// file name, plus the local path (source when sending, destination when
// receiving).
struct TransferProgress {
  TransferDirection direction = TransferDirection::Outgoing;
  std::string file_name;
  std::filesystem::path file_path;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  double progress = 0.0;       // percent, 0-100
};

struct TransferComplete {
  TransferDirection direction = TransferDirection::Outgoing;
  std::string file_name;
  std::filesystem::path file_path;
  std::optional<std::filesystem::path> saved_path;
};

// Any member may be empty. Callbacks run on I/O threads and must not block.
struct TransferCallbacks {
  std::function<void(const IncomingOffer&)> on_offer;
  std::function<void(const TransferProgress&)> on_progress;
  std::function<void(const TransferComplete&)> on_complete;
  // Once per offered inbound batch: success, rejection, or the failure.
  std::function<void(const std::string& offer_id, const std::error_code&)> on_incoming_finished;
};
