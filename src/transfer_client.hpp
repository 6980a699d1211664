#pragma once
#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"
#include "transfer_events.hpp"

class TransferClient {
public:
  using CompletionHandler = std::function<void(const std::error_code&)>;

  TransferClient(asio::io_context& io,
                 TransferCallbacks callbacks,
                 std::shared_ptr<Logger> logger = nullptr,
                 std::size_t chunk_size = kTransferChunkSize);

  // Offers `paths` to host:port and streams them once accepted. The handler
  // runs exactly once, on an I/O thread, with transfer_error::rejected when
  // the recipient declines.
  void async_send(const std::string& host,
                  uint16_t port,
                  std::vector<std::filesystem::path> paths,
                  CompletionHandler handler);

  // Aborts every transfer in flight; their handlers get
  // asio::error::operation_aborted.
  void stop();

  // Name and size of every path, in order. Stops at the first path that is
  // missing, unreadable, not a regular file, or has no file name.
  static std::error_code collect_metadata(const std::vector<std::filesystem::path>& paths,
                                          std::vector<FileMetadata>& out);

  struct Active;

private:
  asio::io_context& io_;
  std::shared_ptr<Active> active_;
  TransferCallbacks callbacks_;
  std::shared_ptr<Logger> logger_;
  std::size_t chunk_size_;
};
