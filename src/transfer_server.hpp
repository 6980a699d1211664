#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "offer_broker.hpp"
#include "protocol.hpp"
#include "transfer_events.hpp"

struct TransferServerOptions {
  std::string listen_ip = "0.0.0.0";
  uint16_t port = kTransferPort;          // 0 picks a free port
  std::chrono::seconds offer_timeout{0};  // 0 waits for the user forever
  std::size_t chunk_size = kTransferChunkSize;
  // Directory accepted files are written to; an empty result aborts the batch.
  std::function<std::optional<std::filesystem::path>()> download_dir;
};

// Inbound side of the transfer channel. Every accepted connection runs on its
// own strand: header, offer, decision byte, then the file bodies. Must be
// owned by a std::shared_ptr.
class TransferServer : public std::enable_shared_from_this<TransferServer> {
public:
  TransferServer(asio::io_context& io,
                 std::shared_ptr<OfferBroker> broker,
                 TransferServerOptions options,
                 TransferCallbacks callbacks,
                 std::shared_ptr<Logger> logger = nullptr);
  ~TransferServer();

  // Binds and starts accepting. Throws std::system_error when the port is
  // unavailable.
  void start();
  // Closes the listener and aborts every open connection. A batch already
  // offered finishes with asio::error::operation_aborted.
  void stop();

  uint16_t port() const { return port_; }

  struct Shared;

private:
  void do_accept();

  asio::io_context& io_;
  asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<Shared> shared_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> running_{false};
  uint16_t port_ = 0;
};
