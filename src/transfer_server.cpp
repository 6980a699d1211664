#include "transfer_server.hpp"
#include "transfer_error.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <vector>

namespace {
class IncomingTransfer;
}

struct TransferServer::Shared {
  std::shared_ptr<OfferBroker> broker;
  TransferServerOptions options;
  TransferCallbacks callbacks;
  std::shared_ptr<Logger> logger;

  std::mutex connections_mutex;
  std::vector<std::weak_ptr<IncomingTransfer>> connections;
};

namespace {

std::error_code last_file_error(){
  if(errno != 0) return {errno, std::generic_category()};
  return std::make_error_code(std::errc::io_error);
}

bool is_disconnect(const std::error_code& ec){
  return ec == asio::error::eof ||
         ec == asio::error::connection_reset ||
         ec == asio::error::broken_pipe;
}

class IncomingTransfer : public std::enable_shared_from_this<IncomingTransfer> {
public:
  IncomingTransfer(asio::ip::tcp::socket socket,
                   std::shared_ptr<const TransferServer::Shared> shared)
    : socket_(std::move(socket)),
      timer_(socket_.get_executor()),
      shared_(std::move(shared)) {}

  void start(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){
      std::error_code ec;
      auto remote = socket_.remote_endpoint(ec);
      remote_ = ec ? std::string("unknown") : remote.address().to_string();
      read_prefix();
    });
  }

  // Safe from any thread.
  void abort(){
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self](){
      if(id_.empty() || finished_){
        close();
        return;
      }
      shared_->broker->resolve(id_, false);
      finish(asio::error::operation_aborted);
    });
  }

private:
  Logger* logger() const { return shared_->logger.get(); }

  void read_prefix(){
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(prefix_),
      [this, self](std::error_code ec, std::size_t){
        if(ec){
          log_warn(logger(), "Failed to read batch header from {}: {}", remote_, ec.message());
          close();
          return;
        }
        auto length = decode_length_prefix(prefix_);
        if(length > kMaxMetadataLength){
          std::error_code invalid = transfer_error::invalid_metadata;
          log_warn(logger(), "Batch header from {} too large ({} bytes): {}", remote_, length, invalid.message());
          close();
          return;
        }
        metadata_.resize(static_cast<std::size_t>(length));
        read_metadata();
      });
  }

  void read_metadata(){
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(metadata_),
      [this, self](std::error_code ec, std::size_t){
        if(ec){
          log_warn(logger(), "Failed to read batch header from {}: {}", remote_, ec.message());
          close();
          return;
        }
        try {
          files_ = decode_metadata(metadata_);
        } catch(const std::exception& e){
          log_warn(logger(), "Invalid batch header from {}: {}", remote_, e.what());
          close();
          return;
        }
        metadata_.clear();
        for(const auto& file : files_){
          if(!is_plain_file_name(file.name)){
            log_warn(logger(), "Refusing batch from {}: invalid file name '{}'", remote_, file.name);
            close();
            return;
          }
        }
        register_offer();
      });
  }

  void register_offer(){
    auto offer = shared_->broker->create_offer();
    if(!offer){
      std::error_code ec = transfer_error::offer_limit_reached;
      log_warn(logger(), "Refusing batch from {}: {} ({} offers already pending)",
               remote_, ec.message(), shared_->broker->pending_count());
      send_refusal();
      return;
    }
    id_ = offer->id;

    IncomingOffer event;
    event.id = id_;
    event.from = remote_;
    event.files = files_;
    event.total_size = total_size(files_);
    log_info(logger(), "Offer {} from {}: {} file(s), {}",
             id_, remote_, files_.size(), format_bytes(event.total_size));
    if(shared_->callbacks.on_offer) shared_->callbacks.on_offer(event);

    auto self = shared_from_this();
    const auto timeout = shared_->options.offer_timeout;
    if(timeout.count() > 0){
      timer_.expires_after(timeout);
      timer_.async_wait([this, self](std::error_code ec){
        if(ec) return;
        if(shared_->broker->resolve(id_, false) == ResolveResult::Resolved){
          log_info(logger(), "Offer {} timed out", id_);
        }
      });
    }

    offer->decision->async_wait([self](bool accepted){
      asio::post(self->socket_.get_executor(), [self, accepted](){
        self->on_decision(accepted);
      });
    });
    watch_sender();
  }

  // The sender stays silent until it has the answer byte, so anything
  // readable before the decision is a disconnect or a protocol violation.
  void watch_sender(){
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(&stray_, 1),
      [this, self](std::error_code ec, std::size_t){
        if(decided_ || finished_) return;
        if(ec){
          log_info(logger(), "Sender of offer {} ({}) went away: {}", id_, remote_, ec.message());
        } else {
          log_warn(logger(), "Sender of offer {} ({}) sent data before the answer", id_, remote_);
        }
        shared_->broker->resolve(id_, false);
        finish(asio::error::connection_aborted);
      });
  }

  void send_refusal(){
    auto self = shared_from_this();
    answer_ = kOfferRejected;
    asio::async_write(socket_, asio::buffer(&answer_, 1),
      [this, self](std::error_code, std::size_t){
        close();
      });
  }

  void on_decision(bool accepted){
    if(finished_) return;
    decided_ = true;
    std::error_code ignored;
    timer_.cancel();
    socket_.cancel(ignored);
    answer_ = accepted ? kOfferAccepted : kOfferRejected;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(&answer_, 1),
      [this, self, accepted](std::error_code ec, std::size_t){
        if(ec){
          finish(is_disconnect(ec) ? make_error_code(asio::error::connection_aborted) : ec);
          return;
        }
        if(!accepted){
          log_info(logger(), "Offer {} from {} rejected", id_, remote_);
          finish(transfer_error::rejected);
          return;
        }
        begin_receive();
      });
  }

  void begin_receive(){
    std::optional<std::filesystem::path> dir;
    if(shared_->options.download_dir) dir = shared_->options.download_dir();
    std::error_code ec;
    if(!dir || !std::filesystem::is_directory(*dir, ec)){
      finish(transfer_error::download_dir_unavailable);
      return;
    }
    download_dir_ = *dir;
    buffer_.resize(std::max<std::size_t>(1, shared_->options.chunk_size));
    file_index_ = 0;
    open_next_file();
  }

  void open_next_file(){
    if(file_index_ >= files_.size()){
      log_info(logger(), "Offer {} from {} received ({} file(s))", id_, remote_, files_.size());
      finish({});
      return;
    }
    const auto& meta = files_[file_index_];
    current_path_ = download_dir_ / meta.name;
    errno = 0;
    out_.open(current_path_, std::ios::binary | std::ios::trunc);
    if(!out_){
      auto ec = last_file_error();
      log_error(logger(), "Cannot create {}: {}", current_path_.string(), ec.message());
      finish(ec);
      return;
    }
    received_ = 0;
    if(meta.size == 0){
      complete_file();
    } else {
      read_chunk();
    }
  }

  void read_chunk(){
    const auto& meta = files_[file_index_];
    auto want = static_cast<std::size_t>(
      std::min<uint64_t>(buffer_.size(), meta.size - received_));
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(buffer_.data(), want),
      [this, self](std::error_code ec, std::size_t n){
        const auto& meta = files_[file_index_];
        if(is_disconnect(ec)){
          log_warn(logger(), "Connection aborted while receiving {} ({} of {} bytes)",
                   meta.name, received_, meta.size);
          finish(asio::error::connection_aborted);
          return;
        }
        if(ec){
          finish(ec);
          return;
        }
        errno = 0;
        out_.write(buffer_.data(), static_cast<std::streamsize>(n));
        if(!out_){
          finish(last_file_error());
          return;
        }
        received_ += n;

        if(shared_->callbacks.on_progress){
          TransferProgress progress;
          progress.direction = TransferDirection::Incoming;
          progress.file_name = meta.name;
          progress.file_path = current_path_;
          progress.bytes_done = received_;
          progress.bytes_total = meta.size;
          progress.progress = percent_of(received_, meta.size);
          shared_->callbacks.on_progress(progress);
        }

        if(received_ == meta.size){
          complete_file();
        } else {
          read_chunk();
        }
      });
  }

  void complete_file(){
    const auto& meta = files_[file_index_];
    errno = 0;
    out_.close();
    if(out_.fail()){
      finish(last_file_error());
      return;
    }
    log_debug(logger(), "Received {} -> {}", meta.name, current_path_.string());
    if(shared_->callbacks.on_complete){
      TransferComplete done;
      done.direction = TransferDirection::Incoming;
      done.file_name = meta.name;
      done.file_path = current_path_;
      done.saved_path = current_path_;
      shared_->callbacks.on_complete(done);
    }
    ++file_index_;
    open_next_file();
  }

  void finish(const std::error_code& ec){
    if(finished_) return;
    finished_ = true;
    if(ec && ec != make_error_code(transfer_error::rejected)){
      log_error(logger(), "Error handling batch {} from {}: {}", id_, remote_, ec.message());
    }
    if(out_.is_open()) out_.close();
    if(shared_->callbacks.on_incoming_finished) shared_->callbacks.on_incoming_finished(id_, ec);
    close();
  }

  void close(){
    std::error_code ignored;
    timer_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  std::shared_ptr<const TransferServer::Shared> shared_;
  std::string remote_;

  LengthPrefix prefix_{};
  std::string metadata_;
  std::vector<FileMetadata> files_;
  std::string id_;
  uint8_t answer_ = kOfferRejected;
  uint8_t stray_ = 0;
  bool decided_ = false;

  std::filesystem::path download_dir_;
  std::filesystem::path current_path_;
  std::ofstream out_;
  std::vector<char> buffer_;
  std::size_t file_index_ = 0;
  uint64_t received_ = 0;
  bool finished_ = false;
};

} // namespace

TransferServer::TransferServer(asio::io_context& io,
                               std::shared_ptr<OfferBroker> broker,
                               TransferServerOptions options,
                               TransferCallbacks callbacks,
                               std::shared_ptr<Logger> logger)
  : io_(io),
    acceptor_(asio::make_strand(io)),
    shared_(std::make_shared<Shared>()),
    logger_(std::move(logger)) {
  shared_->broker = std::move(broker);
  shared_->options = std::move(options);
  shared_->callbacks = std::move(callbacks);
  shared_->logger = logger_;
}

TransferServer::~TransferServer(){
  std::error_code ignored;
  acceptor_.close(ignored);
}

void TransferServer::start(){
  if(running_) return;
  using tcp = asio::ip::tcp;
  const auto& options = shared_->options;
  tcp::endpoint endpoint(asio::ip::make_address(options.listen_ip), options.port);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();
  port_ = acceptor_.local_endpoint().port();
  running_ = true;
  log_info(logger_.get(), "Transfer listener on {}:{}", options.listen_ip, port_);
  auto self = shared_from_this();
  asio::dispatch(acceptor_.get_executor(), [this, self](){ do_accept(); });
}

void TransferServer::stop(){
  if(!running_.exchange(false)) return;
  auto self = shared_from_this();
  asio::post(acceptor_.get_executor(), [this, self](){
    std::error_code ignored;
    acceptor_.close(ignored);
  });

  std::vector<std::weak_ptr<IncomingTransfer>> connections;
  {
    std::lock_guard lg(shared_->connections_mutex);
    connections.swap(shared_->connections);
  }
  for(auto& weak : connections){
    if(auto connection = weak.lock()) connection->abort();
  }
}

void TransferServer::do_accept(){
  auto self = shared_from_this();
  acceptor_.async_accept(asio::make_strand(io_),
    [this, self](std::error_code ec, asio::ip::tcp::socket socket){
      if(ec == asio::error::operation_aborted || !running_) return;
      if(ec){
        log_error(logger_.get(), "Accept error: {}", ec.message());
      } else {
        std::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        log_info(logger_.get(), "Accepted connection from {}",
                 remote_ec ? std::string("unknown") : remote.address().to_string());
        auto connection = std::make_shared<IncomingTransfer>(std::move(socket), shared_);
        {
          std::lock_guard lg(shared_->connections_mutex);
          auto& list = shared_->connections;
          list.erase(std::remove_if(list.begin(), list.end(),
                                    [](const auto& weak){ return weak.expired(); }),
                     list.end());
          list.push_back(connection);
        }
        connection->start();
        if(!running_) connection->abort();
      }
      do_accept();
    });
}
