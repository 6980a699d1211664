#include "transfer_client.hpp"
#include "transfer_error.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <mutex>

namespace {
class OutgoingTransfer;
}

struct TransferClient::Active {
  std::mutex mutex;
  std::vector<std::weak_ptr<OutgoingTransfer>> transfers;
};

namespace {

class OutgoingTransfer : public std::enable_shared_from_this<OutgoingTransfer> {
public:
  OutgoingTransfer(asio::io_context& io,
                   std::string host,
                   uint16_t port,
                   std::vector<std::filesystem::path> paths,
                   std::vector<FileMetadata> files,
                   const TransferCallbacks& callbacks,
                   std::shared_ptr<Logger> logger,
                   std::size_t chunk_size,
                   TransferClient::CompletionHandler handler)
    : socket_(asio::make_strand(io)),
      resolver_(socket_.get_executor()),
      host_(std::move(host)),
      port_(port),
      paths_(std::move(paths)),
      files_(std::move(files)),
      callbacks_(callbacks),
      logger_(std::move(logger)),
      handler_(std::move(handler)) {
    buffer_.resize(std::max<std::size_t>(1, chunk_size));
  }

  void start(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){ resolve(); });
  }

  void abort(){
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self](){
      resolver_.cancel();
      finish(asio::error::operation_aborted);
    });
  }

private:
  void resolve(){
    auto self = shared_from_this();
    resolver_.async_resolve(host_, std::to_string(port_),
      [this, self](std::error_code ec, asio::ip::tcp::resolver::results_type results){
        if(ec){
          log_warn(logger_.get(), "Resolve failed for {}:{}  {}", host_, port_, ec.message());
          finish(ec);
          return;
        }
        asio::async_connect(socket_, results,
          [this, self](std::error_code ec, const asio::ip::tcp::endpoint& ep){
            if(ec){
              log_warn(logger_.get(), "Connect to {}:{} failed: {}", host_, port_, ec.message());
              finish(ec);
              return;
            }
            log_info(logger_.get(), "Connected to {}:{}", ep.address().to_string(), ep.port());
            write_header();
          });
      });
  }

  void write_header(){
    header_ = encode_metadata(files_);
    prefix_ = encode_length_prefix(header_.size());
    std::array<asio::const_buffer, 2> buffers{asio::buffer(prefix_), asio::buffer(header_)};
    auto self = shared_from_this();
    asio::async_write(socket_, buffers,
      [this, self](std::error_code ec, std::size_t){
        if(ec){
          finish(ec);
          return;
        }
        log_info(logger_.get(), "Offered {} file(s) ({}) to {}, waiting for answer",
                 files_.size(), format_bytes(total_size(files_)), host_);
        read_answer();
      });
  }

  void read_answer(){
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(&answer_, 1),
      [this, self](std::error_code ec, std::size_t){
        if(ec){
          finish(ec);
          return;
        }
        if(answer_ != kOfferAccepted){
          log_info(logger_.get(), "{} rejected the transfer", host_);
          finish(transfer_error::rejected);
          return;
        }
        index_ = 0;
        open_next_file();
      });
  }

  void open_next_file(){
    if(index_ >= files_.size()){
      log_info(logger_.get(), "Sent {} file(s) to {}", files_.size(), host_);
      finish({});
      return;
    }
    errno = 0;
    in_.open(paths_[index_], std::ios::binary);
    if(!in_){
      std::error_code ec(errno ? errno : EIO, std::generic_category());
      log_error(logger_.get(), "Cannot open {}: {}", paths_[index_].string(), ec.message());
      finish(ec);
      return;
    }
    sent_ = 0;
    if(files_[index_].size == 0){
      complete_file();
    } else {
      send_chunk();
    }
  }

  void send_chunk(){
    const auto& meta = files_[index_];
    auto want = static_cast<std::size_t>(
      std::min<uint64_t>(buffer_.size(), meta.size - sent_));
    in_.read(buffer_.data(), static_cast<std::streamsize>(want));
    if(static_cast<std::size_t>(in_.gcount()) != want){
      log_error(logger_.get(), "{} is shorter than the {} bytes announced",
                paths_[index_].string(), meta.size);
      finish(transfer_error::file_changed);
      return;
    }
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(buffer_.data(), want),
      [this, self](std::error_code ec, std::size_t n){
        if(ec){
          finish(ec);
          return;
        }
        const auto& meta = files_[index_];
        sent_ += n;
        if(callbacks_.on_progress){
          TransferProgress progress;
          progress.direction = TransferDirection::Outgoing;
          progress.file_name = meta.name;
          progress.file_path = paths_[index_];
          progress.bytes_done = sent_;
          progress.bytes_total = meta.size;
          progress.progress = percent_of(sent_, meta.size);
          callbacks_.on_progress(progress);
        }
        if(sent_ == meta.size){
          complete_file();
        } else {
          send_chunk();
        }
      });
  }

  void complete_file(){
    in_.close();
    if(callbacks_.on_complete){
      TransferComplete done;
      done.direction = TransferDirection::Outgoing;
      done.file_name = files_[index_].name;
      done.file_path = paths_[index_];
      callbacks_.on_complete(done);
    }
    ++index_;
    open_next_file();
  }

  void finish(const std::error_code& ec){
    if(finished_) return;
    finished_ = true;
    if(in_.is_open()) in_.close();
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    if(handler_){
      auto handler = std::move(handler_);
      handler(ec);
    }
  }

  asio::ip::tcp::socket socket_;
  asio::ip::tcp::resolver resolver_;
  std::string host_;
  uint16_t port_;
  std::vector<std::filesystem::path> paths_;
  std::vector<FileMetadata> files_;
  TransferCallbacks callbacks_;
  std::shared_ptr<Logger> logger_;
  TransferClient::CompletionHandler handler_;

  std::string header_;
  LengthPrefix prefix_{};
  uint8_t answer_ = kOfferRejected;
  std::ifstream in_;
  std::vector<char> buffer_;
  std::size_t index_ = 0;
  uint64_t sent_ = 0;
  bool finished_ = false;
};

} // namespace

TransferClient::TransferClient(asio::io_context& io,
                               TransferCallbacks callbacks,
                               std::shared_ptr<Logger> logger,
                               std::size_t chunk_size)
  : io_(io),
    active_(std::make_shared<Active>()),
    callbacks_(std::move(callbacks)),
    logger_(std::move(logger)),
    chunk_size_(chunk_size) {}

std::error_code TransferClient::collect_metadata(const std::vector<std::filesystem::path>& paths,
                                                 std::vector<FileMetadata>& out){
  out.clear();
  out.reserve(paths.size());
  for(const auto& path : paths){
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if(status.type() == std::filesystem::file_type::not_found){
      return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if(ec) return ec;
    if(!std::filesystem::is_regular_file(status)) return transfer_error::not_a_file;
    auto name = path.filename().string();
    if(!is_plain_file_name(name)) return transfer_error::invalid_file_name;
    auto size = std::filesystem::file_size(path, ec);
    if(ec) return ec;
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if(!in) return std::error_code(errno ? errno : EACCES, std::generic_category());
    out.push_back(FileMetadata{std::move(name), static_cast<uint64_t>(size)});
  }
  return {};
}

void TransferClient::async_send(const std::string& host,
                                uint16_t port,
                                std::vector<std::filesystem::path> paths,
                                CompletionHandler handler){
  std::vector<FileMetadata> files;
  auto ec = collect_metadata(paths, files);
  if(ec){
    log_warn(logger_.get(), "Not sending to {}: {}", host, ec.message());
    asio::post(io_, [handler = std::move(handler), ec](){
      if(handler) handler(ec);
    });
    return;
  }
  auto transfer = std::make_shared<OutgoingTransfer>(io_, host, port, std::move(paths), std::move(files),
                                                     callbacks_, logger_, chunk_size_, std::move(handler));
  {
    std::lock_guard lg(active_->mutex);
    auto& list = active_->transfers;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [](const auto& weak){ return weak.expired(); }),
               list.end());
    list.push_back(transfer);
  }
  transfer->start();
}

void TransferClient::stop(){
  std::vector<std::weak_ptr<OutgoingTransfer>> transfers;
  {
    std::lock_guard lg(active_->mutex);
    transfers.swap(active_->transfers);
  }
  for(auto& weak : transfers){
    if(auto transfer = weak.lock()) transfer->abort();
  }
}
