#include "transfer_error.hpp"

#include <string>

namespace {

class TransferCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "landrop.transfer"; }

  std::string message(int value) const override {
    switch(static_cast<transfer_error>(value)) {
      case transfer_error::rejected: return "file transfer rejected by recipient";
      case transfer_error::invalid_metadata: return "invalid file metadata";
      case transfer_error::offer_limit_reached: return "too many pending offers";
      case transfer_error::download_dir_unavailable: return "download directory not found";
      case transfer_error::invalid_file_name: return "invalid file name";
      case transfer_error::not_a_file: return "not a regular file";
      case transfer_error::file_changed: return "file changed while being sent";
    }
    return "unknown transfer error";
  }
};

} // namespace

const std::error_category& transfer_category() noexcept {
  static const TransferCategory category;
  return category;
}

std::error_code make_error_code(transfer_error e) noexcept {
  return {static_cast<int>(e), transfer_category()};
}
