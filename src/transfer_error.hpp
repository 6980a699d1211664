#pragma once
#include <system_error>

// Transfer failures that are not plain socket or filesystem errors. A batch
// cut short by the sender is reported as asio::error::connection_aborted.
enum class transfer_error {
  rejected = 1,
  invalid_metadata,
  offer_limit_reached,
  download_dir_unavailable,
  invalid_file_name,
  not_a_file,
  file_changed
};

const std::error_category& transfer_category() noexcept;

std::error_code make_error_code(transfer_error e) noexcept;

namespace std {
template<>
struct is_error_code_enum<transfer_error> : true_type {};
} // namespace std
