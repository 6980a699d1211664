#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Hex string of `bytes` cryptographically random bytes (OpenSSL RAND_bytes).
// Throws std::runtime_error if the generator is not seeded.
std::string random_hex_id(std::size_t bytes = 16);

// Host name of this machine, or "Unknown" when it cannot be read.
std::string local_hostname();

// Completion percentage in [0, 100]; an empty total counts as complete.
double percent_of(uint64_t done, uint64_t total);

std::string format_bytes(uint64_t bytes);
