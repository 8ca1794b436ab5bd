#ifndef VAULT_UTILS_ENCODING_HPP
#define VAULT_UTILS_ENCODING_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vault::utils {

// Lowercase hexadecimal rendering of raw bytes
std::string to_hex(const std::vector<uint8_t>& bytes);

// Hex string of `byte_count` bytes drawn from OpenSSL RAND_bytes.
// Throws std::runtime_error if the random source fails.
std::string random_hex(std::size_t byte_count);

// Percent-encodes one URL path segment, keeping RFC 3986 unreserved characters
std::string percent_encode(const std::string& segment);

} // namespace vault::utils

#endif // VAULT_UTILS_ENCODING_HPP
