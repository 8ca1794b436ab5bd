#include "utils/encoding.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace vault::utils {

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

std::string random_hex(std::size_t byte_count) {
  std::vector<uint8_t> bytes(byte_count);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Encoding: RAND_bytes failed for " << byte_count << " bytes";
    throw std::runtime_error("Encoding: Failed to generate random bytes");
  }
  return to_hex(bytes);
}

std::string percent_encode(const std::string& segment) {
  static const char* const HEX_DIGITS = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(segment.size());

  for (unsigned char c : segment) {
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') ||
                      c == '-' || c == '.' || c == '_' || c == '~';
    if (unreserved) {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(HEX_DIGITS[c >> 4]);
      encoded.push_back(HEX_DIGITS[c & 0x0F]);
    }
  }
  return encoded;
}

} // namespace vault::utils
