#ifndef VAULT_STORAGE_NAMING_HPP
#define VAULT_STORAGE_NAMING_HPP

#include <chrono>
#include <functional>
#include <string>

namespace vault::storage {

// Stored names look like <timestamp>_<disambiguator>_<original name>
constexpr char NAME_SEPARATOR = '_';
constexpr std::size_t DISAMBIGUATOR_BYTES = 4;  // 8 hex characters
// Timestamp (24) + separator + disambiguator + separator
constexpr std::size_t NAME_PREFIX_LENGTH = 24 + 1 + DISAMBIGUATOR_BYTES * 2 + 1;
// Leading '.' and trailing ".part" of the in-flight temp file
constexpr std::size_t TEMP_AFFIX_LENGTH = 6;
// Longest directory entry name most filesystems accept
constexpr std::size_t MAX_ENTRY_NAME_LENGTH = 255;
constexpr std::size_t MAX_ORIGINAL_NAME_LENGTH =
    MAX_ENTRY_NAME_LENGTH - NAME_PREFIX_LENGTH - TEMP_AFFIX_LENGTH;

class NameGenerator {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // ---- CONSTRUCTOR ----
  NameGenerator();
  explicit NameGenerator(Clock clock);


  // ---- GENERATION ----
  // Builds a unique on-disk name that embeds the original file name.
  // Throws InvalidArgumentError when the name is empty, only a directory
  // part or longer than MAX_ORIGINAL_NAME_LENGTH, FaultError when the random
  // source fails.
  std::string generate(const std::string& original_name) const;

private:
  Clock clock_;
};

// Strips any directory component a client may have sent with the name
std::string base_name(const std::string& original_name);

// Recovers the original file name. Names with fewer than three tokens are
// legacy files and come back unchanged.
std::string parse_original_name(const std::string& stored_name);

// True when the first two tokens have the generator's timestamp and
// disambiguator shape
bool is_generated_name(const std::string& stored_name);

} // namespace vault::storage

#endif // VAULT_STORAGE_NAMING_HPP
