#include "storage/naming.hpp"
#include "storage/storage_error.hpp"
#include "utils/encoding.hpp"
#include "utils/time_format.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace vault::storage {

//==============================================
// CONSTRUCTOR
//==============================================

NameGenerator::NameGenerator()
  : clock_([] { return std::chrono::system_clock::now(); }) {}

NameGenerator::NameGenerator(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("NameGenerator: Clock must be callable");
  }
}


//==============================================
// GENERATION
//==============================================

std::string NameGenerator::generate(const std::string& original_name) const {
  std::string name = base_name(original_name);
  if (name.empty() || name == "." || name == ".." || name.find('\0') != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "NameGenerator: Rejected original name: " << original_name;
    throw InvalidArgumentError("Invalid file name");
  }
  if (name.size() > MAX_ORIGINAL_NAME_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "NameGenerator: Original name too long (" << name.size() << " bytes)";
    throw InvalidArgumentError("File name too long");
  }

  std::string disambiguator;
  try {
    disambiguator = utils::random_hex(DISAMBIGUATOR_BYTES);
  } catch (const std::runtime_error&) {
    throw FaultError("Failed to generate file name");
  }

  std::string stored = utils::format_path_timestamp(clock_()) + NAME_SEPARATOR +
                       disambiguator + NAME_SEPARATOR + name;
  BOOST_LOG_TRIVIAL(debug) << "NameGenerator: Generated " << stored << " for " << original_name;
  return stored;
}


//==============================================
// PARSING
//==============================================

std::string base_name(const std::string& original_name) {
  std::size_t last_sep = original_name.find_last_of("/\\");
  if (last_sep == std::string::npos) {
    return original_name;
  }
  return original_name.substr(last_sep + 1);
}

std::string parse_original_name(const std::string& stored_name) {
  std::size_t first = stored_name.find(NAME_SEPARATOR);
  if (first == std::string::npos) {
    return stored_name;
  }
  std::size_t second = stored_name.find(NAME_SEPARATOR, first + 1);
  if (second == std::string::npos) {
    return stored_name;
  }
  // Everything after the second separator, separators included
  return stored_name.substr(second + 1);
}

bool is_generated_name(const std::string& stored_name) {
  std::size_t first = stored_name.find(NAME_SEPARATOR);
  if (first == std::string::npos) {
    return false;
  }
  std::size_t second = stored_name.find(NAME_SEPARATOR, first + 1);
  if (second == std::string::npos || second + 1 >= stored_name.size()) {
    return false;
  }

  // YYYY-MM-DDTHH-MM-SS-mmmZ
  const std::string timestamp = stored_name.substr(0, first);
  if (timestamp.size() != 24 || timestamp[10] != 'T' || timestamp.back() != 'Z') {
    return false;
  }

  const std::string disambiguator = stored_name.substr(first + 1, second - first - 1);
  return disambiguator.size() == DISAMBIGUATOR_BYTES * 2 &&
         std::all_of(disambiguator.begin(), disambiguator.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace vault::storage
