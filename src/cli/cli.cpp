#include "cli/cli.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace vault {
namespace cli {

namespace {

std::int64_t parse_id(const std::string& value) {
  std::size_t consumed = 0;
  long long id = std::stoll(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("trailing characters");
  }
  return static_cast<std::int64_t>(id);
}

// Non-UTF-8 bytes in file names are shown as U+FFFD instead of aborting
template <typename T>
std::string render(const T& value) {
  return nlohmann::json(value).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string join(const std::vector<std::string>& parts, std::size_t from) {
  std::string joined;
  for (std::size_t i = from; i < parts.size(); ++i) {
    if (!joined.empty()) joined += ' ';
    joined += parts[i];
  }
  return joined;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(storage::StorageEngine& engine, keys::ClientKeyRegistry& registry,
         std::istream& in, std::ostream& out)
  : running_(false)
  , engine_(engine)
  , registry_(registry)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "vault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "vault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help") {
      handle_help_command();
    }
    else if (command == "upload") {
      handle_upload_command(args);
    }
    else if (command == "ls") {
      if (expect_args(args, 1, "ls <client>")) {
        out_ << render(engine_.list(args[0])) << std::endl;
      }
    }
    else if (command == "info") {
      if (expect_args(args, 2, "info <client> <ref>")) {
        out_ << render(engine_.info(args[0], args[1])) << std::endl;
      }
    }
    else if (command == "get") {
      handle_get_command(args);
    }
    else if (command == "rm") {
      if (expect_args(args, 2, "rm <client> <ref>")) {
        engine_.remove(args[0], args[1]);
        out_ << "File deleted successfully" << std::endl;
      }
    }
    else if (command == "stats") {
      if (expect_args(args, 1, "stats <client>")) {
        out_ << render(engine_.statistics(args[0])) << std::endl;
      }
    }
    else if (command.rfind("key-", 0) == 0) {
      handle_key_command(command, args);
    }
    else {
      out_ << "Unknown command or invalid arguments" << std::endl;
    }
  } catch (const storage::StorageError& e) {
    log_and_display_error(std::string("error: ") + storage::error_kind_to_string(e.kind()), e.what());
  } catch (const nlohmann::json::exception& e) {
    log_and_display_error("error: Failed to render result", e.what());
  }
}

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 2, "upload <client> <local-file> [owner]")) {
    return;
  }

  std::ifstream file(args[1], std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << args[1] << std::endl;
    return;
  }

  std::optional<std::string> owner;
  if (args.size() > 2) {
    owner = args[2];
  }
  auto record = engine_.save(args[0], args[1], file, "", owner);
  out_ << render(record) << std::endl;
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 3, "get <client> <ref> <local-dest>")) {
    return;
  }

  // Resolve first so a bad reference leaves the destination untouched
  engine_.fetch_path(args[0], args[1]);

  std::ofstream file(args[2], std::ios::binary | std::ios::trunc);
  if (!file) {
    out_ << "Error opening file: " << args[2] << std::endl;
    return;
  }

  auto bytes = engine_.read(args[0], args[1], file);
  out_ << "Wrote " << bytes << " bytes to " << args[2] << std::endl;
}

void CLI::handle_key_command(const std::string& command, const std::vector<std::string>& args) {
  if (command == "key-create") {
    if (!expect_args(args, 1, "key-create <name> [note...]")) {
      return;
    }
    std::optional<std::string> note;
    if (args.size() > 1) {
      note = join(args, 1);
    }
    out_ << render(registry_.create(args[0], note)) << std::endl;
    return;
  }
  if (command == "key-list") {
    out_ << render(registry_.find_all()) << std::endl;
    return;
  }

  if (!expect_args(args, 1, "key-rotate|key-revoke|key-delete <id>")) {
    return;
  }

  std::int64_t id = 0;
  try {
    id = parse_id(args[0]);
  } catch (const std::exception&) {
    out_ << "Invalid key id: " << args[0] << std::endl;
    return;
  }

  std::optional<keys::ClientKeyRecord> record;
  if (command == "key-rotate") {
    record = registry_.rotate(id);
  } else if (command == "key-revoke") {
    record = registry_.revoke(id);
  } else if (command == "key-delete") {
    out_ << (registry_.remove(id) ? "Client key deleted" : "Client key not found") << std::endl;
    return;
  } else {
    out_ << "Unknown command or invalid arguments" << std::endl;
    return;
  }

  if (record) {
    out_ << render(*record) << std::endl;
  } else {
    out_ << "Client key not found" << std::endl;
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                               Display this help message" << std::endl;
  out_ << "  upload <client> <file> [owner]     Store local <file> for <client>" << std::endl;
  out_ << "  ls <client>                        List stored files" << std::endl;
  out_ << "  info <client> <ref>                Show metadata of a stored file" << std::endl;
  out_ << "  get <client> <ref> <dest>          Copy a stored file to <dest>" << std::endl;
  out_ << "  rm <client> <ref>                  Delete a stored file" << std::endl;
  out_ << "  stats <client>                     Show storage statistics" << std::endl;
  out_ << "  key-create <name> [note]           Issue a client key" << std::endl;
  out_ << "  key-list                           List client keys" << std::endl;
  out_ << "  key-rotate <id>                    Replace a client key" << std::endl;
  out_ << "  key-revoke <id>                    Deactivate a client key" << std::endl;
  out_ << "  key-delete <id>                    Remove a client key" << std::endl;
  out_ << "  quit                               Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

bool CLI::expect_args(const std::vector<std::string>& args, std::size_t min, const char* usage) {
  if (args.size() < min) {
    out_ << "Usage: " << usage << std::endl;
    return false;
  }
  return true;
}

} // namespace cli
} // namespace vault
