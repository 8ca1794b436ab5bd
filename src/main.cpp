#include "cli/cli.hpp"
#include "config/config.hpp"
#include "keys/client_key_registry.hpp"
#include "logger/logger.hpp"
#include "storage/storage_engine.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  vault::config::AppConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-r <root>] [-k <keys-file>] [-l <log-file>] [-v <level>]\n"
        << "Optional arguments (override the environment):\n"
        << "  -r, --root     Storage root directory (STORAGE_ROOT)\n"
        << "  -k, --keys     Client key store file (CLIENT_KEYS_FILE)\n"
        << "  -l, --log      Log file, '-' for the console (LOG_FILE)\n"
        << "  -v, --level    Log level: trace, debug, info, warning, error, fatal (LOG_LEVEL)\n"
        << "Example: " << program_name << " -r ./storage-data -v debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-r", "--root", "-k", "--keys", "-l", "--log", "-v", "--level"
  };

  ProgramOptions options;
  try {
    options.config = vault::config::from_environment();
  } catch (const vault::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return options;
  }

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-r" || flag == "--root") {
      options.config.storage_root = value;
    } else if (flag == "-k" || flag == "--keys") {
      options.config.keys_file = value;
    } else if (flag == "-l" || flag == "--log") {
      options.config.log_file = value;
    } else if (flag == "-v" || flag == "--level") {
      auto level = vault::logging::parse_log_level(value);
      if (!level) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.config.log_level = *level;
    }
  }

  if (options.config.storage_root.empty()) {
    std::cerr << "Error: Storage root must not be empty\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const vault::config::AppConfig& config) {
  try {
    vault::logging::init_log_target(config.log_file);
    vault::logging::set_log_level(config.log_level);

    auto registry = std::make_shared<vault::keys::ClientKeyRegistry>(config.effective_keys_file());
    vault::storage::StorageEngine engine(config.storage_config(), registry);
    vault::cli::CLI cli(engine, *registry);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start vault: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options.config)) {
    return 1;
  }
  return 0;
}
