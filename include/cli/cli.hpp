#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "storage/storage_engine.hpp"
#include "keys/client_key_registry.hpp"

namespace vault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(storage::StorageEngine& engine, keys::ClientKeyRegistry& registry,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Executes one command line; false once the shell should stop
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    storage::StorageEngine& engine_;
    keys::ClientKeyRegistry& registry_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_upload_command(const std::vector<std::string>& args);
    void handle_get_command(const std::vector<std::string>& args);
    void handle_key_command(const std::string& command, const std::vector<std::string>& args);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
    bool expect_args(const std::vector<std::string>& args, std::size_t min, const char* usage);
};

} // namespace cli
} // namespace vault
