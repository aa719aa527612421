#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "vault/chunk_vault.hpp"

namespace chunkvault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(vault::ChunkVault& vault, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();

private:
    // ---- PARAMETERS ----
    vault::ChunkVault& vault_;
    std::istream& input_;
    std::ostream& output_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_put_command(const std::vector<std::string>& args);
    void handle_get_command(const std::vector<std::string>& args);
    void handle_cat_command(const std::vector<std::string>& args);
    void handle_list_command();
    void handle_remove_command(const std::vector<std::string>& args);
    void handle_purge_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);

    // Accepts a file id or the name of a stored file
    std::string find_file_id(const std::string& name_or_id) const;
    // Optional [start] [length] arguments from position first on
    core::RangeRequest parse_range(const std::vector<std::string>& args, std::size_t first) const;
};

} // namespace cli
} // namespace chunkvault
