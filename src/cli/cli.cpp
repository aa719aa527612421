#include "cli/cli.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(vault::ChunkVault& vault, std::istream& input, std::ostream& output)
  : vault_(vault)
  , input_(input)
  , output_(output)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "ChunkVault> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      output_ << "ChunkVault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with "
                           << args.size() << " arguments";

  if (command == "put" && !args.empty()) {
    handle_put_command(args);
  }
  else if (command == "get" && args.size() >= 2) {
    handle_get_command(args);
  }
  else if (command == "cat" && !args.empty()) {
    handle_cat_command(args);
  }
  else if (command == "ls" && args.empty()) {
    handle_list_command();
  }
  else if (command == "rm" && args.size() == 1) {
    handle_remove_command(args);
  }
  else if (command == "purge" && args.empty()) {
    handle_purge_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments, type help for usage" << std::endl;
  }
}

void CLI::handle_put_command(const std::vector<std::string>& args) {
  const std::filesystem::path path(args[0]);
  const std::string name = args.size() > 1 ? args[1] : path.filename().string();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << path.string() << std::endl;
    return;
  }

  try {
    auto size = static_cast<int64_t>(std::filesystem::file_size(path));
    int last_reported = -10;
    auto progress = [this, &last_reported](double percent) {
      int whole = static_cast<int>(percent);
      if (whole / 10 != last_reported / 10) {
        last_reported = whole;
        output_ << "  " << whole << "%" << std::endl;
      }
    };

    std::string id = vault_.put(name, file, size, progress);
    output_ << "Stored " << name << " (" << size << " bytes) as " << id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  try {
    std::string id = find_file_id(args[0]);
    core::RangeRequest request = parse_range(args, 2);

    std::ofstream file(args[1], std::ios::binary | std::ios::trunc);
    if (!file) {
      output_ << "Error creating file: " << args[1] << std::endl;
      return;
    }

    int64_t written = vault_.download(id, request, file);
    output_ << "Wrote " << written << " bytes to " << args[1] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error downloading file", e.what());
  }
}

void CLI::handle_cat_command(const std::vector<std::string>& args) {
  try {
    std::string id = find_file_id(args[0]);
    auto stream = vault_.open_stream(id, parse_range(args, 1));

    std::vector<char> buffer(64 * 1024);
    while (stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
           stream->gcount() > 0) {
      output_.write(buffer.data(), stream->gcount());
    }
    output_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_list_command() {
  auto files = vault_.list();
  if (files.empty()) {
    output_ << "No files stored" << std::endl;
    return;
  }

  for (const auto& file : files) {
    output_ << "  " << std::left << std::setw(18) << file.id << std::setw(32) << file.name
            << std::right << std::setw(16) << file.total_size << "  "
            << (file.chunked ? "chunked" : "single") << std::endl;
  }
}

void CLI::handle_remove_command(const std::vector<std::string>& args) {
  try {
    std::string id = find_file_id(args[0]);
    vault_.remove(id);
    output_ << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_purge_command() {
  try {
    std::size_t purged = vault_.purge();
    output_ << "Purged " << purged << " deleted files" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error purging deleted files", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                               Display this help message" << std::endl;
  output_ << "  ls                                 List stored files" << std::endl;
  output_ << "  put <path> [name]                  Store local file <path>" << std::endl;
  output_ << "  get <file> <path> [start] [length] Download a file or byte range to <path>" << std::endl;
  output_ << "  cat <file> [start] [length]        Print a file or byte range" << std::endl;
  output_ << "  rm <file>                          Mark <file> deleted" << std::endl;
  output_ << "  purge                              Delete objects of deleted files" << std::endl;
  output_ << "  quit                               Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string CLI::find_file_id(const std::string& name_or_id) const {
  std::string match;
  for (const auto& file : vault_.list()) {
    if (file.id == name_or_id) {
      return file.id;
    }
    if (file.name == name_or_id) {
      if (!match.empty()) {
        throw core::MetadataError("several files are named " + name_or_id + ", use an id");
      }
      match = file.id;
    }
  }

  if (match.empty()) {
    throw core::MetadataError("no such file: " + name_or_id);
  }
  return match;
}

core::RangeRequest CLI::parse_range(const std::vector<std::string>& args, std::size_t first) const {
  core::RangeRequest request;
  try {
    if (args.size() > first) {
      request.start = std::stoll(args[first]);
    }
    if (args.size() > first + 1) {
      request.length = std::stoll(args[first + 1]);
    }
  } catch (const std::logic_error&) {
    throw core::ConfigurationError("start and length must be integers");
  }
  return request;
}

} // namespace cli
} // namespace chunkvault
