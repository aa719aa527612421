#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "metadata/metadata_store.hpp"
#include "remote/http_range_fetcher.hpp"
#include "remote/range_fetcher.hpp"
#include "store/store.hpp"
#include "vault/chunk_vault.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string dir{"chunkvault_store"};
  std::string log_file{"chunkvault.log"};
  std::string log_level{"info"};
  int64_t chunk_size{chunkvault::core::MAX_CHUNK_SIZE};
  int64_t threshold{chunkvault::core::CHUNK_THRESHOLD};
  long timeout_seconds{30 * 60};
  int retries{3};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Options:\n"
            << "  -d, --dir <path>         Object store directory (default chunkvault_store)\n"
            << "  -l, --log <file>         Log file (default chunkvault.log)\n"
            << "      --log-level <level>  trace, debug, info, warning, error or fatal\n"
            << "      --chunk-size <bytes> Maximum chunk size (default 4.5 GiB)\n"
            << "      --threshold <bytes>  Size from which files are chunked (default 5 GiB)\n"
            << "      --timeout <seconds>  Timeout of one remote read (default 1800)\n"
            << "      --retries <count>    Attempts per chunk (default 3)\n"
            << "Example: " << program_name << " --dir /tmp/vault --chunk-size 1048576 --threshold 1048576\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-d", "--dir", "-l", "--log", "--log-level", "--chunk-size",
    "--threshold", "--timeout", "--retries"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-d" || flag == "--dir") {
        options.dir = value;
      } else if (flag == "-l" || flag == "--log") {
        options.log_file = value;
      } else if (flag == "--log-level") {
        options.log_level = value;
      } else if (flag == "--chunk-size") {
        options.chunk_size = std::stoll(value);
      } else if (flag == "--threshold") {
        options.threshold = std::stoll(value);
      } else if (flag == "--timeout") {
        options.timeout_seconds = std::stol(value);
      } else if (flag == "--retries") {
        options.retries = std::stoi(value);
      }
    } catch (const std::logic_error&) {
      std::cerr << "Error: Invalid number for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.chunk_size <= 0 || options.threshold <= 0 || options.timeout_seconds <= 0 ||
      options.retries < 1) {
    std::cerr << "Error: Sizes, timeout and retries must be positive\n";
    print_usage(argv[0]);
    return options;
  }
  if (!chunkvault::logger::parse_level(options.log_level)) {
    std::cerr << "Error: Unknown log level: " << options.log_level << '\n';
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  using namespace chunkvault;

  try {
    logger::init_logging(options.log_file, *logger::parse_level(options.log_level));

    remote::TransportConfig transport;
    transport.timeout = std::chrono::seconds(options.timeout_seconds);

    store::Store store(options.dir);
    metadata::MemoryMetadataStore metadata;

    // file:// locations come from the local store, http(s) from remote backends
    remote::FileRangeFetcher file_fetcher;
    remote::HttpRangeFetcher http_fetcher(transport);
    remote::SchemeRangeFetcher fetcher;
    fetcher.register_scheme("file", file_fetcher);
    fetcher.register_scheme("http", http_fetcher);
    fetcher.register_scheme("https", http_fetcher);

    vault::VaultConfig config;
    config.planner.max_chunk_size = options.chunk_size;
    config.planner.chunk_threshold = options.threshold;
    config.retry.max_attempts = options.retries;

    vault::ChunkVault vault(store, store, fetcher, metadata, config);
    cli::CLI cli(vault);

    std::cout << "ChunkVault store at " << store.base_path().string()
              << ", type help for commands\n";
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
