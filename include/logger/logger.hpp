#ifndef CHUNKVAULT_LOGGER_HPP
#define CHUNKVAULT_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace chunkvault::logger {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a synchronous text file sink at log_file,
// truncated on start, and filters out records below min_level
void init_logging(const std::string& log_file = "chunkvault.log",
                  severity_level min_level = boost::log::trivial::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// "trace", "debug", "info", "warning", "error" or "fatal"
std::optional<severity_level> parse_level(const std::string& name);

} // namespace chunkvault::logger

#endif // CHUNKVAULT_LOGGER_HPP
