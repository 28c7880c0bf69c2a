#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace autoiso::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

// Logger which drops every message, used by the unit tests
auto make_noop_logger() noexcept -> std::shared_ptr<spdlog::logger>;

}  // namespace autoiso::logger

#endif  // LOGGER_HPP
