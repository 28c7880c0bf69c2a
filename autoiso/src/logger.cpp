#include "autoiso/logger.hpp"

#include <utility>  // for move

#include <spdlog/sinks/callback_sink.h>

namespace autoiso::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto make_noop_logger() noexcept -> std::shared_ptr<spdlog::logger> {
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    return std::make_shared<spdlog::logger>("default", std::move(callback_sink));
}

}  // namespace autoiso::logger
