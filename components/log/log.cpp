#include "log.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

log_t::log_t(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

log_t log_t::clone() const noexcept { return log_t(logger_); }

bool log_t::is_valid() const noexcept { return static_cast<bool>(logger_); }

void log_t::set_level(level lvl) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(lvl));
    }
}

log_t::level log_t::current_level() const {
    if (!logger_) {
        return level::off;
    }
    return static_cast<level>(logger_->level());
}

void log_t::flush() {
    if (logger_) {
        logger_->flush();
    }
}

namespace {
    std::mutex registration_mutex;
} // namespace

log_t initialization_logger(std::string_view name, std::string_view path) {
    std::lock_guard lock(registration_mutex);
    std::string logger_name(name);
    if (auto existing = spdlog::get(logger_name); existing) {
        return log_t(existing);
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(spdlog::level::warn);
    sinks.push_back(console);

    if (!path.empty()) {
        std::filesystem::path log_dir(path);
        std::filesystem::create_directories(log_dir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>((log_dir / (logger_name + ".log")).string(),
                                                                        true);
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
    logger->flush_on(spdlog::level::err);
    spdlog::register_logger(logger);
    return log_t(logger);
}

log_t get_logger(std::string_view name) { return log_t(spdlog::get(std::string(name))); }
