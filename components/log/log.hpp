#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

class log_t final {
public:
    enum class level : int
    {
        trace = SPDLOG_LEVEL_TRACE,
        debug = SPDLOG_LEVEL_DEBUG,
        info = SPDLOG_LEVEL_INFO,
        warn = SPDLOG_LEVEL_WARN,
        err = SPDLOG_LEVEL_ERROR,
        critical = SPDLOG_LEVEL_CRITICAL,
        off = SPDLOG_LEVEL_OFF
    };

    log_t() = default;
    explicit log_t(std::shared_ptr<spdlog::logger> logger);

    log_t clone() const noexcept;
    bool is_valid() const noexcept;

    void set_level(level lvl);
    level current_level() const;
    void flush();

    template<class... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<class... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<class... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<class... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<class... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// Creates (or reuses) a named logger writing to stderr and, when path is not empty, to "<path>/<name>.log".
log_t initialization_logger(std::string_view name, std::string_view path);
log_t get_logger(std::string_view name);

template<class... Args>
void trace(log_t& log, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log.trace(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void debug(log_t& log, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log.debug(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void info(log_t& log, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log.info(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void warn(log_t& log, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log.warn(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void error(log_t& log, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log.error(fmt, std::forward<Args>(args)...);
}
