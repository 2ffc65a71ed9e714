#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <components/log/log.hpp>

namespace configuration {

    struct config_log final {
        log_t::level level = log_t::level::info;
        std::filesystem::path path;
        std::string name = "termstore";
    };

    struct config_registry final {
        std::chrono::milliseconds default_accept_timeout{5000};
    };

    struct config final {
        static config default_config();
        static config create_config(const std::filesystem::path& path);

        std::filesystem::path main_path;
        config_log log;
        config_registry registry;

    private:
        config() = default;
    };

} // namespace configuration
