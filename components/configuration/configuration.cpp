#include "configuration.hpp"

namespace configuration {

    config config::default_config() {
        config cfg;
        cfg.main_path = std::filesystem::current_path();
        cfg.log.path = cfg.main_path / "log";
        return cfg;
    }

    config config::create_config(const std::filesystem::path& path) {
        config cfg;
        cfg.main_path = path;
        cfg.log.path = path / "log";
        return cfg;
    }

} // namespace configuration
