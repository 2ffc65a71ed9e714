#include "base_spaces.hpp"

namespace termstore {

    base_termstore_t::base_termstore_t(const configuration::config& config)
        : main_path_(config.main_path)
        , resource_()
        , registry_(nullptr, core::pmr::deleter_t(&resource_)) {
        log_ = initialization_logger(config.log.name, config.log.path.string());
        log_.set_level(config.log.level);
        trace(log_, "spaces::spaces()");
        {
            std::lock_guard lock(m_);
            if (paths_.find(main_path_) == paths_.end()) {
                paths_.insert(main_path_);
            } else {
                throw std::runtime_error("termstore instance has to have unique directory");
            }
        }

        trace(log_, "spaces::table_registry start");
        registry_ = core::pmr::make_unique<services::registry::table_registry_t>(&resource_, config.registry, log_);
        trace(log_, "spaces::table_registry finish");
        trace(log_, "spaces::spaces() final");
    }

    log_t& base_termstore_t::get_log() { return log_; }

    services::registry::table_registry_t* base_termstore_t::registry() { return registry_.get(); }

    std::pmr::memory_resource* base_termstore_t::resource() noexcept { return &resource_; }

    base_termstore_t::~base_termstore_t() {
        trace(log_, "delete spaces");
        registry_.reset();
        log_.flush();
        std::lock_guard lock(m_);
        paths_.erase(main_path_);
    }

} // namespace termstore
