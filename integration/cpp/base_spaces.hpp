#pragma once

#include <components/configuration/configuration.hpp>
#include <components/log/log.hpp>
#include <core/config.hpp>
#include <core/pmr.hpp>
#include <services/registry/registry.hpp>

#include <filesystem>
#include <memory_resource>
#include <mutex>
#include <set>

namespace termstore {

    class base_termstore_t {
    public:
        base_termstore_t(base_termstore_t& other) = delete;
        void operator=(const base_termstore_t&) = delete;

        log_t& get_log();
        services::registry::table_registry_t* registry();
        std::pmr::memory_resource* resource() noexcept;
        ~base_termstore_t();

    protected:
        explicit base_termstore_t(const configuration::config& config);
        std::filesystem::path main_path_;
#if defined(TERMSTORE_TSAN_ENABLED)
        // TSAN cannot see through synchronized_pool_resource's internal mutex,
        // causing false positive data race reports on memory reuse between threads.
        // Under TSAN, delegate to new_delete_resource() which TSAN understands natively.
        struct tsan_resource_t final : std::pmr::memory_resource {
        protected:
            void* do_allocate(size_t bytes, size_t align) override {
                return std::pmr::new_delete_resource()->allocate(bytes, align);
            }
            void do_deallocate(void* p, size_t bytes, size_t align) override {
                std::pmr::new_delete_resource()->deallocate(p, bytes, align);
            }
            bool do_is_equal(const memory_resource& other) const noexcept override { return this == &other; }
        } resource_;
#else
        std::pmr::synchronized_pool_resource resource_;
#endif
        log_t log_;
        core::pmr::unique_ptr<services::registry::table_registry_t> registry_;

    private:
        inline static std::set<std::filesystem::path> paths_ = {};
        inline static std::mutex m_;
    };

} // namespace termstore
