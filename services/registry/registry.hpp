#pragma once

#include <atomic>
#include <chrono>
#include <memory_resource>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <components/base/table_id.hpp>
#include <components/configuration/configuration.hpp>
#include <components/log/log.hpp>

#include "mailbox.hpp"

namespace services::registry {

    using components::base::error_code_t;
    using components::base::result_t;
    using components::base::table_id_t;
    using components::base::table_ident_t;
    using components::base::table_name_t;
    using components::options::table_type;
    using table::table_info_t;

    /// Table handed over by give_away or by inheritance, together with the sender and its payload.
    struct transfer_t {
        table_ptr table;
        actor_id_t from;
        term_t payload;
    };

    /// Process-wide directory of live actors and tables.
    ///
    /// The name and id maps sit behind their own reader/writer lock so lookups never contend with table
    /// I/O. Structural changes (create, delete, rename, hand-off, actor termination) are serialized by the
    /// lifecycle mutex. Lock order: lifecycle, registry, table, mailbox.
    class table_registry_t final {
    public:
        table_registry_t(std::pmr::memory_resource* resource,
                         const configuration::config_registry& config,
                         log_t& log);
        ~table_registry_t();

        table_registry_t(const table_registry_t&) = delete;
        table_registry_t& operator=(const table_registry_t&) = delete;

        std::pmr::memory_resource* resource() const noexcept { return resource_; }

        actor_id_t spawn_actor();
        /// Supervision hook: closes the actor's mailbox and runs on_owner_terminated for every table it owns.
        void terminate_actor(actor_id_t actor);
        bool is_alive(actor_id_t actor) const;

        result_t<table_ptr> create_table(actor_id_t actor,
                                         table_type type,
                                         const components::options::table_options_t& options);
        result_t<table_ptr> find(const table_ident_t& ident) const;
        result_t<void> delete_table(actor_id_t actor, const table_ident_t& ident);
        result_t<void> rename(actor_id_t actor, const table_ident_t& ident, const table_name_t& name);
        result_t<table_id_t> whereis(const table_name_t& name) const;
        std::vector<table_id_t> all() const;
        result_t<table_info_t> info(const table_ident_t& ident) const;

        result_t<void> give_away(actor_id_t actor, const table_ident_t& ident, actor_id_t target, term_t payload);
        result_t<transfer_t> accept(actor_id_t actor);
        result_t<transfer_t> accept(actor_id_t actor, std::chrono::milliseconds timeout);

        /// Moves the table to its heir when one is configured and alive, otherwise deletes it.
        void on_owner_terminated(const table_ptr& table);

    private:
        struct pending_t {
            actor_id_t target;
            uint64_t ticket;
        };

        // callers hold lifecycle_mutex_
        void release_locked(const table_ptr& table, actor_id_t previous_owner);
        void erase_locked(const table_ptr& table);
        result_t<table_ptr> find_locked(const table_ident_t& ident) const;
        mailbox_ptr mailbox_of(actor_id_t actor) const;

        std::pmr::memory_resource* resource_;
        log_t log_;
        std::chrono::milliseconds default_accept_timeout_;

        std::mutex lifecycle_mutex_;
        mutable std::shared_mutex mutex_;
        std::pmr::unordered_map<actor_id_t, mailbox_ptr> actors_;
        std::pmr::unordered_map<table_id_t, table_ptr> tables_;
        std::pmr::unordered_map<table_name_t, table_id_t> names_;
        std::pmr::unordered_map<table_id_t, pending_t> pending_;

        std::atomic<uint64_t> next_actor_{1};
        std::atomic<uint64_t> next_table_{1};
        uint64_t next_ticket_{1};
    };

} // namespace services::registry
