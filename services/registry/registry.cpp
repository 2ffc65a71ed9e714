#include "registry.hpp"

#include <algorithm>

namespace services::registry {

    using components::base::make_error;
    using components::base::success;

    table_registry_t::table_registry_t(std::pmr::memory_resource* resource,
                                       const configuration::config_registry& config,
                                       log_t& log)
        : resource_(resource)
        , log_(log.clone())
        , default_accept_timeout_(config.default_accept_timeout)
        , actors_(resource)
        , tables_(resource)
        , names_(resource)
        , pending_(resource) {
        trace(log_, "table_registry start, accept timeout {} ms", default_accept_timeout_.count());
    }

    table_registry_t::~table_registry_t() {
        std::unique_lock lock(mutex_);
        for (auto& [id, mailbox] : actors_) {
            mailbox->close();
        }
        for (auto& [id, table] : tables_) {
            table->drop();
        }
        trace(log_, "delete table_registry, {} tables dropped", tables_.size());
    }

    actor_id_t table_registry_t::spawn_actor() {
        actor_id_t actor{next_actor_.fetch_add(1)};
        std::unique_lock lock(mutex_);
        actors_.emplace(actor, mailbox_ptr(new mailbox_t));
        debug(log_, "actor {} spawned", actor.data());
        return actor;
    }

    void table_registry_t::terminate_actor(actor_id_t actor) {
        std::lock_guard lifecycle(lifecycle_mutex_);
        std::vector<table_ptr> owned;
        {
            std::unique_lock lock(mutex_);
            auto it = actors_.find(actor);
            if (it == actors_.end()) {
                return;
            }
            it->second->close();
            actors_.erase(it);
            for (const auto& [id, table] : tables_) {
                if (table->owner() == actor) {
                    owned.push_back(table);
                }
            }
        }
        debug(log_, "actor {} terminated, owned tables: {}", actor.data(), owned.size());
        for (const auto& table : owned) {
            release_locked(table, actor);
        }
    }

    bool table_registry_t::is_alive(actor_id_t actor) const {
        std::shared_lock lock(mutex_);
        return actors_.find(actor) != actors_.end();
    }

    result_t<table_ptr> table_registry_t::create_table(actor_id_t actor,
                                                      table_type type,
                                                      const components::options::table_options_t& options) {
        if (auto valid = components::options::validate(options); !valid) {
            return valid.error();
        }
        std::lock_guard lifecycle(lifecycle_mutex_);
        std::unique_lock lock(mutex_);
        if (actors_.find(actor) == actors_.end()) {
            return make_error(error_code_t::actor_not_alive, std::to_string(actor.data()));
        }
        if (options.name && names_.find(*options.name) != names_.end()) {
            return make_error(error_code_t::table_already_exists, *options.name);
        }
        table_id_t id{next_table_.fetch_add(1)};
        table_ptr created(new table::table_t(resource_, id, type, options, actor, log_));
        tables_.emplace(id, created);
        if (options.name) {
            names_.emplace(*options.name, id);
        }
        debug(log_,
              "table {} created: {} {} by actor {}",
              id.data(),
              components::options::type_name(type),
              options.name.value_or(""),
              actor.data());
        return created;
    }

    result_t<table_ptr> table_registry_t::find(const table_ident_t& ident) const {
        std::shared_lock lock(mutex_);
        return find_locked(ident);
    }

    result_t<table_ptr> table_registry_t::find_locked(const table_ident_t& ident) const {
        table_id_t id;
        if (ident.is_id()) {
            id = ident.id();
        } else {
            auto name = names_.find(ident.name());
            if (name == names_.end()) {
                return make_error(error_code_t::table_not_found, ident.to_string());
            }
            id = name->second;
        }
        auto it = tables_.find(id);
        if (it == tables_.end()) {
            return make_error(error_code_t::table_not_found, ident.to_string());
        }
        return it->second;
    }

    result_t<void> table_registry_t::delete_table(actor_id_t actor, const table_ident_t& ident) {
        std::lock_guard lifecycle(lifecycle_mutex_);
        auto found = find(ident);
        if (!found) {
            return found.error();
        }
        auto& table = found.value();
        if (auto allowed = table->check_write(actor); !allowed) {
            return allowed;
        }
        erase_locked(table);
        debug(log_, "table {} deleted by actor {}", table->id().data(), actor.data());
        return success();
    }

    void table_registry_t::erase_locked(const table_ptr& table) {
        {
            std::unique_lock lock(mutex_);
            if (auto name = table->name(); name) {
                auto it = names_.find(*name);
                if (it != names_.end() && it->second == table->id()) {
                    names_.erase(it);
                }
            }
            tables_.erase(table->id());
            pending_.erase(table->id());
        }
        table->drop();
    }

    result_t<void> table_registry_t::rename(actor_id_t actor, const table_ident_t& ident, const table_name_t& name) {
        if (name.empty()) {
            return make_error(error_code_t::invalid_option, "{name, []}");
        }
        std::lock_guard lifecycle(lifecycle_mutex_);
        std::unique_lock lock(mutex_);
        auto found = find_locked(ident);
        if (!found) {
            return found.error();
        }
        auto& table = found.value();
        if (auto allowed = table->check_write(actor); !allowed) {
            return allowed;
        }
        if (auto existing = names_.find(name); existing != names_.end()) {
            if (existing->second == table->id()) {
                return success();
            }
            return make_error(error_code_t::table_already_exists, name);
        }
        if (auto previous = table->name(); previous) {
            names_.erase(*previous);
        }
        names_.emplace(name, table->id());
        table->set_name(name);
        debug(log_, "table {} renamed to {}", table->id().data(), name);
        return success();
    }

    result_t<table_id_t> table_registry_t::whereis(const table_name_t& name) const {
        std::shared_lock lock(mutex_);
        auto it = names_.find(name);
        if (it == names_.end()) {
            return make_error(error_code_t::table_not_found, name);
        }
        return it->second;
    }

    std::vector<table_id_t> table_registry_t::all() const {
        std::vector<table_id_t> ids;
        {
            std::shared_lock lock(mutex_);
            ids.reserve(tables_.size());
            for (const auto& [id, table] : tables_) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    result_t<table_info_t> table_registry_t::info(const table_ident_t& ident) const {
        auto found = find(ident);
        if (!found) {
            return found.error();
        }
        return found.value()->info();
    }

    result_t<void>
    table_registry_t::give_away(actor_id_t actor, const table_ident_t& ident, actor_id_t target, term_t payload) {
        std::lock_guard lifecycle(lifecycle_mutex_);
        table_ptr table;
        mailbox_ptr mailbox;
        uint64_t ticket = 0;
        {
            std::unique_lock lock(mutex_);
            auto found = find_locked(ident);
            if (!found) {
                return found.error();
            }
            table = found.value();
            auto owner = table->owner();
            if (target == owner) {
                return make_error(error_code_t::recipient_already_owns_table);
            }
            auto recipient = actors_.find(target);
            if (recipient == actors_.end()) {
                return make_error(error_code_t::recipient_not_alive, std::to_string(target.data()));
            }
            if (actor != owner) {
                return make_error(error_code_t::sender_not_table_owner);
            }
            mailbox = recipient->second;
            ticket = next_ticket_++;
            pending_[table->id()] = pending_t{target, ticket};
        }
        mailbox->push(transfer_request_t{table, actor, std::move(payload), ticket});
        debug(log_,
              "table {} offered by actor {} to actor {}, ticket {}",
              table->id().data(),
              actor.data(),
              target.data(),
              ticket);
        return success();
    }

    result_t<transfer_t> table_registry_t::accept(actor_id_t actor) { return accept(actor, default_accept_timeout_); }

    result_t<transfer_t> table_registry_t::accept(actor_id_t actor, std::chrono::milliseconds timeout) {
        auto mailbox = mailbox_of(actor);
        if (!mailbox) {
            return make_error(error_code_t::actor_not_alive, std::to_string(actor.data()));
        }
        auto deadline = mailbox_t::clock_type::now() + timeout;
        while (true) {
            auto request = mailbox->pop_until(deadline);
            if (!request) {
                if (mailbox->is_closed()) {
                    return make_error(error_code_t::actor_not_alive, std::to_string(actor.data()));
                }
                return make_error(error_code_t::timeout);
            }

            std::lock_guard lifecycle(lifecycle_mutex_);
            auto& table = request->table;
            if (table->is_dropped()) {
                debug(log_, "actor {} discards offer of deleted table {}", actor.data(), table->id().data());
                continue;
            }
            if (request->ticket == 0) {
                if (table->owner() == actor) {
                    return transfer_t{table, request->from, std::move(request->payload)};
                }
                continue;
            }
            {
                std::unique_lock lock(mutex_);
                auto pending = pending_.find(table->id());
                if (pending == pending_.end() || pending->second.ticket != request->ticket ||
                    pending->second.target != actor || table->owner() != request->from) {
                    debug(log_, "actor {} discards stale offer of table {}", actor.data(), table->id().data());
                    continue;
                }
                pending_.erase(pending);
            }
            table->set_owner(actor);
            debug(log_, "table {} accepted by actor {} from actor {}", table->id().data(), actor.data(), request->from.data());
            return transfer_t{table, request->from, std::move(request->payload)};
        }
    }

    void table_registry_t::on_owner_terminated(const table_ptr& table) {
        std::lock_guard lifecycle(lifecycle_mutex_);
        release_locked(table, table->owner());
    }

    void table_registry_t::release_locked(const table_ptr& table, actor_id_t previous_owner) {
        if (table->is_dropped()) {
            return;
        }
        auto heir = table->heir();
        mailbox_ptr mailbox;
        if (heir && heir->actor != previous_owner) {
            mailbox = mailbox_of(heir->actor);
        }
        if (!mailbox) {
            erase_locked(table);
            debug(log_, "table {} deleted with its owner {}", table->id().data(), previous_owner.data());
            return;
        }
        {
            std::unique_lock lock(mutex_);
            pending_.erase(table->id());
        }
        table->set_owner(heir->actor);
        mailbox->push(transfer_request_t{table, previous_owner, heir->data, 0});
        debug(log_,
              "table {} inherited by actor {} from actor {}",
              table->id().data(),
              heir->actor.data(),
              previous_owner.data());
    }

    mailbox_ptr table_registry_t::mailbox_of(actor_id_t actor) const {
        std::shared_lock lock(mutex_);
        auto it = actors_.find(actor);
        if (it == actors_.end()) {
            return nullptr;
        }
        return it->second;
    }

} // namespace services::registry
