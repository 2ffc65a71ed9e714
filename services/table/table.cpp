#include "table.hpp"

#include <components/storage/ordered_storage.hpp>

#include <mutex>

namespace services::table {

    using components::base::make_error;
    using components::base::success;
    namespace cursor = components::cursor;

    table_t::table_t(std::pmr::memory_resource* resource,
                     table_id_t id,
                     table_type type,
                     const components::options::table_options_t& options,
                     actor_id_t owner,
                     log_t& log)
        : resource_(resource)
        , log_(log.clone())
        , id_(id)
        , type_(type)
        , keypos_(options.keypos)
        , protection_(options.protection)
        , read_concurrency_(options.read_concurrency)
        , write_concurrency_(options.write_concurrency)
        , compressed_(options.compressed)
        , name_(options.name)
        , owner_(owner)
        , heir_(options.heir)
        , storage_(components::storage::make_storage(resource, type, options.keypos)) {
        trace(log_,
              "table {}: created {} keypos {} owner {}",
              id_.data(),
              components::options::type_name(type_),
              keypos_,
              owner_.data());
    }

    table_t::~table_t() { trace(log_, "table {}: destroyed", id_.data()); }

    table_id_t table_t::id() const noexcept { return id_; }

    table_type table_t::type() const noexcept { return type_; }

    std::size_t table_t::keypos() const noexcept { return keypos_; }

    template<class T, class F>
    result_t<T> table_t::guarded(const char* operation, F&& body) {
        try {
            return body();
        } catch (const std::exception& e) {
            error(log_, "table {}: {} failed: {}", id_.data(), operation, e.what());
            return make_error(error_code_t::unknown_error, e.what());
        }
    }

    result_t<void> table_t::gate(actor_id_t actor, access_t access) const {
        if (dropped_) {
            return make_error(error_code_t::table_not_found);
        }
        if (protection_ == protection_t::public_ || actor == owner_) {
            return success();
        }
        if (access == access_t::read) {
            if (protection_ == protection_t::protected_) {
                return success();
            }
            return make_error(error_code_t::read_protected);
        }
        return make_error(error_code_t::write_protected);
    }

    result_t<void> table_t::check_records(const records_t& records) const {
        for (const auto& record : records) {
            if (!record.is_tuple()) {
                return make_error(error_code_t::invalid_record, record.to_string());
            }
            if (record.arity() < keypos_) {
                return make_error(error_code_t::record_too_small, record.to_string());
            }
        }
        return success();
    }

    result_t<void> table_t::insert(actor_id_t actor, const records_t& records) {
        return guarded<void>("insert", [&]() -> result_t<void> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed;
            }
            if (auto valid = check_records(records); !valid) {
                return valid;
            }
            storage_->insert(records);
            return success();
        });
    }

    result_t<void> table_t::insert_new(actor_id_t actor, const records_t& records) {
        return guarded<void>("insert_new", [&]() -> result_t<void> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed;
            }
            if (auto valid = check_records(records); !valid) {
                return valid;
            }
            if (auto conflict = storage_->find_conflict(records); conflict) {
                return make_error(*conflict);
            }
            storage_->insert(records);
            return success();
        });
    }

    result_t<records_t> table_t::lookup(actor_id_t actor, const term_t& key) {
        return guarded<records_t>("lookup", [&]() -> result_t<records_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return storage_->lookup(key);
        });
    }

    result_t<std::vector<term_t>> table_t::lookup_element(actor_id_t actor, const term_t& key, std::size_t position) {
        return guarded<std::vector<term_t>>("lookup_element", [&]() -> result_t<std::vector<term_t>> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            auto records = storage_->lookup(key);
            if (records.empty()) {
                return make_error(error_code_t::key_not_found, key.to_string());
            }
            std::vector<term_t> elements;
            elements.reserve(records.size());
            for (const auto& record : records) {
                if (position == 0 || position > record.arity()) {
                    return make_error(error_code_t::position_out_of_bounds, std::to_string(position));
                }
                elements.push_back(record.element(position));
            }
            return elements;
        });
    }

    result_t<bool> table_t::has_key(actor_id_t actor, const term_t& key) {
        return guarded<bool>("has_key", [&]() -> result_t<bool> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return storage_->contains(key);
        });
    }

    result_t<void> table_t::delete_key(actor_id_t actor, const term_t& key) {
        return guarded<void>("delete_key", [&]() -> result_t<void> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed;
            }
            storage_->erase(key);
            return success();
        });
    }

    result_t<void> table_t::delete_all(actor_id_t actor) {
        return guarded<void>("delete_all", [&]() -> result_t<void> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed;
            }
            storage_->clear();
            return success();
        });
    }

    result_t<records_t> table_t::take(actor_id_t actor, const term_t& key) {
        return guarded<records_t>("take", [&]() -> result_t<records_t> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed.error();
            }
            auto records = storage_->lookup(key);
            storage_->erase(key);
            return records;
        });
    }

    result_t<records_t> table_t::update_key(actor_id_t actor, const term_t& key, const update_fn_t& update) {
        return guarded<records_t>("update_key", [&]() -> result_t<records_t> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed.error();
            }
            auto current = storage_->lookup(key);
            auto replacement = update(current);
            if (replacement) {
                if (auto valid = check_records(*replacement); !valid) {
                    return valid.error();
                }
            }
            storage_->erase(key);
            if (replacement) {
                try {
                    storage_->insert(*replacement);
                } catch (const std::exception&) {
                    storage_->insert(current);
                    throw;
                }
            }
            trace(log_, "table {}: update_key {} replaced {} records", id_.data(), key.to_string(), current.size());
            return current;
        });
    }

    result_t<records_t> table_t::to_list(actor_id_t actor) {
        return guarded<records_t>("to_list", [&]() -> result_t<records_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return storage_->to_list();
        });
    }

    namespace {

        enum class navigation_t : uint8_t
        {
            first,
            last,
            next,
            previous
        };

        result_t<term_t> navigate(const components::storage::storage_t& storage, navigation_t step, const term_t& key) {
            if (storage.type() != table_type::ordered_set) {
                return make_error(error_code_t::set_not_ordered);
            }
            const auto& ordered = static_cast<const components::storage::ordered_storage_t&>(storage);
            switch (step) {
                case navigation_t::first:
                    if (auto found = ordered.first(); found) {
                        return *found;
                    }
                    return make_error(error_code_t::empty_table);
                case navigation_t::last:
                    if (auto found = ordered.last(); found) {
                        return *found;
                    }
                    return make_error(error_code_t::empty_table);
                case navigation_t::next:
                    if (auto found = ordered.next(key); found) {
                        return *found;
                    }
                    return make_error(error_code_t::end_of_table);
                case navigation_t::previous:
                    if (auto found = ordered.previous(key); found) {
                        return *found;
                    }
                    return make_error(error_code_t::start_of_table);
            }
            return make_error(error_code_t::unknown_error);
        }

    } // namespace

    result_t<term_t> table_t::first(actor_id_t actor) {
        return guarded<term_t>("first", [&]() -> result_t<term_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return navigate(*storage_, navigation_t::first, term_t());
        });
    }

    result_t<term_t> table_t::last(actor_id_t actor) {
        return guarded<term_t>("last", [&]() -> result_t<term_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return navigate(*storage_, navigation_t::last, term_t());
        });
    }

    result_t<term_t> table_t::next(actor_id_t actor, const term_t& key) {
        return guarded<term_t>("next", [&]() -> result_t<term_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return navigate(*storage_, navigation_t::next, key);
        });
    }

    result_t<term_t> table_t::previous(actor_id_t actor, const term_t& key) {
        return guarded<term_t>("previous", [&]() -> result_t<term_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return navigate(*storage_, navigation_t::previous, key);
        });
    }

    result_t<std::vector<term_t>> table_t::select(actor_id_t actor,
                                                  const components::matcher::compiled_spec_ptr& spec) {
        return guarded<std::vector<term_t>>("select", [&]() -> result_t<std::vector<term_t>> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return cursor::fetch_all(*storage_, *spec, spec->lookup_key(keypos_));
        });
    }

    result_t<cursor::page_t> table_t::select(actor_id_t actor,
                                             cursor::query_kind kind,
                                             const components::matcher::compiled_spec_ptr& spec,
                                             std::size_t limit) {
        return guarded<cursor::page_t>("select", [&]() -> result_t<cursor::page_t> {
            std::shared_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            if (limit == 0) {
                return make_error(error_code_t::invalid_limit);
            }
            auto start = cursor::make_continuation(id_,
                                                   kind,
                                                   spec,
                                                   spec->lookup_key(keypos_),
                                                   components::storage::position_t::start(),
                                                   limit);
            return fetch(*start);
        });
    }

    result_t<cursor::page_t> table_t::resume(actor_id_t actor, const cursor::continuation_ptr& continuation) {
        return guarded<cursor::page_t>("resume", [&]() -> result_t<cursor::page_t> {
            if (!continuation || continuation->table_id() != id_) {
                return make_error(error_code_t::invalid_continuation);
            }
            std::shared_lock lock(mutex_);
            if (dropped_) {
                return make_error(error_code_t::invalid_continuation);
            }
            if (auto allowed = gate(actor, access_t::read); !allowed) {
                return allowed.error();
            }
            return fetch(*continuation);
        });
    }

    result_t<cursor::page_t> table_t::fetch(const cursor::continuation_t& start) const {
        return cursor::fetch_page(*storage_, start);
    }

    result_t<std::size_t> table_t::select_delete(actor_id_t actor,
                                                 const components::matcher::compiled_spec_ptr& spec) {
        return guarded<std::size_t>("select_delete", [&]() -> result_t<std::size_t> {
            std::unique_lock lock(mutex_);
            if (auto allowed = gate(actor, access_t::write); !allowed) {
                return allowed.error();
            }
            components::matcher::bindings_t scratch;
            auto removed = storage_->erase_if([&spec, &scratch](const record_t& record) {
                auto result = spec->evaluate(record, scratch);
                return result && result->is_true();
            });
            trace(log_, "table {}: select_delete removed {}", id_.data(), removed);
            return removed;
        });
    }

    result_t<table_info_t> table_t::info() const {
        std::shared_lock lock(mutex_);
        if (dropped_) {
            return make_error(error_code_t::table_not_found);
        }
        table_info_t result;
        result.id = id_;
        result.name = name_;
        result.named = name_.has_value();
        result.type = type_;
        result.protection = protection_;
        result.owner = owner_;
        if (heir_) {
            result.heir = heir_->actor;
        }
        result.keypos = keypos_;
        result.size = storage_->size();
        result.read_concurrency = read_concurrency_;
        result.write_concurrency = write_concurrency_;
        result.compressed = compressed_;
        return result;
    }

    actor_id_t table_t::owner() const {
        std::shared_lock lock(mutex_);
        return owner_;
    }

    std::optional<heir_t> table_t::heir() const {
        std::shared_lock lock(mutex_);
        return heir_;
    }

    std::optional<std::string> table_t::name() const {
        std::shared_lock lock(mutex_);
        return name_;
    }

    bool table_t::is_dropped() const {
        std::shared_lock lock(mutex_);
        return dropped_;
    }

    result_t<void> table_t::check_write(actor_id_t actor) const {
        std::shared_lock lock(mutex_);
        return gate(actor, access_t::write);
    }

    void table_t::set_owner(actor_id_t owner) {
        std::unique_lock lock(mutex_);
        trace(log_, "table {}: owner {} -> {}", id_.data(), owner_.data(), owner.data());
        owner_ = owner;
    }

    void table_t::set_name(std::optional<std::string> name) {
        std::unique_lock lock(mutex_);
        name_ = std::move(name);
    }

    void table_t::drop() {
        std::unique_lock lock(mutex_);
        if (dropped_) {
            return;
        }
        dropped_ = true;
        storage_.reset();
        trace(log_, "table {}: dropped", id_.data());
    }

} // namespace services::table
