#include "set.hpp"

namespace termstore {

    using components::base::make_error;
    using components::base::unwrap_or_throw;

    set_t::set_t(table_registry_t* registry, table_ptr table)
        : table_handle_t(registry, std::move(table)) {}

    result_t<set_t> set_t::create(table_registry_t* registry,
                                  actor_id_t actor,
                                  const components::options::set_options_t& options) {
        auto type = options.ordered ? table_type::ordered_set : table_type::set;
        auto created = registry->create_table(actor, type, options);
        if (!created) {
            return created.error();
        }
        return set_t(registry, std::move(created).value());
    }

    result_t<set_t> set_t::create(table_registry_t* registry,
                                  actor_id_t actor,
                                  const components::options::option_list_t& options) {
        auto parsed = components::options::parse_set_options(options);
        if (!parsed) {
            return parsed.error();
        }
        return create(registry, actor, parsed.value());
    }

    set_t set_t::create_or_throw(table_registry_t* registry,
                                 actor_id_t actor,
                                 const components::options::set_options_t& options) {
        return unwrap_or_throw(create(registry, actor, options), "set::new");
    }

    result_t<set_t> set_t::wrap_existing(table_registry_t* registry, const table_ident_t& ident) {
        auto found = registry->find(ident);
        if (!found) {
            return found.error();
        }
        if (!components::options::is_set_type(found.value()->type())) {
            return make_error(error_code_t::invalid_type, ident.to_string());
        }
        return set_t(registry, std::move(found).value());
    }

    set_t set_t::wrap_existing_or_throw(table_registry_t* registry, const table_ident_t& ident) {
        return unwrap_or_throw(wrap_existing(registry, ident), "set::wrap_existing");
    }

    bool set_t::is_ordered() const { return type() == table_type::ordered_set; }

    result_t<void> set_t::put(actor_id_t actor, const record_t& record) { return insert(actor, record); }

    result_t<void> set_t::put(actor_id_t actor, const records_t& records) { return insert_multi(actor, records); }

    result_t<void> set_t::put_new(actor_id_t actor, const record_t& record) { return insert_new(actor, record); }

    result_t<void> set_t::put_new(actor_id_t actor, const records_t& records) {
        return insert_multi_new(actor, records);
    }

    result_t<term_t> set_t::get(actor_id_t actor, const term_t& key, const term_t& fallback) {
        auto found = table_->lookup(actor, key);
        if (!found) {
            return found.error();
        }
        auto& records = found.value();
        if (records.empty()) {
            return fallback;
        }
        if (records.size() > 1) {
            return make_error(error_code_t::invalid_set, key.to_string());
        }
        return std::move(records.front());
    }

    result_t<term_t> set_t::get_element(actor_id_t actor, const term_t& key, std::size_t position) {
        auto found = table_->lookup_element(actor, key, position);
        if (!found) {
            return found.error();
        }
        if (found.value().size() > 1) {
            return make_error(error_code_t::invalid_set, key.to_string());
        }
        return std::move(found.value().front());
    }

    result_t<term_t> set_t::first(actor_id_t actor) { return table_->first(actor); }

    result_t<term_t> set_t::last(actor_id_t actor) { return table_->last(actor); }

    result_t<term_t> set_t::next(actor_id_t actor, const term_t& key) { return table_->next(actor, key); }

    result_t<term_t> set_t::previous(actor_id_t actor, const term_t& key) { return table_->previous(actor, key); }

    void set_t::put_or_throw(actor_id_t actor, const record_t& record) { unwrap_or_throw(put(actor, record), "put"); }

    void set_t::put_or_throw(actor_id_t actor, const records_t& records) {
        unwrap_or_throw(put(actor, records), "put");
    }

    void set_t::put_new_or_throw(actor_id_t actor, const record_t& record) {
        unwrap_or_throw(put_new(actor, record), "put_new");
    }

    void set_t::put_new_or_throw(actor_id_t actor, const records_t& records) {
        unwrap_or_throw(put_new(actor, records), "put_new");
    }

    term_t set_t::get_or_throw(actor_id_t actor, const term_t& key, const term_t& fallback) {
        return unwrap_or_throw(get(actor, key, fallback), "get");
    }

    term_t set_t::get_element_or_throw(actor_id_t actor, const term_t& key, std::size_t position) {
        return unwrap_or_throw(get_element(actor, key, position), "get_element");
    }

    term_t set_t::first_or_throw(actor_id_t actor) { return unwrap_or_throw(first(actor), "first"); }

    term_t set_t::last_or_throw(actor_id_t actor) { return unwrap_or_throw(last(actor), "last"); }

    term_t set_t::next_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(next(actor, key), "next");
    }

    term_t set_t::previous_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(previous(actor, key), "previous");
    }

} // namespace termstore
