#include "key_value_set.hpp"

namespace termstore {

    using components::base::make_error;
    using components::base::unwrap_or_throw;
    using components::types::make_tuple;

    key_value_set_t::key_value_set_t(set_t set)
        : set_(std::move(set)) {}

    result_t<key_value_set_t>
    key_value_set_t::create(table_registry_t* registry,
                            actor_id_t actor,
                            const components::options::key_value_set_options_t& options) {
        auto created = set_t::create(registry, actor, options.to_set_options());
        if (!created) {
            return created.error();
        }
        return key_value_set_t(std::move(created).value());
    }

    result_t<key_value_set_t> key_value_set_t::create(table_registry_t* registry,
                                                      actor_id_t actor,
                                                      const components::options::option_list_t& options) {
        auto parsed = components::options::parse_key_value_set_options(options);
        if (!parsed) {
            return parsed.error();
        }
        return create(registry, actor, parsed.value());
    }

    key_value_set_t
    key_value_set_t::create_or_throw(table_registry_t* registry,
                                     actor_id_t actor,
                                     const components::options::key_value_set_options_t& options) {
        return unwrap_or_throw(create(registry, actor, options), "key_value_set::new");
    }

    result_t<key_value_set_t> key_value_set_t::wrap_existing(table_registry_t* registry, const table_ident_t& ident) {
        auto wrapped = set_t::wrap_existing(registry, ident);
        if (!wrapped) {
            return wrapped.error();
        }
        if (wrapped.value().get_table()->keypos() != 1) {
            return make_error(error_code_t::invalid_keypos, std::to_string(wrapped.value().get_table()->keypos()));
        }
        return key_value_set_t(std::move(wrapped).value());
    }

    key_value_set_t key_value_set_t::wrap_existing_or_throw(table_registry_t* registry, const table_ident_t& ident) {
        return unwrap_or_throw(wrap_existing(registry, ident), "key_value_set::wrap_existing");
    }

    table_id_t key_value_set_t::id() const { return set_.id(); }

    result_t<void> key_value_set_t::put(actor_id_t actor, const term_t& key, const term_t& value) {
        return set_.put(actor, make_tuple(key, value));
    }

    result_t<void> key_value_set_t::put_new(actor_id_t actor, const term_t& key, const term_t& value) {
        return set_.put_new(actor, make_tuple(key, value));
    }

    result_t<term_t> key_value_set_t::get(actor_id_t actor, const term_t& key, const term_t& fallback) {
        auto found = set_.get(actor, key, term_t::nil());
        if (!found) {
            return found.error();
        }
        auto& record = found.value();
        if (!record.is_tuple()) {
            return fallback;
        }
        if (record.arity() != 2) {
            return make_error(error_code_t::invalid_record, record.to_string());
        }
        return record.element(2);
    }

    result_t<bool> key_value_set_t::has_key(actor_id_t actor, const term_t& key) { return set_.has_key(actor, key); }

    result_t<void> key_value_set_t::delete_key(actor_id_t actor, const term_t& key) {
        return set_.delete_key(actor, key);
    }

    result_t<void> key_value_set_t::delete_all(actor_id_t actor) { return set_.delete_all(actor); }

    result_t<records_t> key_value_set_t::to_list(actor_id_t actor) { return set_.to_list(actor); }

    result_t<void> key_value_set_t::delete_table(actor_id_t actor) { return set_.delete_table(actor); }

    result_t<table_info_t> key_value_set_t::info() const { return set_.info(); }

    void key_value_set_t::put_or_throw(actor_id_t actor, const term_t& key, const term_t& value) {
        unwrap_or_throw(put(actor, key, value), "put");
    }

    void key_value_set_t::put_new_or_throw(actor_id_t actor, const term_t& key, const term_t& value) {
        unwrap_or_throw(put_new(actor, key, value), "put_new");
    }

    term_t key_value_set_t::get_or_throw(actor_id_t actor, const term_t& key, const term_t& fallback) {
        return unwrap_or_throw(get(actor, key, fallback), "get");
    }

    bool key_value_set_t::has_key_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(has_key(actor, key), "has_key");
    }

    void key_value_set_t::delete_key_or_throw(actor_id_t actor, const term_t& key) {
        unwrap_or_throw(delete_key(actor, key), "delete");
    }

    void key_value_set_t::delete_all_or_throw(actor_id_t actor) { unwrap_or_throw(delete_all(actor), "delete_all"); }

    records_t key_value_set_t::to_list_or_throw(actor_id_t actor) {
        return unwrap_or_throw(to_list(actor), "to_list");
    }

    void key_value_set_t::delete_table_or_throw(actor_id_t actor) {
        unwrap_or_throw(delete_table(actor), "delete");
    }

    table_info_t key_value_set_t::info_or_throw() const { return unwrap_or_throw(info(), "info"); }

} // namespace termstore
