#include "bag.hpp"

namespace termstore {

    using components::base::make_error;
    using components::base::unwrap_or_throw;

    bag_t::bag_t(table_registry_t* registry, table_ptr table)
        : table_handle_t(registry, std::move(table)) {}

    result_t<bag_t> bag_t::create(table_registry_t* registry,
                                  actor_id_t actor,
                                  const components::options::bag_options_t& options) {
        auto type = options.duplicate ? table_type::duplicate_bag : table_type::bag;
        auto created = registry->create_table(actor, type, options);
        if (!created) {
            return created.error();
        }
        return bag_t(registry, std::move(created).value());
    }

    result_t<bag_t> bag_t::create(table_registry_t* registry,
                                  actor_id_t actor,
                                  const components::options::option_list_t& options) {
        auto parsed = components::options::parse_bag_options(options);
        if (!parsed) {
            return parsed.error();
        }
        return create(registry, actor, parsed.value());
    }

    bag_t bag_t::create_or_throw(table_registry_t* registry,
                                 actor_id_t actor,
                                 const components::options::bag_options_t& options) {
        return unwrap_or_throw(create(registry, actor, options), "bag::new");
    }

    result_t<bag_t> bag_t::wrap_existing(table_registry_t* registry, const table_ident_t& ident) {
        auto found = registry->find(ident);
        if (!found) {
            return found.error();
        }
        if (!components::options::is_bag_type(found.value()->type())) {
            return make_error(error_code_t::invalid_type, ident.to_string());
        }
        return bag_t(registry, std::move(found).value());
    }

    bag_t bag_t::wrap_existing_or_throw(table_registry_t* registry, const table_ident_t& ident) {
        return unwrap_or_throw(wrap_existing(registry, ident), "bag::wrap_existing");
    }

    bool bag_t::allows_duplicates() const { return type() == table_type::duplicate_bag; }

    result_t<void> bag_t::add(actor_id_t actor, const record_t& record) { return insert(actor, record); }

    result_t<void> bag_t::add(actor_id_t actor, const records_t& records) { return insert_multi(actor, records); }

    result_t<void> bag_t::add_new(actor_id_t actor, const record_t& record) { return insert_new(actor, record); }

    result_t<void> bag_t::add_new(actor_id_t actor, const records_t& records) {
        return insert_multi_new(actor, records);
    }

    result_t<records_t> bag_t::lookup(actor_id_t actor, const term_t& key) { return lookup_multi(actor, key); }

    namespace {

        result_t<std::optional<records_t>> none_when_empty(result_t<records_t>&& records) {
            if (!records) {
                return records.error();
            }
            if (records.value().empty()) {
                return std::optional<records_t>();
            }
            return std::optional<records_t>(std::move(records).value());
        }

    } // namespace

    result_t<std::optional<records_t>> bag_t::fetch(actor_id_t actor, const term_t& key) {
        return none_when_empty(lookup(actor, key));
    }

    result_t<std::optional<records_t>> bag_t::pop(actor_id_t actor, const term_t& key) {
        return none_when_empty(table_->take(actor, key));
    }

    result_t<std::optional<records_t>>
    bag_t::get_and_update(actor_id_t actor, const term_t& key, const update_fn_t& update) {
        return none_when_empty(table_->update_key(actor, key, [&update](const records_t& current) {
            if (current.empty()) {
                return update(std::nullopt);
            }
            return update(current);
        }));
    }

    void bag_t::add_or_throw(actor_id_t actor, const record_t& record) { unwrap_or_throw(add(actor, record), "add"); }

    void bag_t::add_or_throw(actor_id_t actor, const records_t& records) {
        unwrap_or_throw(add(actor, records), "add");
    }

    void bag_t::add_new_or_throw(actor_id_t actor, const record_t& record) {
        unwrap_or_throw(add_new(actor, record), "add_new");
    }

    void bag_t::add_new_or_throw(actor_id_t actor, const records_t& records) {
        unwrap_or_throw(add_new(actor, records), "add_new");
    }

    records_t bag_t::lookup_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(lookup(actor, key), "lookup");
    }

    std::optional<records_t> bag_t::fetch_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(fetch(actor, key), "fetch");
    }

    std::optional<records_t> bag_t::pop_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(pop(actor, key), "pop");
    }

    std::optional<records_t>
    bag_t::get_and_update_or_throw(actor_id_t actor, const term_t& key, const update_fn_t& update) {
        return unwrap_or_throw(get_and_update(actor, key, update), "get_and_update");
    }

} // namespace termstore
