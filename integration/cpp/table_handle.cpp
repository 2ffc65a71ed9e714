#include "table_handle.hpp"

#include <components/matcher/compiled_spec.hpp>

namespace termstore {

    using components::base::make_error;
    using components::base::unwrap_or_throw;
    using components::cursor::query_kind;
    using components::matcher::compiled_spec_t;

    table_handle_t::table_handle_t(table_registry_t* registry, table_ptr table)
        : registry_(registry)
        , table_(std::move(table)) {}

    table_id_t table_handle_t::id() const { return table_->id(); }

    table_type table_handle_t::type() const { return table_->type(); }

    result_t<void> table_handle_t::insert(actor_id_t actor, const record_t& record) {
        return table_->insert(actor, {record});
    }

    result_t<void> table_handle_t::insert_new(actor_id_t actor, const record_t& record) {
        return table_->insert_new(actor, {record});
    }

    result_t<void> table_handle_t::insert_multi(actor_id_t actor, const records_t& records) {
        return table_->insert(actor, records);
    }

    result_t<void> table_handle_t::insert_multi_new(actor_id_t actor, const records_t& records) {
        return table_->insert_new(actor, records);
    }

    result_t<std::optional<record_t>> table_handle_t::lookup(actor_id_t actor, const term_t& key) {
        auto found = table_->lookup(actor, key);
        if (!found) {
            return found.error();
        }
        auto& records = found.value();
        if (records.size() > 1) {
            return make_error(error_code_t::multi_found, key.to_string());
        }
        if (records.empty()) {
            return std::optional<record_t>();
        }
        return std::optional<record_t>(std::move(records.front()));
    }

    result_t<records_t> table_handle_t::lookup_multi(actor_id_t actor, const term_t& key) {
        return table_->lookup(actor, key);
    }

    result_t<std::vector<term_t>>
    table_handle_t::lookup_element(actor_id_t actor, const term_t& key, std::size_t position) {
        return table_->lookup_element(actor, key, position);
    }

    result_t<bool> table_handle_t::has_key(actor_id_t actor, const term_t& key) { return table_->has_key(actor, key); }

    result_t<std::vector<term_t>> table_handle_t::match(actor_id_t actor, const pattern_t& pattern) {
        return table_->select(actor, compiled_spec_t::compile_pattern(pattern));
    }

    result_t<page_t> table_handle_t::match(actor_id_t actor, const pattern_t& pattern, std::size_t limit) {
        return table_->select(actor, query_kind::match, compiled_spec_t::compile_pattern(pattern), limit);
    }

    result_t<page_t> table_handle_t::match(actor_id_t actor, const continuation_ptr& continuation) {
        if (continuation && continuation->kind() != query_kind::match) {
            return make_error(error_code_t::invalid_continuation);
        }
        return table_->resume(actor, continuation);
    }

    result_t<std::vector<term_t>> table_handle_t::select(actor_id_t actor, const match_spec_t& spec) {
        auto compiled = compiled_spec_t::compile(spec);
        if (!compiled) {
            return compiled.error();
        }
        return table_->select(actor, compiled.value());
    }

    result_t<page_t> table_handle_t::select(actor_id_t actor, const match_spec_t& spec, std::size_t limit) {
        auto compiled = compiled_spec_t::compile(spec);
        if (!compiled) {
            return compiled.error();
        }
        return table_->select(actor, query_kind::select, compiled.value(), limit);
    }

    result_t<page_t> table_handle_t::select(actor_id_t actor, const continuation_ptr& continuation) {
        if (continuation && continuation->kind() != query_kind::select) {
            return make_error(error_code_t::invalid_continuation);
        }
        return table_->resume(actor, continuation);
    }

    result_t<std::size_t> table_handle_t::select_delete(actor_id_t actor, const match_spec_t& spec) {
        auto compiled = compiled_spec_t::compile(spec);
        if (!compiled) {
            return compiled.error();
        }
        return table_->select_delete(actor, compiled.value());
    }

    result_t<records_t> table_handle_t::to_list(actor_id_t actor) { return table_->to_list(actor); }

    result_t<void> table_handle_t::delete_key(actor_id_t actor, const term_t& key) {
        return table_->delete_key(actor, key);
    }

    result_t<void> table_handle_t::delete_all(actor_id_t actor) { return table_->delete_all(actor); }

    result_t<void> table_handle_t::delete_table(actor_id_t actor) { return registry_->delete_table(actor, id()); }

    result_t<void> table_handle_t::rename(actor_id_t actor, const table_name_t& name) {
        return registry_->rename(actor, id(), name);
    }

    result_t<table_info_t> table_handle_t::info() const { return table_->info(); }

    result_t<void> table_handle_t::give_away(actor_id_t actor, actor_id_t target, term_t payload) {
        return registry_->give_away(actor, id(), target, std::move(payload));
    }

    void table_handle_t::insert_or_throw(actor_id_t actor, const record_t& record) {
        unwrap_or_throw(insert(actor, record), "insert");
    }

    void table_handle_t::insert_new_or_throw(actor_id_t actor, const record_t& record) {
        unwrap_or_throw(insert_new(actor, record), "insert_new");
    }

    void table_handle_t::insert_multi_or_throw(actor_id_t actor, const records_t& records) {
        unwrap_or_throw(insert_multi(actor, records), "insert_multi");
    }

    void table_handle_t::insert_multi_new_or_throw(actor_id_t actor, const records_t& records) {
        unwrap_or_throw(insert_multi_new(actor, records), "insert_multi_new");
    }

    std::optional<record_t> table_handle_t::lookup_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(lookup(actor, key), "lookup");
    }

    records_t table_handle_t::lookup_multi_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(lookup_multi(actor, key), "lookup_multi");
    }

    std::vector<term_t>
    table_handle_t::lookup_element_or_throw(actor_id_t actor, const term_t& key, std::size_t position) {
        return unwrap_or_throw(lookup_element(actor, key, position), "lookup_element");
    }

    bool table_handle_t::has_key_or_throw(actor_id_t actor, const term_t& key) {
        return unwrap_or_throw(has_key(actor, key), "has_key");
    }

    std::vector<term_t> table_handle_t::match_or_throw(actor_id_t actor, const pattern_t& pattern) {
        return unwrap_or_throw(match(actor, pattern), "match");
    }

    page_t table_handle_t::match_or_throw(actor_id_t actor, const pattern_t& pattern, std::size_t limit) {
        return unwrap_or_throw(match(actor, pattern, limit), "match");
    }

    page_t table_handle_t::match_or_throw(actor_id_t actor, const continuation_ptr& continuation) {
        return unwrap_or_throw(match(actor, continuation), "match");
    }

    std::vector<term_t> table_handle_t::select_or_throw(actor_id_t actor, const match_spec_t& spec) {
        return unwrap_or_throw(select(actor, spec), "select");
    }

    page_t table_handle_t::select_or_throw(actor_id_t actor, const match_spec_t& spec, std::size_t limit) {
        return unwrap_or_throw(select(actor, spec, limit), "select");
    }

    page_t table_handle_t::select_or_throw(actor_id_t actor, const continuation_ptr& continuation) {
        return unwrap_or_throw(select(actor, continuation), "select");
    }

    std::size_t table_handle_t::select_delete_or_throw(actor_id_t actor, const match_spec_t& spec) {
        return unwrap_or_throw(select_delete(actor, spec), "select_delete");
    }

    records_t table_handle_t::to_list_or_throw(actor_id_t actor) { return unwrap_or_throw(to_list(actor), "to_list"); }

    void table_handle_t::delete_key_or_throw(actor_id_t actor, const term_t& key) {
        unwrap_or_throw(delete_key(actor, key), "delete");
    }

    void table_handle_t::delete_all_or_throw(actor_id_t actor) { unwrap_or_throw(delete_all(actor), "delete_all"); }

    void table_handle_t::delete_table_or_throw(actor_id_t actor) { unwrap_or_throw(delete_table(actor), "delete"); }

    void table_handle_t::rename_or_throw(actor_id_t actor, const table_name_t& name) {
        unwrap_or_throw(rename(actor, name), "rename");
    }

    table_info_t table_handle_t::info_or_throw() const { return unwrap_or_throw(info(), "info"); }

    void table_handle_t::give_away_or_throw(actor_id_t actor, actor_id_t target, term_t payload) {
        unwrap_or_throw(give_away(actor, target, std::move(payload)), "give_away");
    }

    result_t<table_handle_t> create_table(table_registry_t* registry,
                                          actor_id_t actor,
                                          table_type type,
                                          const components::options::table_options_t& options) {
        auto created = registry->create_table(actor, type, options);
        if (!created) {
            return created.error();
        }
        return table_handle_t(registry, std::move(created).value());
    }

    result_t<table_handle_t> create_table(table_registry_t* registry,
                                          actor_id_t actor,
                                          table_type type,
                                          const components::options::option_list_t& options) {
        auto parsed = components::options::parse_table_options(options);
        if (!parsed) {
            return parsed.error();
        }
        return create_table(registry, actor, type, parsed.value());
    }

    table_handle_t create_table_or_throw(table_registry_t* registry,
                                         actor_id_t actor,
                                         table_type type,
                                         const components::options::table_options_t& options) {
        return unwrap_or_throw(create_table(registry, actor, type, options), "create_table");
    }

    result_t<table_handle_t> get_table(table_registry_t* registry, const table_ident_t& ident) {
        auto found = registry->find(ident);
        if (!found) {
            return found.error();
        }
        return table_handle_t(registry, std::move(found).value());
    }

    result_t<transfer_t> accept(table_registry_t* registry, actor_id_t actor, std::chrono::milliseconds timeout) {
        return registry->accept(actor, timeout);
    }

    transfer_t accept_or_throw(table_registry_t* registry, actor_id_t actor, std::chrono::milliseconds timeout) {
        return unwrap_or_throw(accept(registry, actor, timeout), "accept");
    }

} // namespace termstore
