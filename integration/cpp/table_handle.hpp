#pragma once

#include <optional>
#include <vector>

#include <components/expressions/match_spec.hpp>
#include <components/expressions/pattern.hpp>
#include <services/registry/registry.hpp>

namespace termstore {

    using components::base::actor_id_t;
    using components::base::error_code_t;
    using components::base::raised_error_t;
    using components::base::result_t;
    using components::base::table_id_t;
    using components::base::table_ident_t;
    using components::base::table_name_t;
    using components::cursor::continuation_ptr;
    using components::cursor::page_t;
    using components::expressions::match_spec_t;
    using components::expressions::pattern_t;
    using components::options::table_type;
    using components::types::record_t;
    using components::types::records_t;
    using components::types::term_t;
    using services::registry::table_registry_t;
    using services::registry::transfer_t;
    using services::table::table_info_t;
    using services::table::table_ptr;

    /// Untyped handle over one table of any layout: the generic record operations, matching and
    /// table-level calls. Every call returns a result_t and has an _or_throw twin that raises
    /// raised_error_t instead.
    class table_handle_t {
    public:
        table_handle_t(table_registry_t* registry, table_ptr table);

        table_id_t id() const;
        table_type type() const;
        const table_ptr& get_table() const noexcept { return table_; }
        table_registry_t* registry() const noexcept { return registry_; }

        result_t<void> insert(actor_id_t actor, const record_t& record);
        result_t<void> insert_new(actor_id_t actor, const record_t& record);
        result_t<void> insert_multi(actor_id_t actor, const records_t& records);
        result_t<void> insert_multi_new(actor_id_t actor, const records_t& records);
        /// At most one record; multi_found when several records share the key.
        result_t<std::optional<record_t>> lookup(actor_id_t actor, const term_t& key);
        result_t<records_t> lookup_multi(actor_id_t actor, const term_t& key);
        result_t<std::vector<term_t>> lookup_element(actor_id_t actor, const term_t& key, std::size_t position);
        result_t<bool> has_key(actor_id_t actor, const term_t& key);

        result_t<std::vector<term_t>> match(actor_id_t actor, const pattern_t& pattern);
        result_t<page_t> match(actor_id_t actor, const pattern_t& pattern, std::size_t limit);
        result_t<page_t> match(actor_id_t actor, const continuation_ptr& continuation);
        result_t<std::vector<term_t>> select(actor_id_t actor, const match_spec_t& spec);
        result_t<page_t> select(actor_id_t actor, const match_spec_t& spec, std::size_t limit);
        result_t<page_t> select(actor_id_t actor, const continuation_ptr& continuation);
        result_t<std::size_t> select_delete(actor_id_t actor, const match_spec_t& spec);

        result_t<records_t> to_list(actor_id_t actor);
        result_t<void> delete_key(actor_id_t actor, const term_t& key);
        result_t<void> delete_all(actor_id_t actor);
        result_t<void> delete_table(actor_id_t actor);
        result_t<void> rename(actor_id_t actor, const table_name_t& name);
        result_t<table_info_t> info() const;
        result_t<void> give_away(actor_id_t actor, actor_id_t target, term_t payload);

        void insert_or_throw(actor_id_t actor, const record_t& record);
        void insert_new_or_throw(actor_id_t actor, const record_t& record);
        void insert_multi_or_throw(actor_id_t actor, const records_t& records);
        void insert_multi_new_or_throw(actor_id_t actor, const records_t& records);
        std::optional<record_t> lookup_or_throw(actor_id_t actor, const term_t& key);
        records_t lookup_multi_or_throw(actor_id_t actor, const term_t& key);
        std::vector<term_t> lookup_element_or_throw(actor_id_t actor, const term_t& key, std::size_t position);
        bool has_key_or_throw(actor_id_t actor, const term_t& key);
        std::vector<term_t> match_or_throw(actor_id_t actor, const pattern_t& pattern);
        page_t match_or_throw(actor_id_t actor, const pattern_t& pattern, std::size_t limit);
        page_t match_or_throw(actor_id_t actor, const continuation_ptr& continuation);
        std::vector<term_t> select_or_throw(actor_id_t actor, const match_spec_t& spec);
        page_t select_or_throw(actor_id_t actor, const match_spec_t& spec, std::size_t limit);
        page_t select_or_throw(actor_id_t actor, const continuation_ptr& continuation);
        std::size_t select_delete_or_throw(actor_id_t actor, const match_spec_t& spec);
        records_t to_list_or_throw(actor_id_t actor);
        void delete_key_or_throw(actor_id_t actor, const term_t& key);
        void delete_all_or_throw(actor_id_t actor);
        void delete_table_or_throw(actor_id_t actor);
        void rename_or_throw(actor_id_t actor, const table_name_t& name);
        table_info_t info_or_throw() const;
        void give_away_or_throw(actor_id_t actor, actor_id_t target, term_t payload);

    protected:
        table_registry_t* registry_;
        table_ptr table_;
    };

    /// Creates a table of any layout. Raising twin: create_table_or_throw.
    result_t<table_handle_t> create_table(table_registry_t* registry,
                                          actor_id_t actor,
                                          table_type type,
                                          const components::options::table_options_t& options);
    result_t<table_handle_t> create_table(table_registry_t* registry,
                                          actor_id_t actor,
                                          table_type type,
                                          const components::options::option_list_t& options);
    table_handle_t create_table_or_throw(table_registry_t* registry,
                                         actor_id_t actor,
                                         table_type type,
                                         const components::options::table_options_t& options);

    /// Handle over an existing table addressed by id or name.
    result_t<table_handle_t> get_table(table_registry_t* registry, const table_ident_t& ident);

    /// Blocks until a table is handed to actor or timeout elapses.
    result_t<transfer_t> accept(table_registry_t* registry, actor_id_t actor, std::chrono::milliseconds timeout);
    transfer_t accept_or_throw(table_registry_t* registry, actor_id_t actor, std::chrono::milliseconds timeout);

} // namespace termstore
