#pragma once

#include "table_handle.hpp"

#include <components/options/table_options.hpp>

namespace termstore {

    /// Unique-key table, hash or term-ordered. put replaces a record with the same key.
    class set_t : public table_handle_t {
    public:
        static result_t<set_t> create(table_registry_t* registry,
                                      actor_id_t actor,
                                      const components::options::set_options_t& options);
        static result_t<set_t> create(table_registry_t* registry,
                                      actor_id_t actor,
                                      const components::options::option_list_t& options);
        static set_t create_or_throw(table_registry_t* registry,
                                     actor_id_t actor,
                                     const components::options::set_options_t& options);
        /// Fails invalid_type when the table is a bag.
        static result_t<set_t> wrap_existing(table_registry_t* registry, const table_ident_t& ident);
        static set_t wrap_existing_or_throw(table_registry_t* registry, const table_ident_t& ident);

        bool is_ordered() const;

        result_t<void> put(actor_id_t actor, const record_t& record);
        result_t<void> put(actor_id_t actor, const records_t& records);
        result_t<void> put_new(actor_id_t actor, const record_t& record);
        result_t<void> put_new(actor_id_t actor, const records_t& records);
        /// The record stored under key, or fallback when there is none.
        result_t<term_t> get(actor_id_t actor, const term_t& key, const term_t& fallback = term_t::nil());
        result_t<term_t> get_element(actor_id_t actor, const term_t& key, std::size_t position);

        result_t<term_t> first(actor_id_t actor);
        result_t<term_t> last(actor_id_t actor);
        result_t<term_t> next(actor_id_t actor, const term_t& key);
        result_t<term_t> previous(actor_id_t actor, const term_t& key);

        void put_or_throw(actor_id_t actor, const record_t& record);
        void put_or_throw(actor_id_t actor, const records_t& records);
        void put_new_or_throw(actor_id_t actor, const record_t& record);
        void put_new_or_throw(actor_id_t actor, const records_t& records);
        term_t get_or_throw(actor_id_t actor, const term_t& key, const term_t& fallback = term_t::nil());
        term_t get_element_or_throw(actor_id_t actor, const term_t& key, std::size_t position);
        term_t first_or_throw(actor_id_t actor);
        term_t last_or_throw(actor_id_t actor);
        term_t next_or_throw(actor_id_t actor, const term_t& key);
        term_t previous_or_throw(actor_id_t actor, const term_t& key);

    private:
        set_t(table_registry_t* registry, table_ptr table);
    };

} // namespace termstore
