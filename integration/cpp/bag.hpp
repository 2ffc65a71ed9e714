#pragma once

#include "table_handle.hpp"

#include <functional>

#include <components/options/table_options.hpp>

namespace termstore {

    /// Multi-key table. A plain bag skips exact duplicate records, a duplicate bag keeps them.
    class bag_t : public table_handle_t {
    public:
        /// Receives the records under a key, nullopt when there are none. Returning records stores them
        /// in place of the current ones, returning nullopt removes the key.
        using update_fn_t = std::function<std::optional<records_t>(const std::optional<records_t>& current)>;

        static result_t<bag_t> create(table_registry_t* registry,
                                      actor_id_t actor,
                                      const components::options::bag_options_t& options);
        static result_t<bag_t> create(table_registry_t* registry,
                                      actor_id_t actor,
                                      const components::options::option_list_t& options);
        static bag_t create_or_throw(table_registry_t* registry,
                                     actor_id_t actor,
                                     const components::options::bag_options_t& options);
        /// Fails invalid_type when the table is a set.
        static result_t<bag_t> wrap_existing(table_registry_t* registry, const table_ident_t& ident);
        static bag_t wrap_existing_or_throw(table_registry_t* registry, const table_ident_t& ident);

        bool allows_duplicates() const;

        result_t<void> add(actor_id_t actor, const record_t& record);
        result_t<void> add(actor_id_t actor, const records_t& records);
        result_t<void> add_new(actor_id_t actor, const record_t& record);
        result_t<void> add_new(actor_id_t actor, const records_t& records);
        /// Every record stored under key, in insertion order.
        result_t<records_t> lookup(actor_id_t actor, const term_t& key);
        /// Like lookup, but nullopt instead of an empty list.
        result_t<std::optional<records_t>> fetch(actor_id_t actor, const term_t& key);
        /// Removes key in one step and returns what it held.
        result_t<std::optional<records_t>> pop(actor_id_t actor, const term_t& key);
        /// Returns the records held before the update. update runs under the table write lock and
        /// must not use this bag.
        result_t<std::optional<records_t>>
        get_and_update(actor_id_t actor, const term_t& key, const update_fn_t& update);

        void add_or_throw(actor_id_t actor, const record_t& record);
        void add_or_throw(actor_id_t actor, const records_t& records);
        void add_new_or_throw(actor_id_t actor, const record_t& record);
        void add_new_or_throw(actor_id_t actor, const records_t& records);
        records_t lookup_or_throw(actor_id_t actor, const term_t& key);
        std::optional<records_t> fetch_or_throw(actor_id_t actor, const term_t& key);
        std::optional<records_t> pop_or_throw(actor_id_t actor, const term_t& key);
        std::optional<records_t>
        get_and_update_or_throw(actor_id_t actor, const term_t& key, const update_fn_t& update);

    private:
        bag_t(table_registry_t* registry, table_ptr table);
    };

} // namespace termstore
