#pragma once

#include "set.hpp"

namespace termstore {

    /// Set of {key, value} pairs keyed on the first element.
    class key_value_set_t {
    public:
        static result_t<key_value_set_t> create(table_registry_t* registry,
                                                actor_id_t actor,
                                                const components::options::key_value_set_options_t& options);
        /// keypos is rejected with invalid_option.
        static result_t<key_value_set_t> create(table_registry_t* registry,
                                                actor_id_t actor,
                                                const components::options::option_list_t& options);
        static key_value_set_t create_or_throw(table_registry_t* registry,
                                               actor_id_t actor,
                                               const components::options::key_value_set_options_t& options);
        /// Fails invalid_type for bags and invalid_keypos unless the set is keyed on position 1.
        static result_t<key_value_set_t> wrap_existing(table_registry_t* registry, const table_ident_t& ident);
        static key_value_set_t wrap_existing_or_throw(table_registry_t* registry, const table_ident_t& ident);

        table_id_t id() const;
        const set_t& get_set() const noexcept { return set_; }
        const table_ptr& get_table() const noexcept { return set_.get_table(); }

        result_t<void> put(actor_id_t actor, const term_t& key, const term_t& value);
        result_t<void> put_new(actor_id_t actor, const term_t& key, const term_t& value);
        /// The value stored under key, or fallback.
        result_t<term_t> get(actor_id_t actor, const term_t& key, const term_t& fallback = term_t::nil());
        result_t<bool> has_key(actor_id_t actor, const term_t& key);
        result_t<void> delete_key(actor_id_t actor, const term_t& key);
        result_t<void> delete_all(actor_id_t actor);
        result_t<records_t> to_list(actor_id_t actor);
        result_t<void> delete_table(actor_id_t actor);
        result_t<table_info_t> info() const;

        void put_or_throw(actor_id_t actor, const term_t& key, const term_t& value);
        void put_new_or_throw(actor_id_t actor, const term_t& key, const term_t& value);
        term_t get_or_throw(actor_id_t actor, const term_t& key, const term_t& fallback = term_t::nil());
        bool has_key_or_throw(actor_id_t actor, const term_t& key);
        void delete_key_or_throw(actor_id_t actor, const term_t& key);
        void delete_all_or_throw(actor_id_t actor);
        records_t to_list_or_throw(actor_id_t actor);
        void delete_table_or_throw(actor_id_t actor);
        table_info_t info_or_throw() const;

    private:
        explicit key_value_set_t(set_t set);

        set_t set_;
    };

} // namespace termstore
