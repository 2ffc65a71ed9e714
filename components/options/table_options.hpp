#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <components/base/actor_id.hpp>
#include <components/base/result.hpp>
#include <components/types/term.hpp>

namespace components::options {

    enum class table_type : uint8_t
    {
        set,
        ordered_set,
        bag,
        duplicate_bag
    };

    enum class protection_t : uint8_t
    {
        private_,
        protected_,
        public_
    };

    /// Actor that inherits the table when its owner terminates, with the data handed over alongside.
    struct heir_t {
        base::actor_id_t actor;
        types::term_t data;
    };

    struct table_options_t {
        std::optional<std::string> name;
        protection_t protection = protection_t::protected_;
        std::optional<heir_t> heir;
        std::size_t keypos = 1;
        bool read_concurrency = false;
        bool write_concurrency = false;
        bool compressed = false;
    };

    struct set_options_t : table_options_t {
        bool ordered = false;
    };

    struct bag_options_t : table_options_t {
        bool duplicate = false;
    };

    // key/value sets always store {key, value} with the key in position 1
    struct key_value_set_options_t {
        std::optional<std::string> name;
        protection_t protection = protection_t::protected_;
        std::optional<heir_t> heir;
        bool read_concurrency = false;
        bool write_concurrency = false;
        bool compressed = false;
        bool ordered = false;

        set_options_t to_set_options() const;
    };

    using option_value_t = std::variant<types::term_t, heir_t>;
    using option_t = std::pair<std::string, option_value_t>;
    using option_list_t = std::vector<option_t>;

    std::string_view type_name(table_type type);
    std::string_view protection_name(protection_t protection);
    bool is_set_type(table_type type);
    bool is_bag_type(table_type type);

    /// Checks every typed field; reports the first illegal one as invalid_option.
    base::result_t<void> validate(const table_options_t& options);

    base::result_t<set_options_t> parse_set_options(const option_list_t& options);
    base::result_t<bag_options_t> parse_bag_options(const option_list_t& options);
    base::result_t<key_value_set_options_t> parse_key_value_set_options(const option_list_t& options);
    base::result_t<table_options_t> parse_table_options(const option_list_t& options);

} // namespace components::options
