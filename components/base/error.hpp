#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace components::base {

    enum class error_code_t : int32_t
    {
        // structure and configuration
        invalid_option = 1,
        table_already_exists,
        invalid_keypos,
        invalid_type,
        // table existence
        table_not_found,
        // access control
        read_protected,
        write_protected,
        // record shape
        invalid_record,
        record_too_small,
        // uniqueness
        key_already_exists,
        record_already_exists,
        multi_found,
        invalid_set,
        // navigation
        empty_table,
        end_of_table,
        start_of_table,
        set_not_ordered,
        // matching
        invalid_continuation,
        invalid_select_spec,
        invalid_limit,
        invalid_key,
        key_not_found,
        position_out_of_bounds,
        // ownership
        recipient_already_owns_table,
        recipient_not_alive,
        sender_not_table_owner,
        timeout,
        actor_not_alive,

        unknown_error = 100
    };

    struct error_t {
        error_code_t type;
        std::string what;

        explicit error_t(error_code_t type);
        explicit error_t(error_code_t type, const std::string& what);

        bool operator==(const error_t& rhs) const { return type == rhs.type; }
        bool operator!=(const error_t& rhs) const { return type != rhs.type; }
    };

    std::string_view error_name(error_code_t type);

    /// Renders "{error, <name>}".
    std::string to_string(const error_t& error);

} // namespace components::base
