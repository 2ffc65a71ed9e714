#pragma once

#include <cstddef>
#include <cstdint>

namespace components::types {

    using hash_t = std::size_t;

    enum class term_type : uint8_t
    {
        integer,
        floating,
        atom,
        tuple,
        list,
        binary
    };

    enum class compare_t : int8_t
    {
        less = -1,
        equals = 0,
        more = 1
    };

    // rank of a type inside term order: numbers < atoms < tuples < lists < binaries
    constexpr int order_rank(term_type type) noexcept {
        switch (type) {
            case term_type::integer:
            case term_type::floating:
                return 0;
            case term_type::atom:
                return 1;
            case term_type::tuple:
                return 2;
            case term_type::list:
                return 3;
            case term_type::binary:
                return 4;
        }
        return 5;
    }

    constexpr bool is_number(term_type type) noexcept {
        return type == term_type::integer || type == term_type::floating;
    }

} // namespace components::types
