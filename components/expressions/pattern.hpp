#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include <components/types/term.hpp>

namespace components::expressions {

    using variable_t = uint32_t;

    enum class pattern_kind : uint8_t
    {
        literal,
        bind,
        ignore,
        tuple,
        list
    };

    /// Match pattern: literal terms, numbered bind variables, wildcards and nested tuple/list patterns.
    class pattern_t {
    public:
        pattern_t();
        pattern_t(types::term_t value);

        template<class T,
                 std::enable_if_t<std::is_arithmetic_v<std::decay_t<T>> && !std::is_same_v<std::decay_t<T>, pattern_t>,
                                  int> = 0>
        pattern_t(T value)
            : pattern_t(types::term_t(value)) {}

        static pattern_t literal(types::term_t value);
        static pattern_t bind(variable_t variable);
        static pattern_t ignore();
        static pattern_t tuple(std::vector<pattern_t> elements);
        static pattern_t list(std::vector<pattern_t> elements);

        pattern_kind kind() const noexcept { return kind_; }
        const types::term_t& value() const noexcept { return value_; }
        variable_t variable() const noexcept { return variable_; }
        const std::vector<pattern_t>& children() const noexcept { return children_; }

        std::string to_string() const;

    private:
        pattern_kind kind_;
        types::term_t value_;
        variable_t variable_{0};
        std::vector<pattern_t> children_;
    };

    inline pattern_t var(variable_t variable) { return pattern_t::bind(variable); }
    inline pattern_t any() { return pattern_t::ignore(); }

    template<class... Args>
    pattern_t tuple_pattern(Args&&... args) {
        return pattern_t::tuple(std::vector<pattern_t>{pattern_t(std::forward<Args>(args))...});
    }

    template<class... Args>
    pattern_t list_pattern(Args&&... args) {
        return pattern_t::list(std::vector<pattern_t>{pattern_t(std::forward<Args>(args))...});
    }

} // namespace components::expressions
