#pragma once

#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "types.hpp"

namespace components::types {

    /// Immutable tagged value stored in tables: numbers, atoms, binaries, tuples and lists.
    /// Records are tuples; keys may be any term.
    class term_t {
    public:
        term_t();
        term_t(bool value);
        term_t(const char*) = delete;

        template<class T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        term_t(T value)
            : type_(term_type::integer)
            , integer_(static_cast<int64_t>(value)) {}

        template<class T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
        term_t(T value)
            : type_(term_type::floating)
            , floating_(static_cast<double>(value)) {}

        term_t(const term_t&) = default;
        term_t(term_t&&) noexcept = default;
        term_t& operator=(const term_t&) = default;
        term_t& operator=(term_t&&) noexcept = default;
        ~term_t() = default;

        static term_t integer(int64_t value);
        static term_t floating(double value);
        static term_t atom(std::string_view name);
        static term_t binary(std::string_view bytes);
        static term_t tuple(std::vector<term_t> elements);
        static term_t tuple(std::initializer_list<term_t> elements);
        static term_t list(std::vector<term_t> elements);
        static term_t list(std::initializer_list<term_t> elements);
        static term_t nil();

        term_type type() const noexcept { return type_; }
        bool is_integer() const noexcept { return type_ == term_type::integer; }
        bool is_floating() const noexcept { return type_ == term_type::floating; }
        bool is_number() const noexcept { return types::is_number(type_); }
        bool is_atom() const noexcept { return type_ == term_type::atom; }
        bool is_atom(std::string_view name) const noexcept { return type_ == term_type::atom && text_ == name; }
        bool is_binary() const noexcept { return type_ == term_type::binary; }
        bool is_tuple() const noexcept { return type_ == term_type::tuple; }
        bool is_list() const noexcept { return type_ == term_type::list; }
        bool is_nil() const noexcept { return is_atom("nil"); }
        bool is_true() const noexcept { return is_atom("true"); }

        int64_t as_integer() const;
        double as_floating() const;
        const std::string& text() const;
        const std::vector<term_t>& children() const;

        /// Number of elements of a tuple or list, zero for scalars.
        std::size_t arity() const noexcept;
        /// 1-indexed element access; throws std::out_of_range past the arity.
        const term_t& element(std::size_t position) const;

        compare_t compare(const term_t& rhs) const;
        hash_t hash() const;
        std::string to_string() const;

        bool operator==(const term_t& rhs) const { return compare(rhs) == compare_t::equals; }
        bool operator!=(const term_t& rhs) const { return !(*this == rhs); }
        bool operator<(const term_t& rhs) const { return compare(rhs) == compare_t::less; }
        bool operator>(const term_t& rhs) const { return compare(rhs) == compare_t::more; }
        bool operator<=(const term_t& rhs) const { return compare(rhs) != compare_t::more; }
        bool operator>=(const term_t& rhs) const { return compare(rhs) != compare_t::less; }

    private:
        term_type type_;
        union {
            int64_t integer_;
            double floating_;
        };
        std::string text_;
        std::vector<term_t> children_;
    };

    struct term_hash_t {
        hash_t operator()(const term_t& term) const { return term.hash(); }
    };

    struct term_less_t {
        bool operator()(const term_t& lhs, const term_t& rhs) const { return lhs.compare(rhs) == compare_t::less; }
    };

    using record_t = term_t;
    using records_t = std::vector<record_t>;

    template<class... Args>
    term_t make_tuple(Args&&... args) {
        return term_t::tuple(std::vector<term_t>{term_t(std::forward<Args>(args))...});
    }

    template<class... Args>
    term_t make_list(Args&&... args) {
        return term_t::list(std::vector<term_t>{term_t(std::forward<Args>(args))...});
    }

    inline term_t atom(std::string_view name) { return term_t::atom(name); }
    inline term_t binary(std::string_view bytes) { return term_t::binary(bytes); }

    std::ostream& operator<<(std::ostream& stream, const term_t& term);

} // namespace components::types
