#pragma once

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include <components/types/term.hpp>

#include "pattern.hpp"

namespace components::expressions {

    enum class guard_type : uint8_t
    {
        invalid,
        eq,
        ne,
        lt,
        lte,
        gt,
        gte,
        num_eq,
        num_ne,
        union_and,
        union_or,
        union_not,
        is_integer,
        is_float,
        is_number,
        is_atom,
        is_binary,
        is_tuple,
        is_list,
        all_true,
        all_false
    };

    /// Guard operand: a bound variable of the clause head or a constant term.
    class operand_t {
    public:
        operand_t(types::term_t value)
            : data_(std::move(value)) {}

        template<class T, std::enable_if_t<std::is_arithmetic_v<std::decay_t<T>>, int> = 0>
        operand_t(T value)
            : data_(types::term_t(value)) {}

        static operand_t from_variable(variable_t variable);

        bool is_variable() const noexcept { return std::holds_alternative<variable_t>(data_); }
        variable_t variable() const { return std::get<variable_t>(data_); }
        const types::term_t& value() const { return std::get<types::term_t>(data_); }

        std::string to_string() const;

    private:
        operand_t() = default;
        std::variant<variable_t, types::term_t> data_;
    };

    inline operand_t bound(variable_t variable) { return operand_t::from_variable(variable); }

    class guard_expression_t;
    using guard_expression_ptr = boost::intrusive_ptr<guard_expression_t>;

    class guard_expression_t final : public boost::intrusive_ref_counter<guard_expression_t> {
    public:
        guard_expression_t(const guard_expression_t&) = delete;
        guard_expression_t& operator=(const guard_expression_t&) = delete;
        ~guard_expression_t() = default;

        guard_expression_t(guard_type type, std::vector<operand_t> operands);
        guard_expression_t(guard_type type, std::vector<guard_expression_ptr> children);

        guard_type type() const noexcept;
        const std::vector<operand_t>& operands() const noexcept;
        const std::vector<guard_expression_ptr>& children() const noexcept;

        bool is_union() const;
        bool is_compare() const;
        bool is_type_test() const;

        types::hash_t hash() const;
        std::string to_string() const;

    private:
        guard_type type_;
        std::vector<operand_t> operands_;
        std::vector<guard_expression_ptr> children_;
    };

    guard_expression_ptr make_compare_guard(guard_type type, operand_t left, operand_t right);
    guard_expression_ptr make_type_guard(guard_type type, operand_t operand);
    guard_expression_ptr make_union_guard(guard_type type, std::vector<guard_expression_ptr> children);
    /// Generic form used by callers that assemble guards from data.
    /// Operand counts are checked when the match spec is validated.
    guard_expression_ptr make_guard(guard_type type, std::vector<operand_t> operands);

    bool is_union_guard(guard_type type);
    bool is_compare_guard(guard_type type);
    bool is_type_guard(guard_type type);
    guard_type get_guard_type(const std::string& key);

} // namespace components::expressions
