#pragma once

#include <optional>
#include <vector>

#include <components/expressions/pattern.hpp>
#include <components/types/term.hpp>

namespace components::matcher {

    using expressions::pattern_kind;
    using expressions::variable_t;
    using types::term_t;

    /// Per-record scratch space: one slot per distinct variable of the pattern.
    using bindings_t = std::vector<std::optional<term_t>>;

    /// Pattern prepared once per query: variables are mapped to dense slots in ascending variable order.
    class compiled_pattern_t {
    public:
        explicit compiled_pattern_t(const expressions::pattern_t& pattern);

        /// Binds variables into bindings; a variable seen twice must bind equal terms.
        bool match(const term_t& value, bindings_t& bindings) const;

        const std::vector<variable_t>& variables() const noexcept { return variables_; }
        std::optional<std::size_t> slot_of(variable_t variable) const;
        std::size_t slot_count() const noexcept { return variables_.size(); }

        /// Literal the pattern requires at position keypos of a record, when there is one.
        std::optional<term_t> literal_at(std::size_t keypos) const;

        /// Bound values in ascending variable order.
        term_t binding_list(const bindings_t& bindings) const;

    private:
        struct node_t {
            pattern_kind kind;
            term_t value;
            std::size_t slot{0};
            std::vector<node_t> children;
        };

        node_t build(const expressions::pattern_t& pattern) const;
        static bool match_node(const node_t& node, const term_t& value, bindings_t& bindings);

        std::vector<variable_t> variables_;
        node_t root_;
    };

} // namespace components::matcher
