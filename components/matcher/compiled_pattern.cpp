#include "compiled_pattern.hpp"

#include <algorithm>

namespace components::matcher {

    namespace {

        void collect_variables(const expressions::pattern_t& pattern, std::vector<variable_t>& variables) {
            switch (pattern.kind()) {
                case pattern_kind::bind:
                    variables.push_back(pattern.variable());
                    break;
                case pattern_kind::tuple:
                case pattern_kind::list:
                    for (const auto& child : pattern.children()) {
                        collect_variables(child, variables);
                    }
                    break;
                default:
                    break;
            }
        }

    } // namespace

    compiled_pattern_t::compiled_pattern_t(const expressions::pattern_t& pattern) {
        collect_variables(pattern, variables_);
        std::sort(variables_.begin(), variables_.end());
        variables_.erase(std::unique(variables_.begin(), variables_.end()), variables_.end());
        root_ = build(pattern);
    }

    compiled_pattern_t::node_t compiled_pattern_t::build(const expressions::pattern_t& pattern) const {
        node_t node{pattern.kind(), term_t(), 0, {}};
        switch (pattern.kind()) {
            case pattern_kind::literal:
                node.value = pattern.value();
                break;
            case pattern_kind::bind:
                node.slot = *slot_of(pattern.variable());
                break;
            case pattern_kind::tuple:
            case pattern_kind::list:
                node.children.reserve(pattern.children().size());
                for (const auto& child : pattern.children()) {
                    node.children.push_back(build(child));
                }
                break;
            case pattern_kind::ignore:
                break;
        }
        return node;
    }

    bool compiled_pattern_t::match(const term_t& value, bindings_t& bindings) const {
        bindings.assign(variables_.size(), std::nullopt);
        return match_node(root_, value, bindings);
    }

    bool compiled_pattern_t::match_node(const node_t& node, const term_t& value, bindings_t& bindings) {
        switch (node.kind) {
            case pattern_kind::literal:
                return node.value == value;
            case pattern_kind::ignore:
                return true;
            case pattern_kind::bind: {
                auto& slot = bindings[node.slot];
                if (slot) {
                    return *slot == value;
                }
                slot = value;
                return true;
            }
            case pattern_kind::tuple:
            case pattern_kind::list: {
                bool kind_matches = node.kind == pattern_kind::tuple ? value.is_tuple() : value.is_list();
                if (!kind_matches || value.arity() != node.children.size()) {
                    return false;
                }
                const auto& elements = value.children();
                for (std::size_t i = 0; i < node.children.size(); ++i) {
                    if (!match_node(node.children[i], elements[i], bindings)) {
                        return false;
                    }
                }
                return true;
            }
        }
        return false;
    }

    std::optional<std::size_t> compiled_pattern_t::slot_of(variable_t variable) const {
        auto it = std::lower_bound(variables_.begin(), variables_.end(), variable);
        if (it == variables_.end() || *it != variable) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - variables_.begin());
    }

    std::optional<term_t> compiled_pattern_t::literal_at(std::size_t keypos) const {
        if (root_.kind != pattern_kind::tuple || keypos == 0 || keypos > root_.children.size()) {
            return std::nullopt;
        }
        const auto& node = root_.children[keypos - 1];
        if (node.kind != pattern_kind::literal) {
            return std::nullopt;
        }
        return node.value;
    }

    term_t compiled_pattern_t::binding_list(const bindings_t& bindings) const {
        std::vector<term_t> values;
        values.reserve(bindings.size());
        for (const auto& binding : bindings) {
            values.push_back(binding.value_or(term_t()));
        }
        return term_t::list(std::move(values));
    }

} // namespace components::matcher
