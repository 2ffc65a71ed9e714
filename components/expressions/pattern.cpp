#include "pattern.hpp"

#include <sstream>

namespace components::expressions {

    pattern_t::pattern_t()
        : kind_(pattern_kind::ignore) {}

    pattern_t::pattern_t(types::term_t value)
        : kind_(pattern_kind::literal)
        , value_(std::move(value)) {}

    pattern_t pattern_t::literal(types::term_t value) { return pattern_t(std::move(value)); }

    pattern_t pattern_t::bind(variable_t variable) {
        pattern_t result;
        result.kind_ = pattern_kind::bind;
        result.variable_ = variable;
        return result;
    }

    pattern_t pattern_t::ignore() { return pattern_t(); }

    pattern_t pattern_t::tuple(std::vector<pattern_t> elements) {
        pattern_t result;
        result.kind_ = pattern_kind::tuple;
        result.children_ = std::move(elements);
        return result;
    }

    pattern_t pattern_t::list(std::vector<pattern_t> elements) {
        pattern_t result;
        result.kind_ = pattern_kind::list;
        result.children_ = std::move(elements);
        return result;
    }

    std::string pattern_t::to_string() const {
        std::stringstream stream;
        switch (kind_) {
            case pattern_kind::literal:
                stream << value_;
                break;
            case pattern_kind::bind:
                stream << "$" << variable_;
                break;
            case pattern_kind::ignore:
                stream << "_";
                break;
            case pattern_kind::tuple:
            case pattern_kind::list:
                stream << (kind_ == pattern_kind::tuple ? "{" : "[");
                for (std::size_t i = 0; i < children_.size(); ++i) {
                    if (i > 0) {
                        stream << ", ";
                    }
                    stream << children_[i].to_string();
                }
                stream << (kind_ == pattern_kind::tuple ? "}" : "]");
                break;
        }
        return stream.str();
    }

} // namespace components::expressions
