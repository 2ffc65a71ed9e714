#include "guard_expression.hpp"

#include <boost/container_hash/hash.hpp>
#include <magic_enum.hpp>

#include <sstream>

namespace components::expressions {

    operand_t operand_t::from_variable(variable_t variable) {
        operand_t result;
        result.data_ = variable;
        return result;
    }

    std::string operand_t::to_string() const {
        if (is_variable()) {
            return "$" + std::to_string(variable());
        }
        return value().to_string();
    }

    bool is_union_guard(guard_type type) {
        return type == guard_type::union_and || type == guard_type::union_or || type == guard_type::union_not;
    }

    bool is_compare_guard(guard_type type) { return type >= guard_type::eq && type <= guard_type::num_ne; }

    bool is_type_guard(guard_type type) { return type >= guard_type::is_integer && type <= guard_type::is_list; }

    guard_expression_t::guard_expression_t(guard_type type, std::vector<operand_t> operands)
        : type_(type)
        , operands_(std::move(operands)) {}

    guard_expression_t::guard_expression_t(guard_type type, std::vector<guard_expression_ptr> children)
        : type_(type)
        , children_(std::move(children)) {}

    guard_type guard_expression_t::type() const noexcept { return type_; }

    const std::vector<operand_t>& guard_expression_t::operands() const noexcept { return operands_; }

    const std::vector<guard_expression_ptr>& guard_expression_t::children() const noexcept { return children_; }

    bool guard_expression_t::is_union() const { return is_union_guard(type_); }

    bool guard_expression_t::is_compare() const { return is_compare_guard(type_); }

    bool guard_expression_t::is_type_test() const { return is_type_guard(type_); }

    types::hash_t guard_expression_t::hash() const {
        types::hash_t hash_{0};
        boost::hash_combine(hash_, static_cast<uint8_t>(type_));
        for (const auto& operand : operands_) {
            if (operand.is_variable()) {
                boost::hash_combine(hash_, operand.variable());
            } else {
                boost::hash_combine(hash_, operand.value().hash());
            }
        }
        for (const auto& child : children_) {
            boost::hash_combine(hash_, child ? child->hash() : 0);
        }
        return hash_;
    }

    std::string guard_expression_t::to_string() const {
        std::stringstream stream;
        stream << magic_enum::enum_name(type_);
        if (is_union()) {
            stream << ": [";
            for (std::size_t i = 0; i < children_.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << (children_[i] ? children_[i]->to_string() : "null");
            }
            stream << "]";
        } else if (!operands_.empty()) {
            stream << "(";
            for (std::size_t i = 0; i < operands_.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << operands_[i].to_string();
            }
            stream << ")";
        }
        return stream.str();
    }

    guard_expression_ptr make_compare_guard(guard_type type, operand_t left, operand_t right) {
        return new guard_expression_t(type, std::vector<operand_t>{std::move(left), std::move(right)});
    }

    guard_expression_ptr make_type_guard(guard_type type, operand_t operand) {
        return new guard_expression_t(type, std::vector<operand_t>{std::move(operand)});
    }

    guard_expression_ptr make_union_guard(guard_type type, std::vector<guard_expression_ptr> children) {
        return new guard_expression_t(type, std::move(children));
    }

    guard_expression_ptr make_guard(guard_type type, std::vector<operand_t> operands) {
        return new guard_expression_t(type, std::move(operands));
    }

    guard_type get_guard_type(const std::string& key) {
        if (key.empty()) {
            return guard_type::invalid;
        }
        auto type = magic_enum::enum_cast<guard_type>(key);
        if (type.has_value()) {
            return type.value();
        }
        if (key == "=:=") {
            return guard_type::eq;
        }
        if (key == "=/=") {
            return guard_type::ne;
        }
        if (key == "==") {
            return guard_type::num_eq;
        }
        if (key == "/=") {
            return guard_type::num_ne;
        }
        if (key == "<") {
            return guard_type::lt;
        }
        if (key == "=<") {
            return guard_type::lte;
        }
        if (key == ">") {
            return guard_type::gt;
        }
        if (key == ">=") {
            return guard_type::gte;
        }
        if (key == "and" || key == "andalso") {
            return guard_type::union_and;
        }
        if (key == "or" || key == "orelse") {
            return guard_type::union_or;
        }
        if (key == "not") {
            return guard_type::union_not;
        }
        return guard_type::invalid;
    }

} // namespace components::expressions
