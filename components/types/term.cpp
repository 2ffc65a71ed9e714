#include "term.hpp"

#include <cmath>
#include <stdexcept>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

namespace components::types {

    namespace {

        constexpr double int64_upper_bound = 9223372036854775808.0; // 2^63

        template<class T>
        compare_t compare_values(const T& lhs, const T& rhs) {
            if (lhs < rhs) {
                return compare_t::less;
            }
            if (rhs < lhs) {
                return compare_t::more;
            }
            return compare_t::equals;
        }

        compare_t invert(compare_t value) { return static_cast<compare_t>(-static_cast<int8_t>(value)); }

        // NaN is placed above every other number so the order stays total
        compare_t compare_floating(double lhs, double rhs) {
            if (std::isnan(lhs) || std::isnan(rhs)) {
                if (std::isnan(lhs) && std::isnan(rhs)) {
                    return compare_t::equals;
                }
                return std::isnan(lhs) ? compare_t::more : compare_t::less;
            }
            return compare_values(lhs, rhs);
        }

        // exact comparison without converting the integer to double; on a numeric tie the integer is less
        compare_t compare_integer_floating(int64_t lhs, double rhs) {
            if (std::isnan(rhs) || rhs >= int64_upper_bound) {
                return compare_t::less;
            }
            if (rhs < -int64_upper_bound) {
                return compare_t::more;
            }
            auto whole = std::trunc(rhs);
            auto whole_int = static_cast<int64_t>(whole);
            if (lhs != whole_int) {
                return lhs < whole_int ? compare_t::less : compare_t::more;
            }
            auto fraction = rhs - whole;
            if (fraction < 0) {
                return compare_t::more;
            }
            return compare_t::less;
        }

        compare_t compare_sequences(const std::vector<term_t>& lhs, const std::vector<term_t>& rhs) {
            auto size = std::min(lhs.size(), rhs.size());
            for (std::size_t i = 0; i < size; ++i) {
                auto result = lhs[i].compare(rhs[i]);
                if (result != compare_t::equals) {
                    return result;
                }
            }
            return compare_values(lhs.size(), rhs.size());
        }

        void append_escaped(std::string& out, const std::string& text) {
            for (auto c : text) {
                if (c == '"' || c == '\\') {
                    out.push_back('\\');
                }
                out.push_back(c);
            }
        }

        void append_term(std::string& out, const term_t& term);

        void append_sequence(std::string& out, const std::vector<term_t>& children, char open, char close) {
            out.push_back(open);
            for (std::size_t i = 0; i < children.size(); ++i) {
                if (i > 0) {
                    out.append(", ");
                }
                append_term(out, children[i]);
            }
            out.push_back(close);
        }

        void append_term(std::string& out, const term_t& term) {
            switch (term.type()) {
                case term_type::integer:
                    out.append(fmt::format("{}", term.as_integer()));
                    break;
                case term_type::floating:
                    out.append(fmt::format("{}", term.as_floating()));
                    break;
                case term_type::atom:
                    out.append(term.text());
                    break;
                case term_type::binary:
                    out.append("<<\"");
                    append_escaped(out, term.text());
                    out.append("\">>");
                    break;
                case term_type::tuple:
                    append_sequence(out, term.children(), '{', '}');
                    break;
                case term_type::list:
                    append_sequence(out, term.children(), '[', ']');
                    break;
            }
        }

    } // namespace

    term_t::term_t()
        : type_(term_type::atom)
        , integer_(0)
        , text_("nil") {}

    term_t::term_t(bool value)
        : type_(term_type::atom)
        , integer_(0)
        , text_(value ? "true" : "false") {}

    term_t term_t::integer(int64_t value) { return term_t(value); }

    term_t term_t::floating(double value) { return term_t(value); }

    term_t term_t::atom(std::string_view name) {
        term_t result;
        result.text_ = std::string(name);
        return result;
    }

    term_t term_t::binary(std::string_view bytes) {
        term_t result;
        result.type_ = term_type::binary;
        result.text_ = std::string(bytes);
        return result;
    }

    term_t term_t::tuple(std::vector<term_t> elements) {
        term_t result;
        result.type_ = term_type::tuple;
        result.text_.clear();
        result.children_ = std::move(elements);
        return result;
    }

    term_t term_t::tuple(std::initializer_list<term_t> elements) { return tuple(std::vector<term_t>(elements)); }

    term_t term_t::list(std::vector<term_t> elements) {
        term_t result;
        result.type_ = term_type::list;
        result.text_.clear();
        result.children_ = std::move(elements);
        return result;
    }

    term_t term_t::list(std::initializer_list<term_t> elements) { return list(std::vector<term_t>(elements)); }

    term_t term_t::nil() { return term_t(); }

    int64_t term_t::as_integer() const {
        if (type_ != term_type::integer) {
            throw std::logic_error("term_t::as_integer on " + to_string());
        }
        return integer_;
    }

    double term_t::as_floating() const {
        if (type_ == term_type::integer) {
            return static_cast<double>(integer_);
        }
        if (type_ != term_type::floating) {
            throw std::logic_error("term_t::as_floating on " + to_string());
        }
        return floating_;
    }

    const std::string& term_t::text() const { return text_; }

    const std::vector<term_t>& term_t::children() const { return children_; }

    std::size_t term_t::arity() const noexcept { return children_.size(); }

    const term_t& term_t::element(std::size_t position) const {
        if (position == 0 || position > children_.size()) {
            throw std::out_of_range(fmt::format("term_t::element {} of {}", position, to_string()));
        }
        return children_[position - 1];
    }

    compare_t term_t::compare(const term_t& rhs) const {
        if (is_number() && rhs.is_number()) {
            if (type_ == term_type::integer && rhs.type_ == term_type::integer) {
                return compare_values(integer_, rhs.integer_);
            }
            if (type_ == term_type::floating && rhs.type_ == term_type::floating) {
                return compare_floating(floating_, rhs.floating_);
            }
            if (type_ == term_type::integer) {
                return compare_integer_floating(integer_, rhs.floating_);
            }
            return invert(compare_integer_floating(rhs.integer_, floating_));
        }

        auto lhs_rank = order_rank(type_);
        auto rhs_rank = order_rank(rhs.type_);
        if (lhs_rank != rhs_rank) {
            return lhs_rank < rhs_rank ? compare_t::less : compare_t::more;
        }

        switch (type_) {
            case term_type::atom:
            case term_type::binary:
                return compare_values(text_.compare(rhs.text_), 0);
            case term_type::tuple:
                if (children_.size() != rhs.children_.size()) {
                    return compare_values(children_.size(), rhs.children_.size());
                }
                return compare_sequences(children_, rhs.children_);
            case term_type::list:
                return compare_sequences(children_, rhs.children_);
            default:
                return compare_t::equals;
        }
    }

    hash_t term_t::hash() const {
        hash_t hash_{0};
        boost::hash_combine(hash_, static_cast<uint8_t>(type_));
        switch (type_) {
            case term_type::integer:
                boost::hash_combine(hash_, integer_);
                break;
            case term_type::floating:
                // 0.0 and -0.0 compare equal and must hash alike
                boost::hash_combine(hash_, floating_ == 0.0 ? 0.0 : floating_);
                break;
            case term_type::atom:
            case term_type::binary:
                boost::hash_combine(hash_, text_);
                break;
            case term_type::tuple:
            case term_type::list:
                for (const auto& child : children_) {
                    boost::hash_combine(hash_, child.hash());
                }
                break;
        }
        return hash_;
    }

    std::string term_t::to_string() const {
        std::string result;
        append_term(result, *this);
        return result;
    }

    std::ostream& operator<<(std::ostream& stream, const term_t& term) {
        stream << term.to_string();
        return stream;
    }

} // namespace components::types
