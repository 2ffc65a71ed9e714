#include "table_options.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace components::options {

    using base::error_code_t;
    using base::make_error;
    using types::term_t;

    namespace {

        base::error_t invalid_option(std::string_view name, const option_value_t& value) {
            if (std::holds_alternative<heir_t>(value)) {
                const auto& heir = std::get<heir_t>(value);
                return make_error(error_code_t::invalid_option,
                                  fmt::format("{{{}, {{<actor.{}>, {}}}}}",
                                              name,
                                              heir.actor.data(),
                                              heir.data.to_string()));
            }
            return make_error(error_code_t::invalid_option,
                              fmt::format("{{{}, {}}}", name, std::get<term_t>(value).to_string()));
        }

        std::optional<bool> as_boolean(const option_value_t& value) {
            if (!std::holds_alternative<term_t>(value)) {
                return std::nullopt;
            }
            const auto& term = std::get<term_t>(value);
            if (term.is_atom("true")) {
                return true;
            }
            if (term.is_atom("false")) {
                return false;
            }
            return std::nullopt;
        }

        std::optional<protection_t> as_protection(const option_value_t& value) {
            if (!std::holds_alternative<term_t>(value)) {
                return std::nullopt;
            }
            const auto& term = std::get<term_t>(value);
            if (term.is_atom("private")) {
                return protection_t::private_;
            }
            if (term.is_atom("protected")) {
                return protection_t::protected_;
            }
            if (term.is_atom("public")) {
                return protection_t::public_;
            }
            return std::nullopt;
        }

        // the options every table kind shares; returns false when the name is not one of them
        template<class Options>
        bool apply_common(Options& target, const option_t& option, std::optional<base::error_t>& error) {
            const auto& [name, value] = option;
            if (name == "name") {
                const auto* term = std::get_if<term_t>(&value);
                if (!term || !term->is_atom()) {
                    error = invalid_option(name, value);
                } else if (term->is_nil()) {
                    target.name.reset();
                } else {
                    target.name = term->text();
                }
                return true;
            }
            if (name == "protection" || name == "access") {
                if (auto protection = as_protection(value); protection) {
                    target.protection = *protection;
                } else {
                    error = invalid_option(name, value);
                }
                return true;
            }
            if (name == "heir") {
                if (const auto* heir = std::get_if<heir_t>(&value); heir && heir->actor.is_valid()) {
                    target.heir = *heir;
                } else if (const auto* term = std::get_if<term_t>(&value); term && term->is_atom("none")) {
                    target.heir.reset();
                } else {
                    error = invalid_option(name, value);
                }
                return true;
            }
            if (name == "read_concurrency" || name == "write_concurrency" || name == "compressed") {
                auto flag = as_boolean(value);
                if (!flag) {
                    error = invalid_option(name, value);
                } else if (name == "read_concurrency") {
                    target.read_concurrency = *flag;
                } else if (name == "write_concurrency") {
                    target.write_concurrency = *flag;
                } else {
                    target.compressed = *flag;
                }
                return true;
            }
            return false;
        }

        bool apply_keypos(table_options_t& target, const option_t& option, std::optional<base::error_t>& error) {
            const auto& [name, value] = option;
            if (name != "keypos") {
                return false;
            }
            const auto* term = std::get_if<term_t>(&value);
            if (!term || !term->is_integer() || term->as_integer() < 1) {
                error = invalid_option(name, value);
            } else {
                target.keypos = static_cast<std::size_t>(term->as_integer());
            }
            return true;
        }

        bool apply_flag(bool& target,
                        std::string_view flag_name,
                        const option_t& option,
                        std::optional<base::error_t>& error) {
            const auto& [name, value] = option;
            if (name != flag_name) {
                return false;
            }
            if (auto flag = as_boolean(value); flag) {
                target = *flag;
            } else {
                error = invalid_option(name, value);
            }
            return true;
        }

    } // namespace

    set_options_t key_value_set_options_t::to_set_options() const {
        set_options_t result;
        result.name = name;
        result.protection = protection;
        result.heir = heir;
        result.keypos = 1;
        result.read_concurrency = read_concurrency;
        result.write_concurrency = write_concurrency;
        result.compressed = compressed;
        result.ordered = ordered;
        return result;
    }

    std::string_view type_name(table_type type) { return magic_enum::enum_name(type); }

    std::string_view protection_name(protection_t protection) {
        auto name = magic_enum::enum_name(protection);
        if (!name.empty() && name.back() == '_') {
            name.remove_suffix(1);
        }
        return name;
    }

    bool is_set_type(table_type type) { return type == table_type::set || type == table_type::ordered_set; }

    bool is_bag_type(table_type type) { return type == table_type::bag || type == table_type::duplicate_bag; }

    base::result_t<void> validate(const table_options_t& options) {
        if (options.name && options.name->empty()) {
            return make_error(error_code_t::invalid_option, "{name, ''}");
        }
        if (options.heir && !options.heir->actor.is_valid()) {
            return invalid_option("heir", *options.heir);
        }
        if (options.keypos < 1) {
            return make_error(error_code_t::invalid_option, fmt::format("{{keypos, {}}}", options.keypos));
        }
        return base::success();
    }

    base::result_t<table_options_t> parse_table_options(const option_list_t& options) {
        table_options_t result;
        for (const auto& option : options) {
            std::optional<base::error_t> error;
            if (!apply_common(result, option, error) && !apply_keypos(result, option, error)) {
                return invalid_option(option.first, option.second);
            }
            if (error) {
                return *error;
            }
        }
        return result;
    }

    base::result_t<set_options_t> parse_set_options(const option_list_t& options) {
        set_options_t result;
        for (const auto& option : options) {
            std::optional<base::error_t> error;
            if (!apply_common(result, option, error) && !apply_keypos(result, option, error) &&
                !apply_flag(result.ordered, "ordered", option, error)) {
                return invalid_option(option.first, option.second);
            }
            if (error) {
                return *error;
            }
        }
        return result;
    }

    base::result_t<bag_options_t> parse_bag_options(const option_list_t& options) {
        bag_options_t result;
        for (const auto& option : options) {
            std::optional<base::error_t> error;
            if (!apply_common(result, option, error) && !apply_keypos(result, option, error) &&
                !apply_flag(result.duplicate, "duplicate", option, error)) {
                return invalid_option(option.first, option.second);
            }
            if (error) {
                return *error;
            }
        }
        return result;
    }

    base::result_t<key_value_set_options_t> parse_key_value_set_options(const option_list_t& options) {
        key_value_set_options_t result;
        for (const auto& option : options) {
            std::optional<base::error_t> error;
            if (!apply_common(result, option, error) && !apply_flag(result.ordered, "ordered", option, error)) {
                return invalid_option(option.first, option.second);
            }
            if (error) {
                return *error;
            }
        }
        return result;
    }

} // namespace components::options
