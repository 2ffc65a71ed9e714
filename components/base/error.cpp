#include "error.hpp"

#include <magic_enum.hpp>

namespace components::base {

    error_t::error_t(error_code_t type)
        : type(type) {}

    error_t::error_t(error_code_t type, const std::string& what)
        : type(type)
        , what(what) {}

    std::string_view error_name(error_code_t type) {
        auto name = magic_enum::enum_name(type);
        if (name.empty()) {
            return "unknown_error";
        }
        return name;
    }

    std::string to_string(const error_t& error) {
        std::string result("{error, ");
        result.append(error_name(error.type));
        result.push_back('}');
        return result;
    }

} // namespace components::base
