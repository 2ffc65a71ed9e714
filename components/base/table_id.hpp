#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <variant>

namespace components::base {

    /// Reference identity of a table, unique per creation and kept across renames.
    class table_id_t {
    public:
        constexpr table_id_t() = default;
        constexpr explicit table_id_t(uint64_t id)
            : id_(id) {}

        constexpr uint64_t data() const noexcept { return id_; }
        constexpr bool is_valid() const noexcept { return id_ != 0; }

        constexpr bool operator==(const table_id_t& rhs) const noexcept { return id_ == rhs.id_; }
        constexpr bool operator!=(const table_id_t& rhs) const noexcept { return id_ != rhs.id_; }
        constexpr bool operator<(const table_id_t& rhs) const noexcept { return id_ < rhs.id_; }

    private:
        uint64_t id_{0};
    };

    using table_name_t = std::string;

    /// A table addressed either by reference or by registered name.
    class table_ident_t {
    public:
        table_ident_t(table_id_t id)
            : data_(id) {}
        table_ident_t(table_name_t name)
            : data_(std::move(name)) {}
        table_ident_t(const char* name)
            : data_(table_name_t(name)) {}

        bool is_id() const noexcept { return std::holds_alternative<table_id_t>(data_); }
        bool is_name() const noexcept { return std::holds_alternative<table_name_t>(data_); }
        table_id_t id() const { return std::get<table_id_t>(data_); }
        const table_name_t& name() const { return std::get<table_name_t>(data_); }

        std::string to_string() const {
            if (is_id()) {
                return "#Ref<" + std::to_string(id().data()) + ">";
            }
            return name();
        }

    private:
        std::variant<table_id_t, table_name_t> data_;
    };

    inline std::ostream& operator<<(std::ostream& stream, const table_id_t& id) {
        stream << "#Ref<" << id.data() << ">";
        return stream;
    }

} // namespace components::base

template<>
struct std::hash<components::base::table_id_t> {
    std::size_t operator()(const components::base::table_id_t& id) const noexcept {
        return std::hash<uint64_t>()(id.data());
    }
};
