#pragma once

#include <cstdint>
#include <functional>
#include <ostream>

namespace components::base {

    /// Identity of a concurrent client. Issued by the table registry, never reused.
    class actor_id_t {
    public:
        constexpr actor_id_t() = default;
        constexpr explicit actor_id_t(uint64_t id)
            : id_(id) {}

        constexpr uint64_t data() const noexcept { return id_; }
        constexpr bool is_valid() const noexcept { return id_ != 0; }

        constexpr bool operator==(const actor_id_t& rhs) const noexcept { return id_ == rhs.id_; }
        constexpr bool operator!=(const actor_id_t& rhs) const noexcept { return id_ != rhs.id_; }
        constexpr bool operator<(const actor_id_t& rhs) const noexcept { return id_ < rhs.id_; }

    private:
        uint64_t id_{0};
    };

    inline std::ostream& operator<<(std::ostream& stream, const actor_id_t& id) {
        stream << "<actor." << id.data() << ">";
        return stream;
    }

} // namespace components::base

template<>
struct std::hash<components::base::actor_id_t> {
    std::size_t operator()(const components::base::actor_id_t& id) const noexcept {
        return std::hash<uint64_t>()(id.data());
    }
};
