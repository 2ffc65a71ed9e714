#pragma once

#include "storage.hpp"

#include <map>

namespace components::storage {

    /// Ordered unique-key layout: one record per key, iterated in term order of the keys.
    class ordered_storage_t final : public storage_t {
    public:
        ordered_storage_t(std::pmr::memory_resource* resource, std::size_t keypos);
        ~ordered_storage_t() override = default;

        std::optional<term_t> first() const;
        std::optional<term_t> last() const;
        /// Smallest stored key strictly greater than key; key itself need not be stored.
        std::optional<term_t> next(const term_t& key) const;
        /// Largest stored key strictly less than key.
        std::optional<term_t> previous(const term_t& key) const;

    private:
        std::size_t size_impl() const override;
        bool contains_impl(const term_t& key) const override;
        records_t lookup_impl(const term_t& key) const override;
        void insert_impl(const record_t& record, undo_log_t& undo) override;
        void undo_impl(undo_entry_t& entry) noexcept override;
        std::optional<base::error_code_t> conflict_impl(const record_t& record) const override;
        std::size_t erase_impl(const term_t& key) override;
        std::size_t erase_if_impl(const record_predicate_t& predicate) override;
        void clear_impl() override;
        void scan_impl(const position_t& after, const visitor_t& visitor) const override;
        void scan_key_impl(const term_t& key, const position_t& after, const visitor_t& visitor) const override;

        std::pmr::map<term_t, record_t, types::term_less_t> records_;
    };

} // namespace components::storage
