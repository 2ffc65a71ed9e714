#pragma once

#include "storage.hpp"

#include <map>
#include <unordered_map>
#include <vector>

namespace components::storage {

    /// Unordered layouts (set, bag, duplicate_bag). Records keep their insertion slot: iteration
    /// follows insertion sequence and a replacing put reuses the slot of the record it replaces.
    class hash_storage_t final : public storage_t {
    public:
        hash_storage_t(std::pmr::memory_resource* resource, options::table_type type, std::size_t keypos);
        ~hash_storage_t() override = default;

    private:
        using seq_list_t = std::pmr::vector<uint64_t>;

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

        uint64_t append(const term_t& key, const record_t& record);
        bool holds_record(const seq_list_t& seqs, const record_t& record) const;

        std::pmr::map<uint64_t, record_t> records_;
        std::pmr::unordered_map<term_t, seq_list_t, types::term_hash_t> index_;
        uint64_t next_seq_{1};
    };

} // namespace components::storage
