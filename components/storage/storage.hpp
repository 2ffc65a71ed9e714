#pragma once

#include <cstdint>
#include <functional>
#include <memory_resource>
#include <optional>
#include <vector>

#include <components/base/error.hpp>
#include <components/options/table_options.hpp>
#include <components/types/term.hpp>
#include <core/pmr.hpp>

namespace components::storage {

    using types::record_t;
    using types::records_t;
    using types::term_t;

    /// Resume point of a scan: the insertion sequence of the last visited record for hash layouts,
    /// the last visited key for the ordered layout. A start position precedes every record.
    class position_t {
    public:
        position_t() = default;

        static position_t start() { return {}; }
        static position_t after_seq(uint64_t seq);
        static position_t after_key(term_t key);

        bool is_start() const noexcept { return !seq_ && !key_; }
        std::optional<uint64_t> seq() const noexcept { return seq_; }
        const std::optional<term_t>& key() const noexcept { return key_; }

    private:
        std::optional<uint64_t> seq_;
        std::optional<term_t> key_;
    };

    /// Returns false to stop the scan.
    using visitor_t = std::function<bool(const record_t& record, const position_t& position)>;
    using record_predicate_t = std::function<bool(const record_t& record)>;

    /// What one insert changed: the slot it appended to or replaced, and the replaced record.
    /// Reverting an entry never allocates.
    struct undo_entry_t {
        uint64_t seq{0};
        std::optional<term_t> key;
        std::optional<record_t> previous;
    };
    using undo_log_t = std::vector<undo_entry_t>;

    /// Physical record storage of one table. Callers hold the table lock and have validated
    /// record arity against keypos before any mutation.
    class storage_t {
    public:
        storage_t() = delete;
        storage_t(const storage_t&) = delete;
        storage_t& operator=(const storage_t&) = delete;
        virtual ~storage_t();

        options::table_type type() const noexcept;
        std::size_t keypos() const noexcept;
        std::pmr::memory_resource* resource() const noexcept;

        const term_t& key_of(const record_t& record) const;

        std::size_t size() const;
        bool contains(const term_t& key) const;
        records_t lookup(const term_t& key) const;

        /// All or nothing: when an insert throws, the records already applied are reverted.
        void insert(const records_t& records);
        /// Conflict of the batch with the stored records, if any: key_already_exists or record_already_exists.
        std::optional<base::error_code_t> find_conflict(const records_t& records) const;

        std::size_t erase(const term_t& key);
        std::size_t erase_if(const record_predicate_t& predicate);
        void clear();

        records_t to_list() const;

        /// Visits records strictly after position in natural order.
        void scan(const position_t& after, const visitor_t& visitor) const;
        /// Visits the records stored under key, in natural order, strictly after position.
        void scan_key(const term_t& key, const position_t& after, const visitor_t& visitor) const;

    protected:
        storage_t(std::pmr::memory_resource* resource, options::table_type type, std::size_t keypos);

    private:
        virtual std::size_t size_impl() const = 0;
        virtual bool contains_impl(const term_t& key) const = 0;
        virtual records_t lookup_impl(const term_t& key) const = 0;
        /// Either throws leaving the storage unchanged, or applies the record and appends at most one entry.
        virtual void insert_impl(const record_t& record, undo_log_t& undo) = 0;
        virtual void undo_impl(undo_entry_t& entry) noexcept = 0;
        virtual std::optional<base::error_code_t> conflict_impl(const record_t& record) const = 0;
        virtual std::size_t erase_impl(const term_t& key) = 0;
        virtual std::size_t erase_if_impl(const record_predicate_t& predicate) = 0;
        virtual void clear_impl() = 0;
        virtual void scan_impl(const position_t& after, const visitor_t& visitor) const = 0;
        virtual void scan_key_impl(const term_t& key, const position_t& after, const visitor_t& visitor) const = 0;

        std::pmr::memory_resource* resource_;
        options::table_type type_;
        std::size_t keypos_;
    };

    using storage_ptr = core::pmr::unique_ptr<storage_t>;

    storage_ptr make_storage(std::pmr::memory_resource* resource, options::table_type type, std::size_t keypos);

} // namespace components::storage
