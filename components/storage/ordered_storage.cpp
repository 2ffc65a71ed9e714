#include "ordered_storage.hpp"

#include <iterator>

namespace components::storage {

    ordered_storage_t::ordered_storage_t(std::pmr::memory_resource* resource, std::size_t keypos)
        : storage_t(resource, options::table_type::ordered_set, keypos)
        , records_(resource) {}

    std::optional<term_t> ordered_storage_t::first() const {
        if (records_.empty()) {
            return std::nullopt;
        }
        return records_.begin()->first;
    }

    std::optional<term_t> ordered_storage_t::last() const {
        if (records_.empty()) {
            return std::nullopt;
        }
        return records_.rbegin()->first;
    }

    std::optional<term_t> ordered_storage_t::next(const term_t& key) const {
        auto it = records_.upper_bound(key);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->first;
    }

    std::optional<term_t> ordered_storage_t::previous(const term_t& key) const {
        auto it = records_.lower_bound(key);
        if (it == records_.begin()) {
            return std::nullopt;
        }
        return std::prev(it)->first;
    }

    std::size_t ordered_storage_t::size_impl() const { return records_.size(); }

    bool ordered_storage_t::contains_impl(const term_t& key) const { return records_.find(key) != records_.end(); }

    records_t ordered_storage_t::lookup_impl(const term_t& key) const {
        auto it = records_.find(key);
        if (it == records_.end()) {
            return {};
        }
        return {it->second};
    }

    void ordered_storage_t::insert_impl(const record_t& record, undo_log_t& undo) {
        undo_entry_t entry{0, key_of(record), std::nullopt};
        auto it = records_.find(*entry.key);
        if (it == records_.end()) {
            records_.emplace(*entry.key, record);
        } else {
            record_t replaced = record;
            std::swap(it->second, replaced);
            entry.previous = std::move(replaced);
        }
        undo.push_back(std::move(entry));
    }

    void ordered_storage_t::undo_impl(undo_entry_t& entry) noexcept {
        auto it = records_.find(*entry.key);
        if (entry.previous) {
            std::swap(it->second, *entry.previous);
        } else {
            records_.erase(it);
        }
    }

    std::optional<base::error_code_t> ordered_storage_t::conflict_impl(const record_t& record) const {
        if (contains_impl(key_of(record))) {
            return base::error_code_t::key_already_exists;
        }
        return std::nullopt;
    }

    std::size_t ordered_storage_t::erase_impl(const term_t& key) { return records_.erase(key); }

    std::size_t ordered_storage_t::erase_if_impl(const record_predicate_t& predicate) {
        std::size_t count = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (predicate(it->second)) {
                it = records_.erase(it);
                ++count;
            } else {
                ++it;
            }
        }
        return count;
    }

    void ordered_storage_t::clear_impl() { records_.clear(); }

    void ordered_storage_t::scan_impl(const position_t& after, const visitor_t& visitor) const {
        auto it = after.key() ? records_.upper_bound(*after.key()) : records_.begin();
        for (; it != records_.end(); ++it) {
            if (!visitor(it->second, position_t::after_key(it->first))) {
                return;
            }
        }
    }

    void ordered_storage_t::scan_key_impl(const term_t& key, const position_t& after, const visitor_t& visitor) const {
        if (after.key() && *after.key() >= key) {
            return;
        }
        auto it = records_.find(key);
        if (it != records_.end()) {
            visitor(it->second, position_t::after_key(it->first));
        }
    }

} // namespace components::storage
