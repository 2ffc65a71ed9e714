#include "hash_storage.hpp"

#include <algorithm>

namespace components::storage {

    hash_storage_t::hash_storage_t(std::pmr::memory_resource* resource,
                                   options::table_type type,
                                   std::size_t keypos)
        : storage_t(resource, type, keypos)
        , records_(resource)
        , index_(resource) {}

    std::size_t hash_storage_t::size_impl() const { return records_.size(); }

    bool hash_storage_t::contains_impl(const term_t& key) const { return index_.find(key) != index_.end(); }

    records_t hash_storage_t::lookup_impl(const term_t& key) const {
        records_t result;
        auto it = index_.find(key);
        if (it == index_.end()) {
            return result;
        }
        result.reserve(it->second.size());
        for (auto seq : it->second) {
            result.push_back(records_.at(seq));
        }
        return result;
    }

    void hash_storage_t::insert_impl(const record_t& record, undo_log_t& undo) {
        const auto& key = key_of(record);
        auto it = index_.find(key);
        if (it == index_.end()) {
            undo.push_back({append(key, record), std::nullopt, std::nullopt});
            return;
        }
        switch (type()) {
            case options::table_type::set: {
                auto seq = it->second.front();
                record_t replaced = record;
                std::swap(records_.find(seq)->second, replaced);
                undo.push_back({seq, std::nullopt, std::move(replaced)});
                break;
            }
            case options::table_type::bag:
                if (!holds_record(it->second, record)) {
                    undo.push_back({append(key, record), std::nullopt, std::nullopt});
                }
                break;
            default:
                undo.push_back({append(key, record), std::nullopt, std::nullopt});
                break;
        }
    }

    void hash_storage_t::undo_impl(undo_entry_t& entry) noexcept {
        auto it = records_.find(entry.seq);
        if (entry.previous) {
            std::swap(it->second, *entry.previous);
            return;
        }
        // entries are reverted newest first, so an appended seq is the last one of its key
        auto index_it = index_.find(key_of(it->second));
        index_it->second.pop_back();
        if (index_it->second.empty()) {
            index_.erase(index_it);
        }
        records_.erase(it);
    }

    std::optional<base::error_code_t> hash_storage_t::conflict_impl(const record_t& record) const {
        auto it = index_.find(key_of(record));
        if (it == index_.end()) {
            return std::nullopt;
        }
        if (type() == options::table_type::duplicate_bag) {
            if (holds_record(it->second, record)) {
                return base::error_code_t::record_already_exists;
            }
            return std::nullopt;
        }
        return base::error_code_t::key_already_exists;
    }

    std::size_t hash_storage_t::erase_impl(const term_t& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return 0;
        }
        auto count = it->second.size();
        for (auto seq : it->second) {
            records_.erase(seq);
        }
        index_.erase(it);
        return count;
    }

    std::size_t hash_storage_t::erase_if_impl(const record_predicate_t& predicate) {
        std::size_t count = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (!predicate(it->second)) {
                ++it;
                continue;
            }
            auto index_it = index_.find(key_of(it->second));
            auto& seqs = index_it->second;
            seqs.erase(std::remove(seqs.begin(), seqs.end(), it->first), seqs.end());
            if (seqs.empty()) {
                index_.erase(index_it);
            }
            it = records_.erase(it);
            ++count;
        }
        return count;
    }

    void hash_storage_t::clear_impl() {
        records_.clear();
        index_.clear();
    }

    void hash_storage_t::scan_impl(const position_t& after, const visitor_t& visitor) const {
        auto it = after.seq() ? records_.upper_bound(*after.seq()) : records_.begin();
        for (; it != records_.end(); ++it) {
            if (!visitor(it->second, position_t::after_seq(it->first))) {
                return;
            }
        }
    }

    void hash_storage_t::scan_key_impl(const term_t& key, const position_t& after, const visitor_t& visitor) const {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return;
        }
        for (auto seq : it->second) {
            if (after.seq() && seq <= *after.seq()) {
                continue;
            }
            if (!visitor(records_.at(seq), position_t::after_seq(seq))) {
                return;
            }
        }
    }

    uint64_t hash_storage_t::append(const term_t& key, const record_t& record) {
        auto [slot, created] = index_.try_emplace(key);
        auto& seqs = slot->second;
        try {
            if (seqs.size() == seqs.capacity()) {
                seqs.reserve(std::max<std::size_t>(4, seqs.capacity() * 2));
            }
            records_.emplace(next_seq_, record);
        } catch (const std::exception&) {
            if (created) {
                index_.erase(slot);
            }
            throw;
        }
        seqs.push_back(next_seq_);
        return next_seq_++;
    }

    bool hash_storage_t::holds_record(const seq_list_t& seqs, const record_t& record) const {
        return std::any_of(seqs.begin(), seqs.end(), [this, &record](uint64_t seq) {
            return records_.at(seq) == record;
        });
    }

} // namespace components::storage
