#include "storage.hpp"
#include "hash_storage.hpp"
#include "ordered_storage.hpp"

#include <exception>

namespace components::storage {

    position_t position_t::after_seq(uint64_t seq) {
        position_t position;
        position.seq_ = seq;
        return position;
    }

    position_t position_t::after_key(term_t key) {
        position_t position;
        position.key_ = std::move(key);
        return position;
    }

    storage_t::storage_t(std::pmr::memory_resource* resource, options::table_type type, std::size_t keypos)
        : resource_(resource)
        , type_(type)
        , keypos_(keypos) {}

    storage_t::~storage_t() = default;

    options::table_type storage_t::type() const noexcept { return type_; }

    std::size_t storage_t::keypos() const noexcept { return keypos_; }

    std::pmr::memory_resource* storage_t::resource() const noexcept { return resource_; }

    const term_t& storage_t::key_of(const record_t& record) const { return record.element(keypos_); }

    std::size_t storage_t::size() const { return size_impl(); }

    bool storage_t::contains(const term_t& key) const { return contains_impl(key); }

    records_t storage_t::lookup(const term_t& key) const { return lookup_impl(key); }

    void storage_t::insert(const records_t& records) {
        undo_log_t undo;
        undo.reserve(records.size());
        try {
            for (const auto& record : records) {
                insert_impl(record, undo);
            }
        } catch (const std::exception&) {
            for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
                undo_impl(*it);
            }
            throw;
        }
    }

    std::optional<base::error_code_t> storage_t::find_conflict(const records_t& records) const {
        for (const auto& record : records) {
            if (auto conflict = conflict_impl(record); conflict) {
                return conflict;
            }
        }
        return std::nullopt;
    }

    std::size_t storage_t::erase(const term_t& key) { return erase_impl(key); }

    std::size_t storage_t::erase_if(const record_predicate_t& predicate) { return erase_if_impl(predicate); }

    void storage_t::clear() { clear_impl(); }

    records_t storage_t::to_list() const {
        records_t result;
        result.reserve(size_impl());
        scan_impl(position_t::start(), [&result](const record_t& record, const position_t&) {
            result.push_back(record);
            return true;
        });
        return result;
    }

    void storage_t::scan(const position_t& after, const visitor_t& visitor) const { scan_impl(after, visitor); }

    void storage_t::scan_key(const term_t& key, const position_t& after, const visitor_t& visitor) const {
        scan_key_impl(key, after, visitor);
    }

    storage_ptr make_storage(std::pmr::memory_resource* resource, options::table_type type, std::size_t keypos) {
        if (type == options::table_type::ordered_set) {
            return core::pmr::make_unique_as<storage_t, ordered_storage_t>(resource, keypos);
        }
        return core::pmr::make_unique_as<storage_t, hash_storage_t>(resource, type, keypos);
    }

} // namespace components::storage
