#include "continuation.hpp"

namespace components::cursor {

    continuation_t::continuation_t(base::table_id_t table,
                                   query_kind kind,
                                   matcher::compiled_spec_ptr spec,
                                   std::optional<term_t> lookup_key,
                                   storage::position_t position,
                                   std::size_t limit)
        : table_(table)
        , kind_(kind)
        , spec_(std::move(spec))
        , lookup_key_(std::move(lookup_key))
        , position_(std::move(position))
        , limit_(limit) {}

    base::table_id_t continuation_t::table_id() const noexcept { return table_; }

    query_kind continuation_t::kind() const noexcept { return kind_; }

    const matcher::compiled_spec_ptr& continuation_t::spec() const noexcept { return spec_; }

    const std::optional<term_t>& continuation_t::lookup_key() const noexcept { return lookup_key_; }

    const storage::position_t& continuation_t::position() const noexcept { return position_; }

    std::size_t continuation_t::limit() const noexcept { return limit_; }

    continuation_ptr make_continuation(base::table_id_t table,
                                       query_kind kind,
                                       matcher::compiled_spec_ptr spec,
                                       std::optional<term_t> lookup_key,
                                       storage::position_t position,
                                       std::size_t limit) {
        return new continuation_t(table, kind, std::move(spec), std::move(lookup_key), std::move(position), limit);
    }

    page_t fetch_page(const storage::storage_t& storage, const continuation_t& start) {
        page_t page;
        page.results.reserve(start.limit());
        auto last = start.position();
        bool more = false;
        matcher::bindings_t scratch;

        // stops at the first match past the limit, so a full page followed by nothing reports the end
        auto visitor = [&](const storage::record_t& record, const storage::position_t& position) {
            auto result = start.spec()->evaluate(record, scratch);
            if (!result) {
                return true;
            }
            if (page.results.size() == start.limit()) {
                more = true;
                return false;
            }
            page.results.push_back(std::move(*result));
            last = position;
            return true;
        };

        if (start.lookup_key()) {
            storage.scan_key(*start.lookup_key(), start.position(), visitor);
        } else {
            storage.scan(start.position(), visitor);
        }

        if (more) {
            page.continuation =
                make_continuation(start.table_id(), start.kind(), start.spec(), start.lookup_key(), last, start.limit());
        }
        return page;
    }

    std::vector<term_t> fetch_all(const storage::storage_t& storage,
                                  const matcher::compiled_spec_t& spec,
                                  const std::optional<term_t>& lookup_key) {
        std::vector<term_t> results;
        matcher::bindings_t scratch;
        auto visitor = [&](const storage::record_t& record, const storage::position_t&) {
            if (auto result = spec.evaluate(record, scratch); result) {
                results.push_back(std::move(*result));
            }
            return true;
        };
        if (lookup_key) {
            storage.scan_key(*lookup_key, storage::position_t::start(), visitor);
        } else {
            storage.scan(storage::position_t::start(), visitor);
        }
        return results;
    }

} // namespace components::cursor
