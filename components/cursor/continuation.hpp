#pragma once

#include <optional>
#include <vector>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include <components/base/table_id.hpp>
#include <components/matcher/compiled_spec.hpp>
#include <components/storage/storage.hpp>

namespace components::cursor {

    using types::term_t;

    enum class query_kind : uint8_t
    {
        match,
        select
    };

    /// Resume point of a paginated match/select: the table and compiled query that produced it,
    /// the position of the last record returned and the page size.
    class continuation_t final : public boost::intrusive_ref_counter<continuation_t> {
    public:
        continuation_t(base::table_id_t table,
                       query_kind kind,
                       matcher::compiled_spec_ptr spec,
                       std::optional<term_t> lookup_key,
                       storage::position_t position,
                       std::size_t limit);

        base::table_id_t table_id() const noexcept;
        query_kind kind() const noexcept;
        const matcher::compiled_spec_ptr& spec() const noexcept;
        const std::optional<term_t>& lookup_key() const noexcept;
        const storage::position_t& position() const noexcept;
        std::size_t limit() const noexcept;

    private:
        base::table_id_t table_;
        query_kind kind_;
        matcher::compiled_spec_ptr spec_;
        std::optional<term_t> lookup_key_;
        storage::position_t position_;
        std::size_t limit_;
    };

    using continuation_ptr = boost::intrusive_ptr<continuation_t>;

    /// One page of results; a null continuation means the end of the table was reached.
    struct page_t {
        std::vector<term_t> results;
        continuation_ptr continuation;

        bool is_end_of_table() const noexcept { return !continuation; }
    };

    continuation_ptr make_continuation(base::table_id_t table,
                                       query_kind kind,
                                       matcher::compiled_spec_ptr spec,
                                       std::optional<term_t> lookup_key,
                                       storage::position_t position,
                                       std::size_t limit);

    /// Evaluates the query over storage from the resume point of start and returns at most
    /// start.limit() results. The caller holds the table lock.
    page_t fetch_page(const storage::storage_t& storage, const continuation_t& start);

    /// Unlimited evaluation in natural order.
    std::vector<term_t> fetch_all(const storage::storage_t& storage,
                                  const matcher::compiled_spec_t& spec,
                                  const std::optional<term_t>& lookup_key);

} // namespace components::cursor
