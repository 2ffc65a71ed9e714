#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include <services/table/table.hpp>

namespace services::registry {

    using components::base::actor_id_t;
    using components::types::term_t;
    using table::table_ptr;

    /// Ownership transfer request queued for the receiving actor. A zero ticket marks an inheritance
    /// notice: ownership already moved when the previous owner terminated.
    struct transfer_request_t {
        table_ptr table;
        actor_id_t from;
        term_t payload;
        uint64_t ticket{0};
    };

    /// Per-actor queue of transfer requests. accept() is the only blocking call in the store and it
    /// blocks here, outside every table and registry lock.
    class mailbox_t final : public boost::intrusive_ref_counter<mailbox_t> {
    public:
        using clock_type = std::chrono::steady_clock;

        void push(transfer_request_t request);
        std::optional<transfer_request_t> pop_until(clock_type::time_point deadline);
        void close();
        bool is_closed() const;
        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<transfer_request_t> queue_;
        bool closed_{false};
    };

    using mailbox_ptr = boost::intrusive_ptr<mailbox_t>;

} // namespace services::registry
