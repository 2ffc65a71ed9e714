#include "mailbox.hpp"

namespace services::registry {

    void mailbox_t::push(transfer_request_t request) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.push_back(std::move(request));
        }
        ready_.notify_one();
    }

    std::optional<transfer_request_t> mailbox_t::pop_until(clock_type::time_point deadline) {
        std::unique_lock lock(mutex_);
        ready_.wait_until(lock, deadline, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        auto request = std::move(queue_.front());
        queue_.pop_front();
        return request;
    }

    void mailbox_t::close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            queue_.clear();
        }
        ready_.notify_all();
    }

    bool mailbox_t::is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    std::size_t mailbox_t::size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

} // namespace services::registry
