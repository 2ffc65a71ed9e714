#pragma once

#include <functional>
#include <memory_resource>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include <components/base/actor_id.hpp>
#include <components/base/result.hpp>
#include <components/base/table_id.hpp>
#include <components/cursor/continuation.hpp>
#include <components/log/log.hpp>
#include <components/matcher/compiled_spec.hpp>
#include <components/options/table_options.hpp>
#include <components/storage/storage.hpp>

namespace services::table {

    using components::base::actor_id_t;
    using components::base::error_code_t;
    using components::base::result_t;
    using components::base::table_id_t;
    using components::options::heir_t;
    using components::options::protection_t;
    using components::options::table_type;
    using components::types::record_t;
    using components::types::records_t;
    using components::types::term_t;

    struct table_info_t {
        table_id_t id;
        std::optional<std::string> name;
        bool named{false};
        table_type type{table_type::set};
        protection_t protection{protection_t::protected_};
        actor_id_t owner;
        std::optional<actor_id_t> heir;
        std::size_t keypos{1};
        std::size_t size{0};
        bool read_concurrency{false};
        bool write_concurrency{false};
        bool compressed{false};
    };

    /// Receives the records stored under a key (empty when there are none) and returns the records
    /// to store under it instead, or nullopt to leave the key removed.
    using update_fn_t = std::function<std::optional<records_t>(const records_t& current)>;

    /// One table: record storage behind a reader/writer lock, its configuration and the owning actor.
    /// Every operation runs the access gate in order: table existence, protection, record shape.
    class table_t final : public boost::intrusive_ref_counter<table_t> {
    public:
        table_t(std::pmr::memory_resource* resource,
                table_id_t id,
                table_type type,
                const components::options::table_options_t& options,
                actor_id_t owner,
                log_t& log);
        ~table_t();

        table_id_t id() const noexcept;
        table_type type() const noexcept;
        std::size_t keypos() const noexcept;

        result_t<void> insert(actor_id_t actor, const records_t& records);
        result_t<void> insert_new(actor_id_t actor, const records_t& records);
        result_t<records_t> lookup(actor_id_t actor, const term_t& key);
        result_t<std::vector<term_t>> lookup_element(actor_id_t actor, const term_t& key, std::size_t position);
        result_t<bool> has_key(actor_id_t actor, const term_t& key);
        result_t<void> delete_key(actor_id_t actor, const term_t& key);
        result_t<void> delete_all(actor_id_t actor);
        /// Removes key and returns the records it held, under one write lock.
        result_t<records_t> take(actor_id_t actor, const term_t& key);
        /// Replaces the records under key with what update returns and yields the previous records.
        /// update runs under the write lock and must not call back into this table.
        result_t<records_t> update_key(actor_id_t actor, const term_t& key, const update_fn_t& update);
        result_t<records_t> to_list(actor_id_t actor);

        result_t<term_t> first(actor_id_t actor);
        result_t<term_t> last(actor_id_t actor);
        result_t<term_t> next(actor_id_t actor, const term_t& key);
        result_t<term_t> previous(actor_id_t actor, const term_t& key);

        result_t<std::vector<term_t>> select(actor_id_t actor, const components::matcher::compiled_spec_ptr& spec);
        result_t<components::cursor::page_t> select(actor_id_t actor,
                                                    components::cursor::query_kind kind,
                                                    const components::matcher::compiled_spec_ptr& spec,
                                                    std::size_t limit);
        result_t<components::cursor::page_t> resume(actor_id_t actor,
                                                    const components::cursor::continuation_ptr& continuation);
        result_t<std::size_t> select_delete(actor_id_t actor, const components::matcher::compiled_spec_ptr& spec);

        result_t<table_info_t> info() const;

        // ownership and identity; mutated by the registry only
        actor_id_t owner() const;
        std::optional<heir_t> heir() const;
        std::optional<std::string> name() const;
        bool is_dropped() const;
        result_t<void> check_write(actor_id_t actor) const;
        void set_owner(actor_id_t owner);
        void set_name(std::optional<std::string> name);
        /// Releases the records; every later operation reports table_not_found.
        void drop();

    private:
        enum class access_t : uint8_t
        {
            read,
            write
        };

        result_t<void> gate(actor_id_t actor, access_t access) const;
        result_t<void> check_records(const records_t& records) const;
        result_t<components::cursor::page_t> fetch(const components::cursor::continuation_t& start) const;

        template<class T, class F>
        result_t<T> guarded(const char* operation, F&& body);

        std::pmr::memory_resource* resource_;
        log_t log_;
        const table_id_t id_;
        const table_type type_;
        const std::size_t keypos_;
        const protection_t protection_;
        const bool read_concurrency_;
        const bool write_concurrency_;
        const bool compressed_;

        mutable std::shared_mutex mutex_;
        std::optional<std::string> name_;
        actor_id_t owner_;
        std::optional<heir_t> heir_;
        components::storage::storage_ptr storage_;
        bool dropped_{false};
    };

    using table_ptr = boost::intrusive_ptr<table_t>;

} // namespace services::table
