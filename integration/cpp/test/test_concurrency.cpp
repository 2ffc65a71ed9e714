#include "test_config.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

using namespace termstore;
using namespace components::expressions;
using components::options::protection_t;
using components::options::set_options_t;
using components::types::atom;
using components::types::make_tuple;

namespace {

    constexpr int batch_size = 16;
    constexpr int batches = 200;

    records_t make_batch(int round) {
        records_t batch;
        batch.reserve(batch_size);
        for (int i = 0; i < batch_size; ++i) {
            batch.push_back(make_tuple(i, round));
        }
        return batch;
    }

} // namespace

TEST_CASE("integration::cpp::test_concurrency") {
    auto config = test_create_config("/tmp/test_termstore_concurrency");
    test_clear_directory(config);
    test_spaces space(config);
    auto* registry = space.registry();
    auto writer = registry->spawn_actor();
    auto reader = registry->spawn_actor();

    INFO("readers never observe a partial batch") {
        set_options_t options;
        options.ordered = true;
        auto set = set_t::create_or_throw(registry, writer, options);
        set.put_or_throw(writer, make_batch(0));

        std::atomic<bool> done{false};
        std::atomic<int> torn{0};
        std::thread observer([&] {
            while (!done.load()) {
                auto records = set.to_list(reader);
                if (!records || records.value().size() != batch_size) {
                    ++torn;
                    continue;
                }
                const auto& all = records.value();
                for (const auto& record : all) {
                    if (record.element(2) != all.front().element(2)) {
                        ++torn;
                        break;
                    }
                }
            }
        });
        for (int round = 1; round <= batches; ++round) {
            set.put_or_throw(writer, make_batch(round));
        }
        done = true;
        observer.join();
        REQUIRE(torn == 0);
        REQUIRE(set.get_or_throw(writer, 0) == make_tuple(0, batches));
    }

    INFO("select_delete keeps concurrent non-matching inserts") {
        set_options_t options;
        options.protection = protection_t::public_;
        auto set = set_t::create_or_throw(registry, writer, options);
        for (int i = 0; i < 500; ++i) {
            set.put_or_throw(writer, make_tuple(i, atom("old")));
        }

        std::thread inserter([&] {
            for (int i = 500; i < 1000; ++i) {
                if (!set.put(reader, make_tuple(i, atom("new")))) {
                    return;
                }
            }
        });
        match_spec_t old_records{{tuple_pattern(any(), atom("old")), {}, body_t::constant(true)}};
        auto removed = set.select_delete_or_throw(writer, old_records);
        inserter.join();

        REQUIRE(removed == 500);
        REQUIRE(set.info_or_throw().size == 500);
        REQUIRE(set.match_or_throw(writer, tuple_pattern(any(), atom("old"))).empty());
    }

    INFO("independent tables do not block each other") {
        std::vector<std::thread> workers;
        std::atomic<int> failures{0};
        for (int w = 0; w < 4; ++w) {
            workers.emplace_back([registry, &failures] {
                auto actor = registry->spawn_actor();
                auto created = set_t::create(registry, actor, set_options_t{});
                if (!created) {
                    ++failures;
                    return;
                }
                auto& set = created.value();
                for (int i = 0; i < 200; ++i) {
                    if (!set.put(actor, make_tuple(i, i))) {
                        ++failures;
                    }
                }
                if (set.info_or_throw().size != 200) {
                    ++failures;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        REQUIRE(failures == 0);
    }
}
