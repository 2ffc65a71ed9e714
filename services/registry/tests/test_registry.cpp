#include <catch2/catch.hpp>

#include <services/registry/registry.hpp>

#include <future>
#include <thread>

using namespace services::registry;
using components::options::heir_t;
using components::options::protection_t;
using components::options::table_options_t;
using components::types::atom;
using components::types::make_tuple;
using components::types::records_t;

namespace {

    struct test_registry_t {
        test_registry_t()
            : log(initialization_logger("test_registry", ""))
            , registry(&resource, configuration::config_registry{std::chrono::milliseconds(200)}, log) {}

        std::pmr::synchronized_pool_resource resource;
        log_t log;
        table_registry_t registry;
    };

    table_options_t named(const std::string& name, protection_t protection = protection_t::protected_) {
        table_options_t options;
        options.name = name;
        options.protection = protection;
        return options;
    }

} // namespace

TEST_CASE("services::registry::tables") {
    test_registry_t fixture;
    auto& registry = fixture.registry;
    auto actor = registry.spawn_actor();
    auto other = registry.spawn_actor();
    REQUIRE(registry.is_alive(actor));

    auto created = registry.create_table(actor, table_type::set, named("users"));
    REQUIRE(created.is_ok());
    auto id = created.value()->id();

    SECTION("lookup by name and id") {
        REQUIRE(registry.whereis("users").value() == id);
        REQUIRE(registry.find("users").value() == created.value());
        REQUIRE(registry.find(id).value() == created.value());
        REQUIRE(registry.all() == std::vector<table_id_t>{id});
        REQUIRE(registry.whereis("missing").error_code() == error_code_t::table_not_found);
    }

    SECTION("duplicate names keep the existing table") {
        REQUIRE(created.value()->insert(actor, {make_tuple(1)}));
        auto duplicate = registry.create_table(other, table_type::bag, named("users"));
        REQUIRE(duplicate.error_code() == error_code_t::table_already_exists);
        REQUIRE(registry.info("users").value().size == 1);
        REQUIRE(registry.info("users").value().type == table_type::set);
    }

    SECTION("invalid options") {
        table_options_t options;
        options.keypos = 0;
        REQUIRE(registry.create_table(actor, table_type::set, options).error_code() == error_code_t::invalid_option);
        REQUIRE(registry.all().size() == 1);
    }

    SECTION("info is not gated") {
        auto info = registry.info(id).value();
        REQUIRE(info.named);
        REQUIRE(info.name == std::optional<std::string>("users"));
        REQUIRE(info.owner == actor);
        REQUIRE(info.protection == protection_t::protected_);
        REQUIRE(info.keypos == 1);
    }

    SECTION("rename") {
        REQUIRE(registry.rename(other, id, "people").error_code() == error_code_t::write_protected);
        REQUIRE(registry.rename(actor, id, "people"));
        REQUIRE(registry.whereis("people").value() == id);
        REQUIRE(registry.whereis("users").error_code() == error_code_t::table_not_found);
        REQUIRE(registry.find(id).value() == created.value());

        REQUIRE(registry.create_table(actor, table_type::set, named("taken")).is_ok());
        REQUIRE(registry.rename(actor, id, "taken").error_code() == error_code_t::table_already_exists);
    }

    SECTION("delete") {
        REQUIRE(registry.delete_table(other, id).error_code() == error_code_t::write_protected);
        REQUIRE(registry.delete_table(actor, "users"));
        REQUIRE(registry.find(id).error_code() == error_code_t::table_not_found);
        REQUIRE(created.value()->lookup(actor, 1).error_code() == error_code_t::table_not_found);
        REQUIRE(registry.delete_table(actor, id).error_code() == error_code_t::table_not_found);
        REQUIRE(registry.create_table(actor, table_type::set, named("users")).is_ok());
    }

    SECTION("actors must be alive to own tables") {
        registry.terminate_actor(other);
        REQUIRE_FALSE(registry.is_alive(other));
        REQUIRE(registry.create_table(other, table_type::set, table_options_t{}).error_code() ==
                error_code_t::actor_not_alive);
    }
}

TEST_CASE("services::registry::give_away") {
    test_registry_t fixture;
    auto& registry = fixture.registry;
    auto a = registry.spawn_actor();
    auto b = registry.spawn_actor();
    auto c = registry.spawn_actor();
    auto table = registry.create_table(a, table_type::set, named("private", protection_t::private_)).value();
    REQUIRE(table->insert(a, {make_tuple(atom("k"), 1)}));

    SECTION("accept hands over the table and the payload") {
        REQUIRE(registry.give_away(a, table->id(), b, atom("p")));
        REQUIRE(table->owner() == a);

        auto transfer = registry.accept(b, std::chrono::milliseconds(100));
        REQUIRE(transfer.is_ok());
        REQUIRE(transfer.value().table == table);
        REQUIRE(transfer.value().payload == atom("p"));
        REQUIRE(transfer.value().from == a);

        REQUIRE(table->owner() == b);
        REQUIRE(table->lookup(b, atom("k")).value().size() == 1);
        REQUIRE(table->insert(a, {make_tuple(atom("j"), 2)}).error_code() == error_code_t::write_protected);
        REQUIRE(registry.give_away(a, table->id(), c, atom("p")).error_code() == error_code_t::sender_not_table_owner);
    }

    SECTION("rejected transfers change nothing") {
        REQUIRE(registry.give_away(a, table->id(), a, atom("p")).error_code() ==
                error_code_t::recipient_already_owns_table);
        registry.terminate_actor(c);
        REQUIRE(registry.give_away(a, table->id(), c, atom("p")).error_code() == error_code_t::recipient_not_alive);
        REQUIRE(registry.give_away(b, table->id(), c, atom("p")).error_code() == error_code_t::recipient_not_alive);
        auto d = registry.spawn_actor();
        REQUIRE(registry.give_away(b, table->id(), d, atom("p")).error_code() ==
                error_code_t::sender_not_table_owner);
        REQUIRE(registry.give_away(a, "missing", b, atom("p")).error_code() == error_code_t::table_not_found);
        REQUIRE(table->owner() == a);
    }

    SECTION("accept times out without side effects") {
        auto started = std::chrono::steady_clock::now();
        REQUIRE(registry.accept(b, std::chrono::milliseconds(50)).error_code() == error_code_t::timeout);
        REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(50));
        REQUIRE(table->owner() == a);
    }

    SECTION("accept uses the configured timeout") {
        REQUIRE(registry.accept(b).error_code() == error_code_t::timeout);
    }

    SECTION("a newer offer supersedes a pending one") {
        REQUIRE(registry.give_away(a, table->id(), b, atom("first")));
        REQUIRE(registry.give_away(a, table->id(), c, atom("second")));
        REQUIRE(registry.accept(b, std::chrono::milliseconds(20)).error_code() == error_code_t::timeout);
        auto transfer = registry.accept(c, std::chrono::milliseconds(100));
        REQUIRE(transfer.value().payload == atom("second"));
        REQUIRE(table->owner() == c);
    }

    SECTION("offers of deleted tables are discarded") {
        REQUIRE(registry.give_away(a, table->id(), b, atom("p")));
        REQUIRE(registry.delete_table(a, table->id()));
        REQUIRE(registry.accept(b, std::chrono::milliseconds(20)).error_code() == error_code_t::timeout);
    }

    SECTION("accept wakes up on a concurrent offer") {
        auto waiting = std::async(std::launch::async, [&] { return registry.accept(b, std::chrono::seconds(5)); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE(registry.give_away(a, table->id(), b, atom("late")));
        auto transfer = waiting.get();
        REQUIRE(transfer.is_ok());
        REQUIRE(transfer.value().payload == atom("late"));
        REQUIRE(table->owner() == b);
    }
}

TEST_CASE("services::registry::owner_termination") {
    test_registry_t fixture;
    auto& registry = fixture.registry;
    auto owner = registry.spawn_actor();
    auto heir = registry.spawn_actor();

    SECTION("without heir the table is deleted") {
        auto table = registry.create_table(owner, table_type::set, named("orphan")).value();
        registry.terminate_actor(owner);
        REQUIRE(registry.find("orphan").error_code() == error_code_t::table_not_found);
        REQUIRE(table->is_dropped());
    }

    SECTION("the heir inherits the table and its data") {
        auto options = named("inherited");
        options.heir = heir_t{heir, atom("heir_data")};
        auto table = registry.create_table(owner, table_type::ordered_set, options).value();
        REQUIRE(table->insert(owner, {make_tuple(1), make_tuple(2)}));

        registry.terminate_actor(owner);
        REQUIRE(table->owner() == heir);
        REQUIRE(registry.info("inherited").value().size == 2);

        auto notice = registry.accept(heir, std::chrono::milliseconds(100));
        REQUIRE(notice.value().table == table);
        REQUIRE(notice.value().from == owner);
        REQUIRE(notice.value().payload == atom("heir_data"));
    }

    SECTION("a dead heir cannot inherit") {
        auto options = named("doomed");
        options.heir = heir_t{heir, atom("none")};
        REQUIRE(registry.create_table(owner, table_type::set, options).is_ok());
        registry.terminate_actor(heir);
        registry.terminate_actor(owner);
        REQUIRE(registry.find("doomed").error_code() == error_code_t::table_not_found);
    }

    SECTION("terminating an actor releases its pending accept") {
        auto waiting = std::async(std::launch::async, [&] { return registry.accept(heir, std::chrono::seconds(5)); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        registry.terminate_actor(heir);
        REQUIRE(waiting.get().error_code() == error_code_t::actor_not_alive);
    }
}

TEST_CASE("services::registry::concurrent_tables") {
    test_registry_t fixture;
    auto& registry = fixture.registry;
    constexpr int workers = 4;
    constexpr int per_worker = 50;

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&registry, &failures, w] {
            auto actor = registry.spawn_actor();
            for (int i = 0; i < per_worker; ++i) {
                auto name = "t_" + std::to_string(w) + "_" + std::to_string(i);
                auto table = registry.create_table(actor, table_type::set, named(name));
                if (!table || !table.value()->insert(actor, {make_tuple(i)})) {
                    ++failures;
                    continue;
                }
                if (i % 2 == 0 && !registry.delete_table(actor, name)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(failures == 0);
    REQUIRE(registry.all().size() == workers * per_worker / 2);
}
