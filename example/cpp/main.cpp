#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <integration/cpp/termstore.hpp>

using namespace termstore;
using namespace components::expressions;
using components::options::key_value_set_options_t;
using components::options::set_options_t;
using components::types::atom;
using components::types::binary;
using components::types::make_list;
using components::types::make_tuple;

inline configuration::config make_create_config(const std::filesystem::path& path) {
    auto config = configuration::config::create_config(path);
    config.log.level = log_t::level::warn;
    return config;
}

inline void clear_directory(const configuration::config& config) {
    std::filesystem::remove_all(config.main_path);
    std::filesystem::create_directories(config.main_path);
}

TEST_CASE("example::termstore::base") {
    auto config = make_create_config("/tmp/termstore_example/base");
    clear_directory(config);
    auto store = make_termstore(config);
    auto* registry = store->registry();
    auto actor = registry->spawn_actor();

    set_options_t options;
    options.name = "users";
    options.ordered = true;
    auto users = set_t::create_or_throw(registry, actor, options);

    INFO("insert") {
        records_t records;
        for (int num = 0; num < 100; ++num) {
            records.push_back(make_tuple(num, binary("Name " + std::to_string(num)), num % 10));
        }
        users.put_or_throw(actor, records);
        REQUIRE(users.info_or_throw().size == 100);
    }

    INFO("select") {
        match_spec_t spec{{tuple_pattern(var(1), any(), var(2)),
                           {make_compare_guard(guard_type::eq, bound(2), 9)},
                           body_t::variable(1)}};
        REQUIRE(users.select_or_throw(actor, spec).size() == 10);

        auto page = users.select_or_throw(actor, spec, 4);
        std::size_t seen = page.results.size();
        while (!page.is_end_of_table()) {
            page = users.select_or_throw(actor, page.continuation);
            seen += page.results.size();
        }
        REQUIRE(seen == 10);
    }

    INFO("navigate") {
        REQUIRE(users.first_or_throw(actor) == term_t(0));
        REQUIRE(users.next_or_throw(actor, 41) == term_t(42));
        REQUIRE(users.last_or_throw(actor) == term_t(99));
    }

    INFO("key value") {
        auto settings = key_value_set_t::create_or_throw(registry, actor, key_value_set_options_t{});
        settings.put_or_throw(actor, atom("mode"), atom("fast"));
        REQUIRE(settings.get_or_throw(actor, atom("mode")) == atom("fast"));
        REQUIRE(settings.get_or_throw(actor, atom("missing"), atom("default")) == atom("default"));
    }

    INFO("delete") {
        match_spec_t upper_half{{tuple_pattern(var(1), any(), var(2)),
                                 {make_compare_guard(guard_type::gte, bound(2), 5)},
                                 body_t::constant(true)}};
        REQUIRE(users.select_delete_or_throw(actor, upper_half) == 50);
        users.delete_table_or_throw(actor);
        REQUIRE(registry->whereis("users").error_code() == error_code_t::table_not_found);
    }
}
