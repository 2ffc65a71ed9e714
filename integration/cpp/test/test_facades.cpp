#include "test_config.hpp"
#include <catch2/catch.hpp>

#include <algorithm>

using namespace termstore;
using namespace components::expressions;
using components::options::bag_options_t;
using components::options::heir_t;
using components::options::key_value_set_options_t;
using components::options::option_list_t;
using components::options::protection_t;
using components::options::set_options_t;
using components::options::table_options_t;
using components::types::atom;
using components::types::binary;
using components::types::make_list;
using components::types::make_tuple;

TEST_CASE("integration::cpp::test_facades::set") {
    auto config = test_create_config("/tmp/test_termstore_set");
    test_clear_directory(config);
    test_spaces space(config);
    auto* registry = space.registry();
    auto actor = registry->spawn_actor();

    set_options_t options;
    options.name = "cities";
    auto set = set_t::create_or_throw(registry, actor, options);

    INFO("put_new") {
        REQUIRE(set.put_new(actor, make_tuple(atom("paris"), 2100000)));
        REQUIRE(set.put_new(actor, make_tuple(atom("paris"), 1)).error_code() == error_code_t::key_already_exists);
        REQUIRE(set.put_new(actor, {make_tuple(atom("rome"), 2800000), make_tuple(atom("paris"), 0)}).error_code() ==
                error_code_t::key_already_exists);
        REQUIRE_FALSE(set.has_key_or_throw(actor, atom("rome")));
        REQUIRE(set.put_new(actor, {make_tuple(atom("rome"), 2800000), make_tuple(atom("oslo"), 700000)}));
    }

    INFO("get and get_element") {
        REQUIRE(set.get_or_throw(actor, atom("oslo")) == make_tuple(atom("oslo"), 700000));
        REQUIRE(set.get_or_throw(actor, atom("lima"), atom("unknown")) == atom("unknown"));
        REQUIRE(set.get_element_or_throw(actor, atom("rome"), 2) == term_t(2800000));
        REQUIRE(set.get_element(actor, atom("rome"), 3).error_code() == error_code_t::position_out_of_bounds);
        REQUIRE(set.get_element(actor, atom("lima"), 1).error_code() == error_code_t::key_not_found);
    }

    INFO("generic lookup") {
        REQUIRE(set.lookup_or_throw(actor, atom("paris")) == std::optional<record_t>(make_tuple(atom("paris"), 2100000)));
        REQUIRE_FALSE(set.lookup_or_throw(actor, atom("lima")).has_value());
        REQUIRE(set.lookup_multi_or_throw(actor, atom("lima")).empty());
    }

    INFO("select and select_delete") {
        match_spec_t big{{tuple_pattern(var(1), var(2)),
                          {make_compare_guard(guard_type::gt, bound(2), 1000000)},
                          body_t::variable(1)}};
        auto names = set.select_or_throw(actor, big);
        std::sort(names.begin(), names.end());
        REQUIRE(names == std::vector<term_t>{atom("paris"), atom("rome")});

        match_spec_t drop_small{{tuple_pattern(any(), var(1)),
                                 {make_compare_guard(guard_type::lt, bound(1), 1000000)},
                                 body_t::constant(true)}};
        REQUIRE(set.select_delete_or_throw(actor, drop_small) == 1);
        REQUIRE_FALSE(set.has_key_or_throw(actor, atom("oslo")));

        REQUIRE(set.select(actor, match_spec_t{}).error_code() == error_code_t::invalid_select_spec);
        REQUIRE(set.select(actor, big, 0).error_code() == error_code_t::invalid_limit);
    }

    INFO("match continuation kinds do not mix") {
        auto page = set.match_or_throw(actor, tuple_pattern(var(1), any()), 1);
        REQUIRE(page.continuation);
        REQUIRE(set.select(actor, page.continuation).error_code() == error_code_t::invalid_continuation);
    }

    INFO("continuations stay with the table that issued them") {
        set_options_t ordered;
        ordered.ordered = true;
        auto a = set_t::create_or_throw(registry, actor, ordered);
        auto b = set_t::create_or_throw(registry, actor, ordered);
        a.put_or_throw(actor, make_tuple(1, 100));
        b.put_or_throw(actor, {make_tuple(0, 900), make_tuple(1, 901), make_tuple(2, 902)});

        auto page = b.match_or_throw(actor, tuple_pattern(any(), var(1)), 1);
        REQUIRE(page.continuation);
        REQUIRE(a.match(actor, page.continuation).error_code() == error_code_t::invalid_continuation);

        match_spec_t values{{tuple_pattern(any(), var(1)), {}, body_t::variable(1)}};
        auto selected = b.select_or_throw(actor, values, 1);
        REQUIRE(selected.continuation);
        REQUIRE(a.select(actor, selected.continuation).error_code() == error_code_t::invalid_continuation);
        REQUIRE(b.select_or_throw(actor, selected.continuation).results == std::vector<term_t>{901});
    }

    INFO("wrap_existing") {
        auto wrapped = set_t::wrap_existing_or_throw(registry, "cities");
        REQUIRE(wrapped.id() == set.id());
        REQUIRE(wrapped.get_or_throw(actor, atom("rome")) == make_tuple(atom("rome"), 2800000));

        auto bag = bag_t::create_or_throw(registry, actor, bag_options_t{});
        REQUIRE(set_t::wrap_existing(registry, bag.id()).error_code() == error_code_t::invalid_type);
        REQUIRE(bag_t::wrap_existing(registry, "cities").error_code() == error_code_t::invalid_type);
    }

    INFO("rename and delete") {
        set.rename_or_throw(actor, "towns");
        REQUIRE(registry->whereis("towns").value() == set.id());
        REQUIRE(set.info_or_throw().name == std::optional<std::string>("towns"));
        set.delete_table_or_throw(actor);
        REQUIRE(set.get(actor, atom("rome")).error_code() == error_code_t::table_not_found);
        REQUIRE(set.info().error_code() == error_code_t::table_not_found);
        REQUIRE(get_table(registry, "towns").error_code() == error_code_t::table_not_found);
    }
}

TEST_CASE("integration::cpp::test_facades::bag") {
    auto config = test_create_config("/tmp/test_termstore_bag");
    test_clear_directory(config);
    test_spaces space(config);
    auto* registry = space.registry();
    auto actor = registry->spawn_actor();

    INFO("plain bag skips exact duplicates") {
        auto bag = bag_t::create_or_throw(registry, actor, bag_options_t{});
        REQUIRE_FALSE(bag.allows_duplicates());
        bag.add_or_throw(actor, {make_tuple(atom("k"), 1), make_tuple(atom("k"), 1), make_tuple(atom("k"), 2)});
        REQUIRE(bag.lookup_or_throw(actor, atom("k")).size() == 2);
        REQUIRE(bag.add_new(actor, make_tuple(atom("k"), 3)).error_code() == error_code_t::key_already_exists);
        REQUIRE(bag.lookup_element_or_throw(actor, atom("k"), 2) == std::vector<term_t>{1, 2});
        REQUIRE(bag.table_handle_t::lookup(actor, atom("k")).error_code() == error_code_t::multi_found);
    }

    INFO("duplicate bag keeps every record") {
        bag_options_t options;
        options.duplicate = true;
        auto bag = bag_t::create_or_throw(registry, actor, options);
        REQUIRE(bag.allows_duplicates());
        bag.add_or_throw(actor, {make_tuple(atom("k"), 1), make_tuple(atom("k"), 1)});
        REQUIRE(bag.lookup_or_throw(actor, atom("k")).size() == 2);
        REQUIRE(bag.add_new(actor, make_tuple(atom("k"), 1)).error_code() == error_code_t::record_already_exists);
        REQUIRE(bag.add_new(actor, make_tuple(atom("k"), 2)));
        REQUIRE(bag.lookup_or_throw(actor, atom("k")).size() == 3);
    }

    INFO("match over a bag") {
        auto bag = bag_t::create_or_throw(registry, actor, bag_options_t{});
        bag.add_or_throw(actor, {make_tuple(atom("a"), 1), make_tuple(atom("a"), 2), make_tuple(atom("b"), 3)});
        REQUIRE(bag.match_or_throw(actor, tuple_pattern(atom("a"), var(1))) ==
                std::vector<term_t>{make_list(1), make_list(2)});
        bag.delete_key_or_throw(actor, atom("a"));
        REQUIRE(bag.to_list_or_throw(actor) == records_t{make_tuple(atom("b"), 3)});
        bag.delete_all_or_throw(actor);
        REQUIRE(bag.to_list_or_throw(actor).empty());
    }

    INFO("fetch and pop") {
        auto bag = bag_t::create_or_throw(registry, actor, bag_options_t{});
        records_t stored{make_tuple(atom("a"), atom("b")), make_tuple(atom("a"), atom("c"))};
        bag.add_or_throw(actor, stored);
        REQUIRE(bag.fetch_or_throw(actor, atom("a")) == std::optional<records_t>(stored));
        REQUIRE_FALSE(bag.fetch_or_throw(actor, atom("z")).has_value());

        auto popped = bag.pop_or_throw(actor, atom("a"));
        REQUIRE(popped.has_value());
        REQUIRE(popped->size() == 2);
        REQUIRE_FALSE(bag.has_key_or_throw(actor, atom("a")));
        REQUIRE_FALSE(bag.pop_or_throw(actor, atom("a")).has_value());
    }

    INFO("get_and_update") {
        auto bag = bag_t::create_or_throw(registry, actor, bag_options_t{});
        bag.add_or_throw(actor, make_tuple(atom("e"), atom("f")));

        auto previous = bag.get_and_update_or_throw(actor, atom("e"), [](const std::optional<records_t>& current) {
            REQUIRE(current == std::optional<records_t>(records_t{make_tuple(atom("e"), atom("f"))}));
            return std::optional<records_t>(records_t{make_tuple(atom("a"), atom("b"), atom("c"))});
        });
        REQUIRE(previous == std::optional<records_t>(records_t{make_tuple(atom("e"), atom("f"))}));
        REQUIRE(bag.to_list_or_throw(actor) == records_t{make_tuple(atom("a"), atom("b"), atom("c"))});

        auto absent = bag.get_and_update_or_throw(actor, atom("n"), [](const std::optional<records_t>& current) {
            REQUIRE_FALSE(current.has_value());
            return std::optional<records_t>(records_t{make_tuple(atom("n"), 1)});
        });
        REQUIRE_FALSE(absent.has_value());
        REQUIRE(bag.lookup_or_throw(actor, atom("n")) == records_t{make_tuple(atom("n"), 1)});

        auto removed = bag.get_and_update_or_throw(actor, atom("n"), [](const std::optional<records_t>&) {
            return std::optional<records_t>();
        });
        REQUIRE(removed == std::optional<records_t>(records_t{make_tuple(atom("n"), 1)}));
        REQUIRE_FALSE(bag.has_key_or_throw(actor, atom("n")));

        auto rejected = bag.get_and_update(actor, atom("a"), [](const std::optional<records_t>&) {
            return std::optional<records_t>(records_t{make_list(1)});
        });
        REQUIRE(rejected.error_code() == error_code_t::invalid_record);
        REQUIRE(bag.to_list_or_throw(actor) == records_t{make_tuple(atom("a"), atom("b"), atom("c"))});

        auto other = registry->spawn_actor();
        REQUIRE(bag.pop(other, atom("a")).error_code() == error_code_t::write_protected);
    }
}

TEST_CASE("integration::cpp::test_facades::key_value_set") {
    auto config = test_create_config("/tmp/test_termstore_key_value_set");
    test_clear_directory(config);
    test_spaces space(config);
    auto* registry = space.registry();
    auto actor = registry->spawn_actor();

    auto kv = key_value_set_t::create_or_throw(registry, actor, key_value_set_options_t{});

    INFO("put and get") {
        kv.put_or_throw(actor, atom("a"), binary("first"));
        kv.put_or_throw(actor, atom("a"), binary("second"));
        REQUIRE(kv.get_or_throw(actor, atom("a")) == binary("second"));
        REQUIRE(kv.get_or_throw(actor, atom("b"), 0) == term_t(0));
        REQUIRE(kv.put_new(actor, atom("a"), 1).error_code() == error_code_t::key_already_exists);
        REQUIRE(kv.to_list_or_throw(actor) == records_t{make_tuple(atom("a"), binary("second"))});
        kv.delete_key_or_throw(actor, atom("a"));
        REQUIRE_FALSE(kv.has_key_or_throw(actor, atom("a")));
    }

    INFO("option lists") {
        option_list_t with_keypos{{"keypos", term_t(2)}};
        REQUIRE(key_value_set_t::create(registry, actor, with_keypos).error_code() == error_code_t::invalid_option);

        option_list_t named{{"name", atom("settings")}, {"ordered", term_t(true)}, {"protection", atom("public")}};
        auto created = key_value_set_t::create(registry, actor, named);
        REQUIRE(created.is_ok());
        auto info = created.value().info_or_throw();
        REQUIRE(info.type == table_type::ordered_set);
        REQUIRE(info.protection == protection_t::public_);
    }

    INFO("wrap_existing checks the key position") {
        set_options_t options;
        options.name = "wide";
        options.keypos = 2;
        set_t::create_or_throw(registry, actor, options);
        REQUIRE(key_value_set_t::wrap_existing(registry, "wide").error_code() == error_code_t::invalid_keypos);
        REQUIRE(key_value_set_t::wrap_existing_or_throw(registry, kv.id()).id() == kv.id());
    }
}

TEST_CASE("integration::cpp::test_facades::generic") {
    auto config = test_create_config("/tmp/test_termstore_generic");
    test_clear_directory(config);
    test_spaces space(config);
    auto* registry = space.registry();
    auto actor = registry->spawn_actor();

    INFO("option list creation") {
        option_list_t bad{{"protection", atom("secret")}};
        REQUIRE(create_table(registry, actor, table_type::set, bad).error_code() == error_code_t::invalid_option);

        option_list_t options{{"name", atom("events")}, {"keypos", term_t(2)}};
        auto table = create_table(registry, actor, table_type::duplicate_bag, options);
        REQUIRE(table.is_ok());
        REQUIRE(table.value().info_or_throw().keypos == 2);
        REQUIRE(create_table(registry, actor, table_type::set, options).error_code() ==
                error_code_t::table_already_exists);
    }

    INFO("heir option") {
        auto heir = registry->spawn_actor();
        table_options_t options;
        options.heir = heir_t{heir, atom("inherit")};
        auto owner = registry->spawn_actor();
        auto table = create_table_or_throw(registry, owner, table_type::set, options);
        REQUIRE(table.info_or_throw().heir == std::optional<actor_id_t>(heir));
        registry->terminate_actor(owner);
        REQUIRE(table.info_or_throw().owner == heir);
        auto notice = accept_or_throw(registry, heir, std::chrono::milliseconds(100));
        REQUIRE(notice.payload == atom("inherit"));
    }

    INFO("records must be tuples") {
        auto table = create_table_or_throw(registry, actor, table_type::set, table_options_t{});
        REQUIRE(table.insert_multi(actor, {make_tuple(1), make_list(2)}).error_code() == error_code_t::invalid_record);
        REQUIRE(table.to_list_or_throw(actor).empty());
    }
}
