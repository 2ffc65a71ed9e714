#include <catch2/catch.hpp>

#include <components/options/table_options.hpp>

using namespace components::options;
using components::base::actor_id_t;
using components::base::error_code_t;
using components::types::atom;
using components::types::term_t;

TEST_CASE("components::options::defaults") {
    set_options_t options;
    REQUIRE_FALSE(options.name.has_value());
    REQUIRE(options.protection == protection_t::protected_);
    REQUIRE_FALSE(options.heir.has_value());
    REQUIRE(options.keypos == 1);
    REQUIRE_FALSE(options.read_concurrency);
    REQUIRE_FALSE(options.write_concurrency);
    REQUIRE_FALSE(options.compressed);
    REQUIRE_FALSE(options.ordered);
    REQUIRE(validate(options).is_ok());
}

TEST_CASE("components::options::validate") {
    INFO("keypos must be positive") {
        table_options_t options;
        options.keypos = 0;
        auto result = validate(options);
        REQUIRE(result.is_error());
        REQUIRE(result.error_code() == error_code_t::invalid_option);
        REQUIRE(result.error().what == "{keypos, 0}");
    }
    INFO("heir must be a real actor") {
        table_options_t options;
        options.heir = heir_t{actor_id_t{}, atom("gift")};
        REQUIRE(validate(options).error_code() == error_code_t::invalid_option);
    }
    INFO("empty names are rejected") {
        table_options_t options;
        options.name = "";
        REQUIRE(validate(options).error_code() == error_code_t::invalid_option);
    }
}

TEST_CASE("components::options::parse") {
    SECTION("set options") {
        option_list_t list{{"ordered", term_t(true)},
                           {"keypos", term_t(3)},
                           {"read_concurrency", term_t(true)},
                           {"protection", atom("public")},
                           {"name", atom("my_table")}};
        auto result = parse_set_options(list);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().ordered);
        REQUIRE(result.value().keypos == 3);
        REQUIRE(result.value().read_concurrency);
        REQUIRE(result.value().protection == protection_t::public_);
        REQUIRE(result.value().name == "my_table");
    }

    SECTION("bag options with heir") {
        option_list_t list{{"duplicate", term_t(true)}, {"heir", heir_t{actor_id_t{7}, atom("data")}}};
        auto result = parse_bag_options(list);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().duplicate);
        REQUIRE(result.value().heir->actor == actor_id_t{7});
        REQUIRE(result.value().heir->data == atom("data"));
    }

    SECTION("first invalid option is reported") {
        option_list_t list{{"keypos", term_t(2)}, {"compressed", term_t(5)}, {"protection", atom("secret")}};
        auto result = parse_set_options(list);
        REQUIRE(result.is_error());
        REQUIRE(result.error_code() == error_code_t::invalid_option);
        REQUIRE(result.error().what == "{compressed, 5}");
    }

    SECTION("unknown option") {
        auto result = parse_bag_options({{"ordered", term_t(true)}});
        REQUIRE(result.error_code() == error_code_t::invalid_option);
        REQUIRE(result.error().what == "{ordered, true}");
    }

    SECTION("key value sets refuse keypos") {
        auto result = parse_key_value_set_options({{"keypos", term_t(1)}});
        REQUIRE(result.error_code() == error_code_t::invalid_option);
        REQUIRE(result.error().what == "{keypos, 1}");

        auto ok = parse_key_value_set_options({{"ordered", term_t(true)}});
        REQUIRE(ok.is_ok());
        auto set = ok.value().to_set_options();
        REQUIRE(set.keypos == 1);
        REQUIRE(set.ordered);
    }

    SECTION("non-atom name") {
        auto result = parse_set_options({{"name", components::types::binary("table")}});
        REQUIRE(result.error_code() == error_code_t::invalid_option);
    }
}

TEST_CASE("components::options::names") {
    REQUIRE(type_name(table_type::duplicate_bag) == "duplicate_bag");
    REQUIRE(protection_name(protection_t::private_) == "private");
    REQUIRE(protection_name(protection_t::public_) == "public");
    REQUIRE(is_set_type(table_type::ordered_set));
    REQUIRE(is_bag_type(table_type::bag));
    REQUIRE_FALSE(is_bag_type(table_type::set));
}
