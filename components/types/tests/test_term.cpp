#include <catch2/catch.hpp>

#include <components/types/term.hpp>

#include <algorithm>
#include <limits>
#include <unordered_set>

using namespace components::types;

TEST_CASE("components::types::term::construction") {
    INFO("default term is nil") {
        term_t term;
        REQUIRE(term.is_atom());
        REQUIRE(term.is_nil());
    }
    INFO("booleans are atoms") {
        REQUIRE(term_t(true).is_atom("true"));
        REQUIRE(term_t(false).is_atom("false"));
        REQUIRE(term_t(true).is_true());
    }
    INFO("numbers") {
        REQUIRE(term_t(42).is_integer());
        REQUIRE(term_t(42).as_integer() == 42);
        REQUIRE(term_t(1.5).is_floating());
        REQUIRE(term_t(1.5).as_floating() == 1.5);
        REQUIRE_THROWS_AS(term_t(1.5).as_integer(), std::logic_error);
    }
    INFO("tuple elements are 1-indexed") {
        auto record = make_tuple(atom("k"), 1, binary("v"));
        REQUIRE(record.is_tuple());
        REQUIRE(record.arity() == 3);
        REQUIRE(record.element(1) == atom("k"));
        REQUIRE(record.element(3) == binary("v"));
        REQUIRE_THROWS_AS(record.element(0), std::out_of_range);
        REQUIRE_THROWS_AS(record.element(4), std::out_of_range);
    }
}

TEST_CASE("components::types::term::order") {
    SECTION("type ranks") {
        std::vector<term_t> ordered{term_t(-5),
                                    term_t(2.5),
                                    term_t(100),
                                    atom("a"),
                                    atom("b"),
                                    make_tuple(9),
                                    make_tuple(1, 1),
                                    make_list(),
                                    make_list(1),
                                    make_list(1, 2),
                                    binary(""),
                                    binary("abc")};
        for (std::size_t i = 0; i + 1 < ordered.size(); ++i) {
            INFO(ordered[i].to_string() << " < " << ordered[i + 1].to_string());
            REQUIRE(ordered[i] < ordered[i + 1]);
            REQUIRE(ordered[i + 1] > ordered[i]);
        }
        auto shuffled = ordered;
        std::reverse(shuffled.begin(), shuffled.end());
        std::sort(shuffled.begin(), shuffled.end(), term_less_t{});
        REQUIRE(shuffled == ordered);
    }

    SECTION("integer and float") {
        REQUIRE(term_t(1) != term_t(1.0));
        REQUIRE(term_t(1) < term_t(1.0));
        REQUIRE(term_t(1.0) > term_t(1));
        REQUIRE(term_t(1.0) < term_t(2));
        REQUIRE(term_t(2) > term_t(1.5));
        REQUIRE(term_t(-1) > term_t(-1.5));
        REQUIRE(term_t(std::numeric_limits<int64_t>::max()) < term_t(1e19));
        REQUIRE(term_t(std::numeric_limits<int64_t>::min()) > term_t(-1e19));
    }

    SECTION("tuples compare by arity first") {
        REQUIRE(make_tuple(100) < make_tuple(1, 1));
        REQUIRE(make_tuple(1, 2) < make_tuple(1, 3));
        REQUIRE(make_tuple(1, 2) == make_tuple(1, 2));
    }

    SECTION("lists compare element-wise, prefix first") {
        REQUIRE(make_list(1, 2) < make_list(1, 2, 0));
        REQUIRE(make_list(2) > make_list(1, 2, 3));
    }
}

TEST_CASE("components::types::term::hash") {
    std::unordered_set<term_t, term_hash_t> set;
    set.insert(make_tuple(atom("a"), 1));
    set.insert(make_tuple(atom("a"), 1));
    set.insert(make_tuple(atom("a"), 1.0));
    set.insert(term_t(0.0));
    set.insert(term_t(-0.0));
    REQUIRE(set.size() == 3);
    REQUIRE(term_t(0.0).hash() == term_t(-0.0).hash());
}

TEST_CASE("components::types::term::to_string") {
    REQUIRE(make_tuple(atom("k"), 1, binary("v")).to_string() == "{k, 1, <<\"v\">>}");
    REQUIRE(make_list(1, make_list()).to_string() == "[1, []]");
    REQUIRE(term_t().to_string() == "nil");
}
