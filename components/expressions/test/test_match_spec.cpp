#include <catch2/catch.hpp>

#include <components/expressions/match_spec.hpp>

using namespace components::expressions;
using components::types::atom;

TEST_CASE("components::expressions::pattern") {
    auto pattern = tuple_pattern(var(1), atom("b"), any(), list_pattern(var(2), 3));
    REQUIRE(pattern.kind() == pattern_kind::tuple);
    REQUIRE(pattern.children().size() == 4);
    REQUIRE(pattern.children()[0].kind() == pattern_kind::bind);
    REQUIRE(pattern.children()[0].variable() == 1);
    REQUIRE(pattern.children()[1].kind() == pattern_kind::literal);
    REQUIRE(pattern.children()[2].kind() == pattern_kind::ignore);
    REQUIRE(pattern.to_string() == "{$1, b, _, [$2, 3]}");
}

TEST_CASE("components::expressions::guard") {
    auto eq = make_compare_guard(guard_type::eq, bound(2), atom("c"));
    REQUIRE(eq->is_compare());
    REQUIRE_FALSE(eq->is_union());
    REQUIRE(eq->to_string() == "eq($2, c)");

    auto same = make_compare_guard(guard_type::eq, bound(2), atom("c"));
    REQUIRE(eq->hash() == same->hash());

    auto both = make_union_guard(guard_type::union_and, {eq, make_type_guard(guard_type::is_atom, bound(1))});
    REQUIRE(both->is_union());
    REQUIRE(both->to_string() == "union_and: [eq($2, c), is_atom($1)]");
    REQUIRE(both->hash() != eq->hash());

    REQUIRE(get_guard_type("=:=") == guard_type::eq);
    REQUIRE(get_guard_type("==") == guard_type::num_eq);
    REQUIRE(get_guard_type("/=") == guard_type::num_ne);
    REQUIRE(get_guard_type("=/=") == guard_type::ne);
    REQUIRE(get_guard_type("=<") == guard_type::lte);
    REQUIRE(get_guard_type("is_tuple") == guard_type::is_tuple);
    REQUIRE(get_guard_type("andalso") == guard_type::union_and);
    REQUIRE(get_guard_type("xor") == guard_type::invalid);
}

TEST_CASE("components::expressions::match_clause") {
    match_clause_t clause{tuple_pattern(var(1), var(2)),
                          {make_compare_guard(guard_type::gt, bound(1), bound(2))},
                          body_t::tuple({body_t::variable(2), body_t::all_bindings(), body_t::whole_record()})};
    REQUIRE(to_string(clause) == "{{$1, $2}, [gt($1, $2)], {$2, $$, $_}}");
    REQUIRE(body_t(true).kind() == body_kind::constant);
    REQUIRE(body_t().kind() == body_kind::whole_record);
}
