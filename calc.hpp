#pragma once
#include <string>
#include <vector>
#include "calc-expr.hpp"
#include "calc-node.hpp"
#include "calc-registry.hpp"
#include "calc-store.hpp"
#include "calc-dag.hpp"
#include "calc-engine.hpp"




//=============================================================================
namespace calc
{


    //=========================================================================
    /**
     * Set the value of every variable named by a keyed part of the given
     * table, e.g. the result of parse("(spot=250 vol=0.1)"). A single keyed
     * expression is treated as a table of one. Throws invalid_argument for
     * unkeyed parts, before anything is assigned, and otherwise whatever
     * engine::set_value throws. Returns the union of invalidated identities.
     */
    engine::set_t assign(engine& g, const expression& table);
}




//=============================================================================
#ifdef TEST_CALC
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
TEST_CASE("argument checks accept matching types", "[helpers]")
{
    auto args = parse("(2 2.5 'call' (1 2) (a=1 b=2) k=7)");

    REQUIRE(check_i32(args, 0) == 2);
    REQUIRE(check_f64(args, 1) == 2.5);
    REQUIRE(check_str(args, 2) == "call");
    REQUIRE(check_list(args, 3) == std::vector<expression>{1, 2});
}




TEST_CASE("argument checks reject mismatched types", "[helpers]")
{
    auto args = parse("(2 2.5 'call' (1 2) (a=1 b=2) (1 b=2))");

    REQUIRE_THROWS_AS(check_i32(args, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(check_f64(args, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(check_str(args, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(check_list(args, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(check_list(args, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(check_list(args, 5), std::invalid_argument);
    REQUIRE_THROWS_AS(check_i32(args, 10), std::invalid_argument);
    REQUIRE_THROWS_WITH(check_i32(args, 2), "expected i32 at index 2, got str");
}




TEST_CASE("configuration tables assign variables", "[helpers]")
{
    engine g;

    g.variable("option-type", std::string("call"));
    g.variable("strike-price", 250);
    g.constant("spot-price", 250);
    g.define("moneyness", [] (scope& s, auto)
    {
        return s("spot-price").as_f64() / s("strike-price").as_f64();
    });

    REQUIRE(g.evaluate("moneyness").as_f64() == Approx(1.0));

    SECTION("keyed parts set the named variables")
    {
        auto affected = assign(g, parse("(option-type='put' strike-price=200)"));

        REQUIRE(affected.count(identity{"moneyness"}));
        REQUIRE(affected.count(identity{"strike-price"}));
        REQUIRE(affected.count(identity{"option-type"}));
        REQUIRE(g.evaluate("option-type") == expression("put"));
        REQUIRE(g.evaluate("moneyness").as_f64() == Approx(1.25));
    }

    SECTION("a single keyed expression is a table of one")
    {
        assign(g, parse("strike-price=125"));
        REQUIRE(g.evaluate("moneyness").as_f64() == Approx(2.0));
    }

    SECTION("an empty table assigns nothing")
    {
        REQUIRE(assign(g, parse("()")).empty());
        REQUIRE(g.valid(identity{"moneyness"}));
    }

    SECTION("unkeyed parts are rejected before anything is assigned")
    {
        REQUIRE_THROWS_AS(assign(g, parse("(strike-price=200 300)")), std::invalid_argument);
        REQUIRE(g.evaluate("strike-price") == expression(250));
    }

    SECTION("constants and unknown names are not assignable")
    {
        REQUIRE_THROWS_AS(assign(g, parse("(spot-price=300)")), not_variable_error);
        REQUIRE_THROWS_AS(assign(g, parse("(vol=0.2)")), unknown_node_error);
    }
}

#endif // TEST_CALC
