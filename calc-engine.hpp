#pragma once
#include <memory>
#include <string>
#include <vector>
#include "calc-node.hpp"
#include "calc-registry.hpp"
#include "calc-store.hpp"
#include "calc-dag.hpp"




//=============================================================================
namespace calc {
    class engine;
}




//=============================================================================
/**
 * A graph of named, possibly parameterized computations with cached
 * results. Values are computed on demand, and each computation records the
 * identities it read. Changing a variable, or setting or removing an
 * override, marks everything downstream as invalid; nothing is recomputed
 * until it is asked for again.
 *
 * The engine is single-threaded. Node bodies may re-enter it only through
 * the scope they are given, and may not mutate the graph.
 */
class calc::engine
{
public:


    //=========================================================================
    using set_t = dependency_graph::set_t;


    //=========================================================================
    class listener_t
    {
    public:
        virtual ~listener_t() {}
        virtual void computed(const identity& id, const expression& value) = 0;
        virtual void invalidated(const set_t& ids) = 0;
    };


    engine(listener_t* listener=nullptr) : listener(listener) {}


    /**
     * Register a node. Throws duplicate_name_error if the name is taken.
     * Identities of this name that were read before it existed (by a node
     * body that caught the resulting error) are invalidated, and returned.
     */
    set_t insert(std::unique_ptr<node> n);


    /**
     * Register a node whose value is fixed.
     */
    set_t constant(const std::string& key, const expression& value)
    {
        return insert(std::make_unique<constant_node>(key, value));
    }


    /**
     * Register a node whose value is changed through set_value.
     */
    set_t variable(const std::string& key, const expression& value)
    {
        return insert(std::make_unique<variable_node>(key, value));
    }


    /**
     * Register a node computed by the given function.
     */
    set_t define(const std::string& key, calc_node::func_t func)
    {
        return insert(std::make_unique<calc_node>(key, func));
    }


    /**
     * Return the value of the named node for the given arguments, computing
     * it (and anything it reads) if no valid value is cached.
     */
    template<typename... Args>
    expression evaluate(const std::string& key, Args&&... args)
    {
        return evaluate(identity{key, std::vector<expression>{expression(std::forward<Args>(args))...}});
    }


    /**
     * Return the value of the given identity. Its arguments must be a table
     * or none, and may not contain NaN. Only callable between computations;
     * node bodies read other nodes through their scope.
     */
    expression evaluate(const identity& id);


    /**
     * Set the value of a variable node and invalidate everything that read
     * it. Throws not_variable_error if the named node is not a variable.
     * Returns the invalidated identities.
     */
    set_t set_value(const std::string& key, const expression& value);


    /**
     * Force the value of an identity until the override is removed, and
     * invalidate everything that read it. The value may not be none.
     */
    set_t override(const identity& id, const expression& value);

    set_t override(const std::string& key, const expression& value)
    {
        return override(identity{key}, value);
    }


    /**
     * Remove the override of an identity and invalidate everything that
     * read it. Does nothing if the identity is not overridden.
     */
    set_t remove_override(const identity& id);

    set_t remove_override(const std::string& key)
    {
        return remove_override(identity{key});
    }


    /**
     * Mark the given identity, and everything downstream of it, as needing
     * recomputation.
     */
    set_t invalidate(const identity& id);

    set_t invalidate(const std::string& key)
    {
        return invalidate(identity{key});
    }


    /**
     * Return true if a node with the given name is registered.
     */
    bool contains(const std::string& key) const
    {
        return nodes.contains(key);
    }


    /**
     * Return true if the identity has a valid cached value. An overridden
     * identity may be valid or not; its cache is independent of the
     * override.
     */
    bool valid(const identity& id) const
    {
        return values.valid(id);
    }


    /**
     * Return true if the identity currently has an override.
     */
    bool has_override(const identity& id) const
    {
        return values.get_override(id) != nullptr;
    }


    /**
     * Return the current dependency graph. Copies of it are cheap snapshots.
     */
    const dependency_graph& graph() const
    {
        return dag;
    }


    /**
     * Return the number of identities currently being computed. This is
     * zero except from inside a node body.
     */
    std::size_t depth() const
    {
        return stack.size();
    }


private:
    friend class calc::scope;


    //=========================================================================
    struct frame_t
    {
        identity id;
        set_t discovered;
    };


    expression resolve(const identity& id, const identity* caller);
    set_t invalidate_transitively(const identity& id);
    void require_idle(const std::string& operation) const;
    std::string cycle_through(const identity& id) const;


    registry nodes;
    store values;
    dependency_graph dag;
    std::vector<frame_t> stack;
    listener_t* listener = nullptr;
};




//=============================================================================
#ifdef TEST_CALC
#include <cmath>
#include <limits>
#include <map>
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
struct recording_listener : public engine::listener_t
{
    void computed(const identity& id, const expression&) override
    {
        computations[to_string(id)]++;
    }

    void invalidated(const engine::set_t& ids) override
    {
        invalidations.push_back(ids);
    }

    std::map<std::string, int> computations;
    std::vector<engine::set_t> invalidations;
};

static expression sum(scope& s, const std::string& x, const std::string& y)
{
    return s(x).as_i32() + s(y).as_i32();
}




//=============================================================================
TEST_CASE("constants evaluate to their value", "[engine]")
{
    engine g;

    g.constant("a", 2);
    g.constant("name", std::string("spot"));
    g.define("twice", [] (scope& s, auto) { return 2 * s("a").as_i32(); });

    REQUIRE(g.evaluate("a") == expression(2));
    REQUIRE(g.evaluate("twice") == expression(4));
    REQUIRE(g.evaluate("name") == expression("spot"));
    REQUIRE(g.evaluate("a") == expression(2));
    REQUIRE(g.depth() == 0);
}




TEST_CASE("changing a variable recomputes its dependents", "[engine]")
{
    engine g;

    g.constant("a", 2);
    g.variable("b", 3);
    g.define("c", [] (scope& s, auto) { return sum(s, "a", "b"); });

    REQUIRE(g.evaluate("c") == expression(5));

    auto affected = g.set_value("b", 10);

    REQUIRE(affected == engine::set_t().insert(identity{"b"}).insert(identity{"c"}));
    REQUIRE_FALSE(g.valid(identity{"c"}));
    REQUIRE(g.valid(identity{"a"}));
    REQUIRE(g.evaluate("c") == expression(12));

    SECTION("overrides take precedence until removed")
    {
        g.override("a", 100);
        REQUIRE(g.has_override(identity{"a"}));
        REQUIRE(g.evaluate("a") == expression(100));
        REQUIRE(g.evaluate("c") == expression(110));

        g.remove_override("a");
        REQUIRE_FALSE(g.has_override(identity{"a"}));
        REQUIRE(g.evaluate("c") == expression(12));
    }

    SECTION("overriding before the first evaluation works")
    {
        engine h;
        h.constant("const", 1);
        h.override("const", 2);
        REQUIRE(h.evaluate("const") == expression(2));
        h.remove_override("const");
        REQUIRE(h.evaluate("const") == expression(1));
    }

    SECTION("changing an override value invalidates its readers")
    {
        g.override("a", 100);
        REQUIRE(g.evaluate("c") == expression(110));
        g.override("a", 200);
        REQUIRE(g.evaluate("c") == expression(210));
    }
}




TEST_CASE("dependencies follow the branch taken in the last computation", "[engine]")
{
    engine g;

    g.constant("a", 2);
    g.variable("b", 10);
    g.variable("flag", std::string("x"));
    g.define("d", [] (scope& s, auto)
    {
        return s("flag").as_str() == "x" ? s("a") : s("b");
    });

    REQUIRE(g.evaluate("d") == expression(2));
    REQUIRE(g.graph().dependencies_of(identity{"d"}) == engine::set_t()
        .insert(identity{"flag"})
        .insert(identity{"a"}));

    g.set_value("flag", std::string("y"));
    REQUIRE(g.evaluate("d") == expression(10));
    REQUIRE(g.graph().dependents_of(identity{"a"}) == engine::set_t());

    auto affected = g.override("a", 999);

    REQUIRE(affected == engine::set_t().insert(identity{"a"}));
    REQUIRE(g.valid(identity{"d"}));
    REQUIRE(g.evaluate("d") == expression(10));
}




TEST_CASE("dependency cycles are rejected", "[engine]")
{
    engine g;

    g.define("x", [] (scope& s, auto) { return s("y"); });
    g.define("y", [] (scope& s, auto) { return s("x"); });
    g.define("self", [] (scope& s, auto) { return s("self"); });

    REQUIRE_THROWS_AS(g.evaluate("x"), cycle_error);
    REQUIRE_THROWS_AS(g.evaluate("y"), cycle_error);
    REQUIRE_THROWS_WITH(g.evaluate("x"), "dependency cycle: x -> y -> x");
    REQUIRE_THROWS_WITH(g.evaluate("self"), "dependency cycle: self -> self");
    REQUIRE(g.depth() == 0);
    REQUIRE_FALSE(g.valid(identity{"x"}));
    REQUIRE(g.graph().empty());
}




TEST_CASE("parameterized identities cache independently", "[engine]")
{
    recording_listener events;
    engine g(&events);

    g.define("square", [] (scope&, const expression& args)
    {
        auto n = check_i32(args, 0);
        return n * n;
    });
    g.define("sum-of-squares", [] (scope& s, const expression& args)
    {
        return s("square", check_i32(args, 0)).as_i32() + s("square", check_i32(args, 1)).as_i32();
    });

    REQUIRE(g.evaluate("square", 2) == expression(4));
    REQUIRE(g.evaluate("square", 3) == expression(9));
    REQUIRE(g.evaluate("square", 2) == expression(4));
    REQUIRE(g.evaluate("square", 3) == expression(9));
    REQUIRE(g.evaluate("sum-of-squares", 2, 3) == expression(13));
    REQUIRE(events.computations["square(2)"] == 1);
    REQUIRE(events.computations["square(3)"] == 1);
    REQUIRE(events.computations["sum-of-squares(2 3)"] == 1);

    SECTION("overrides apply to one argument tuple only")
    {
        g.override(identity{"square", {2}}, 5);
        REQUIRE(g.evaluate("square", 2) == expression(5));
        REQUIRE(g.evaluate("square", 3) == expression(9));
        REQUIRE(g.evaluate("sum-of-squares", 2, 3) == expression(14));
        REQUIRE(events.computations["sum-of-squares(2 3)"] == 2);
        REQUIRE(events.computations["square(3)"] == 1);
    }

    SECTION("arguments that are not a table are rejected")
    {
        REQUIRE_THROWS_AS(g.evaluate(identity{"square", 2}), std::invalid_argument);
    }

    SECTION("arguments that are not a table are rejected from node bodies too")
    {
        g.define("bare-square", [] (scope& s, auto) { return s.evaluate("square", expression(2)); });
        REQUIRE_THROWS_AS(g.evaluate("bare-square"), std::invalid_argument);
        REQUIRE(g.depth() == 0);
    }

    SECTION("NaN arguments are rejected, since they never match a cached identity")
    {
        auto nan = std::numeric_limits<double>::quiet_NaN();

        g.define("half", [] (scope&, const expression& args) { return check_f64(args, 0) / 2; });

        REQUIRE_THROWS_AS(g.evaluate("half", nan), std::invalid_argument);
        REQUIRE_THROWS_AS(g.evaluate("sum-of-squares", 2, expression{1.0, nan}), std::invalid_argument);
        REQUIRE_THROWS_AS(g.override(identity{"half", {nan}}, 1.0), std::invalid_argument);
        REQUIRE(g.evaluate("half", 3.0) == expression(1.5));
    }

    SECTION("list arguments fan out to one identity per element")
    {
        g.define("ladder", [] (scope& s, const expression& args)
        {
            auto total = 0;

            for (const auto& n : check_list(args, 0))
            {
                total += s("square", n).as_i32();
            }
            return check_str(args, 1) + "=" + std::to_string(total);
        });

        REQUIRE(g.evaluate("ladder", expression{1, 2, 3}, "total") == expression("total=14"));
        REQUIRE(g.graph().dependencies_of(identity{"ladder", {expression{1, 2, 3}, "total"}}).size() == 3);
        REQUIRE(events.computations["square(2)"] == 1);
        REQUIRE(events.computations["square(1)"] == 1);
        REQUIRE_THROWS_AS(g.evaluate("ladder", 1, "total"), std::invalid_argument);
    }

    SECTION("wrongly typed arguments are reported by the node body")
    {
        REQUIRE_THROWS_AS(g.evaluate("square", 2.5), std::invalid_argument);
        REQUIRE_THROWS_WITH(g.evaluate("square", "two"), "expected i32 at index 0, got str");
    }
}




TEST_CASE("invalidation is idempotent", "[engine]")
{
    engine g;

    g.variable("a", 1);
    g.define("b", [] (scope& s, auto) { return s("a").as_i32() + 1; });
    g.define("c", [] (scope& s, auto) { return s("a").as_i32() + 2; });
    g.define("d", [] (scope& s, auto) { return sum(s, "b", "c"); });

    REQUIRE(g.evaluate("d") == expression(5));

    auto first = g.invalidate("a");
    auto snapshot = g.graph();
    auto second = g.invalidate("a");

    REQUIRE(first == second);
    REQUIRE(first.size() == 4);
    REQUIRE(g.graph() == snapshot);

    for (const auto& key : {"a", "b", "c", "d"})
    {
        REQUIRE_FALSE(g.valid(identity{key}));
    }
    REQUIRE(g.evaluate("d") == expression(5));
}




TEST_CASE("invalidation visits each identity of a diamond once", "[engine]")
{
    recording_listener events;
    engine g(&events);

    g.variable("spot", 100);
    g.define("up", [] (scope& s, auto) { return s("spot").as_i32() + 1; });
    g.define("down", [] (scope& s, auto) { return s("spot").as_i32() - 1; });
    g.define("spread", [] (scope& s, auto) { return s("up").as_i32() - s("down").as_i32(); });

    REQUIRE(g.evaluate("spread") == expression(2));

    g.set_value("spot", 200);

    REQUIRE(events.invalidations.size() == 1);
    REQUIRE(events.invalidations.back().size() == 4);
    REQUIRE(g.evaluate("spread") == expression(2));
    REQUIRE(events.computations["spread"] == 2);
    REQUIRE(events.computations["up"] == 2);
}




TEST_CASE("overrides shield their readers from upstream changes", "[engine]")
{
    recording_listener events;
    engine g(&events);

    g.variable("spot", 100);
    g.define("fwd", [] (scope& s, auto) { return s("spot").as_i32() * 2; });
    g.define("price", [] (scope& s, auto) { return s("fwd").as_i32() + 1; });

    REQUIRE(g.evaluate("price") == expression(201));

    g.override("fwd", 50);
    REQUIRE(g.evaluate("price") == expression(51));

    auto affected = g.set_value("spot", 300);

    REQUIRE(affected == engine::set_t().insert(identity{"spot"}).insert(identity{"fwd"}));
    REQUIRE(g.valid(identity{"price"}));
    REQUIRE(g.evaluate("price") == expression(51));

    g.remove_override("fwd");
    REQUIRE(g.evaluate("price") == expression(601));
}




TEST_CASE("overrides of several nodes combine", "[engine]")
{
    engine g;

    g.constant("base1", 2);
    g.constant("base2", 3);
    g.define("add", [] (scope& s, auto) { return sum(s, "base1", "base2"); });
    g.define("mul", [] (scope& s, auto) { return s("base1").as_i32() * s("base2").as_i32(); });
    g.define("final", [] (scope& s, auto) { return s("add").as_i32() - s("mul").as_i32(); });

    REQUIRE(g.evaluate("add") == expression(5));
    g.override("base1", 20);
    REQUIRE(g.evaluate("base1") == expression(20));
    REQUIRE(g.evaluate("add") == expression(23));
    REQUIRE(g.evaluate("mul") == expression(60));

    g.override("mul", 11);
    REQUIRE(g.evaluate("final") == expression(23 - 11));

    g.remove_override("base1");
    REQUIRE(g.evaluate("final") == expression(5 - 11));
    REQUIRE(g.evaluate("add") == expression(5));
    REQUIRE(g.evaluate("mul") == expression(11));

    g.override("base2", 7);
    REQUIRE(g.evaluate("mul") == expression(11));
    g.remove_override("mul");
    REQUIRE(g.evaluate("final") == expression(9 - 14));
}




TEST_CASE("engine reports errors without losing consistency", "[engine]")
{
    engine g;

    g.constant("a", 1);
    g.variable("b", 0);
    g.define("ratio", [] (scope& s, auto)
    {
        auto b = s("b").as_i32();

        if (b == 0)
        {
            throw std::domain_error("division by zero");
        }
        return s("a").as_i32() * 10 / b;
    });
    g.define("orphan", [] (scope& s, auto) { return s("missing"); });

    SECTION("unknown nodes")
    {
        REQUIRE_THROWS_AS(g.evaluate("missing"), unknown_node_error);
        REQUIRE_THROWS_AS(g.evaluate("orphan"), unknown_node_error);
        REQUIRE_THROWS_AS(g.set_value("missing", 1), unknown_node_error);
        REQUIRE_THROWS_AS(g.override("missing", 1), unknown_node_error);
        REQUIRE_THROWS_AS(g.remove_override("missing"), unknown_node_error);
        REQUIRE(g.depth() == 0);
    }

    SECTION("registering a missing node lets dependents compute")
    {
        REQUIRE_THROWS_AS(g.evaluate("orphan"), unknown_node_error);
        g.constant("missing", 7);
        REQUIRE(g.evaluate("orphan") == expression(7));
    }

    SECTION("a reader that caught a missing node is refreshed when it is registered")
    {
        g.define("fallback", [] (scope& s, auto)
        {
            try {
                return s("quote");
            }
            catch (const unknown_node_error&)
            {
                return expression(-1);
            }
        });

        REQUIRE(g.evaluate("fallback") == expression(-1));

        auto affected = g.constant("quote", 42);

        REQUIRE(affected == engine::set_t().insert(identity{"quote"}).insert(identity{"fallback"}));
        REQUIRE(g.evaluate("fallback") == expression(42));
    }

    SECTION("duplicate names")
    {
        REQUIRE_THROWS_AS(g.constant("a", 2), duplicate_name_error);
        REQUIRE(g.evaluate("a") == expression(1));
    }

    SECTION("setting a value on a node that is not a variable")
    {
        REQUIRE_THROWS_AS(g.set_value("a", 2), not_variable_error);
        REQUIRE_THROWS_AS(g.set_value("ratio", 2), not_variable_error);
    }

    SECTION("variables do not take arguments")
    {
        REQUIRE_THROWS_AS(g.evaluate("b", 1), std::invalid_argument);
    }

    SECTION("overrides must have a value")
    {
        REQUIRE_THROWS_AS(g.override("a", expression()), std::invalid_argument);
        REQUIRE_FALSE(g.has_override(identity{"a"}));
    }

    SECTION("removing an absent override does nothing")
    {
        REQUIRE(g.evaluate("a") == expression(1));
        REQUIRE(g.remove_override("a") == engine::set_t());
        REQUIRE(g.valid(identity{"a"}));
    }

    SECTION("a failed computation can be retried once its input is fixed")
    {
        REQUIRE_THROWS_AS(g.evaluate("ratio"), std::domain_error);
        REQUIRE_THROWS_WITH(g.evaluate("ratio"), "division by zero");
        REQUIRE(g.depth() == 0);
        REQUIRE_FALSE(g.valid(identity{"ratio"}));
        REQUIRE(g.graph().dependencies_of(identity{"ratio"}) == engine::set_t());

        g.set_value("b", 5);
        REQUIRE(g.evaluate("ratio") == expression(2));
        REQUIRE(g.graph().dependencies_of(identity{"ratio"}) == engine::set_t()
            .insert(identity{"a"})
            .insert(identity{"b"}));
    }
}




TEST_CASE("node bodies may not mutate the graph", "[engine]")
{
    engine g;

    g.variable("v", 1);
    g.define("meddler", [&g] (scope& s, auto)
    {
        g.set_value("v", s("v").as_i32() + 1);
        return expression(0);
    });
    g.define("depth", [&g] (scope&, auto) { return int(g.depth()); });

    REQUIRE_THROWS_AS(g.evaluate("meddler"), std::logic_error);
    REQUIRE(g.evaluate("v") == expression(1));
    REQUIRE(g.evaluate("depth") == expression(1));
    REQUIRE(g.depth() == 0);
}




TEST_CASE("node bodies may not bypass their scope", "[engine]")
{
    struct evaluating_listener : public engine::listener_t
    {
        void computed(const identity& id, const expression&) override
        {
            if (id.name == "inner")
            {
                REQUIRE_THROWS_AS(g->evaluate("v"), std::logic_error);
                ++checked;
            }
        }
        void invalidated(const engine::set_t&) override {}

        engine* g = nullptr;
        int checked = 0;
    };

    evaluating_listener events;
    engine g(&events);
    events.g = &g;

    g.variable("v", 1);
    g.define("sneaky", [&g] (scope&, auto) { return g.evaluate("v"); });
    g.define("inner", [] (scope& s, auto) { return s("v"); });
    g.define("outer", [] (scope& s, auto) { return s("inner"); });

    SECTION("an unrecorded read from a body is rejected")
    {
        REQUIRE_THROWS_AS(g.evaluate("sneaky"), std::logic_error);
        REQUIRE(g.depth() == 0);
        REQUIRE_FALSE(g.valid(identity{"sneaky"}));
        REQUIRE(g.graph().dependents_of(identity{"v"}) == engine::set_t());
    }

    SECTION("reads through the scope still see changes")
    {
        REQUIRE(g.evaluate("outer") == expression(1));
        REQUIRE(events.checked == 1);

        g.set_value("v", 2);
        REQUIRE(g.evaluate("outer") == expression(2));
    }
}




TEST_CASE("a scope cannot be used after its computation", "[engine]")
{
    engine g;
    std::unique_ptr<scope> kept;

    g.constant("a", 1);
    g.define("leak", [&kept] (scope& s, auto)
    {
        kept = std::make_unique<scope>(s);
        return s("a");
    });

    REQUIRE(g.evaluate("leak") == expression(1));
    REQUIRE(kept->target() == identity{"leak"});
    REQUIRE_THROWS_AS((*kept)("a"), std::logic_error);
}




TEST_CASE("custom nodes plug into the engine", "[engine]")
{
    struct multi_year_rate : public node
    {
        std::string name() const override { return "multiyear-rate"; }

        expression compute(scope& s, const expression& args) const override
        {
            auto rate = s("real-rate").as_f64();
            return std::pow(1.0 + rate, check_i32(args, 0)) - 1.0;
        }
    };

    engine g;

    g.constant("central-bank-rate", 0.05);
    g.constant("inflation-rate", 0.02);
    g.define("real-rate", [] (scope& s, auto)
    {
        return s("central-bank-rate").as_f64() - s("inflation-rate").as_f64();
    });
    g.insert(std::make_unique<multi_year_rate>());

    REQUIRE(g.evaluate("real-rate").as_f64() == Approx(0.03));
    REQUIRE(g.evaluate("multiyear-rate", 5).as_f64() == Approx(std::pow(1.03, 5) - 1.0));
    REQUIRE(g.evaluate("multiyear-rate", 10).as_f64() == Approx(std::pow(1.03, 10) - 1.0));
    REQUIRE(g.graph().dependents_of(identity{"real-rate"}).size() == 2);

    g.override("inflation-rate", 0.01);
    REQUIRE(g.evaluate("multiyear-rate", 5).as_f64() == Approx(std::pow(1.04, 5) - 1.0));
}

#endif // TEST_CALC
