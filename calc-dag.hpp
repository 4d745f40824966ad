#pragma once
#include <vector>
#include "immer/map.hpp"
#include "immer/set.hpp"
#include "calc-node.hpp"




//=============================================================================
namespace calc {
    class dependency_graph;
}




//=============================================================================
/**
 * An immutable record of which identities read which. Incoming edges of an
 * identity are the identities it read during its last successful
 * computation; outgoing edges are the identities that read it. The two maps
 * are always exact inverses of one another. Copies are cheap, since the
 * maps share structure, so the engine hands out snapshots freely.
 */
class calc::dependency_graph
{
public:


    using set_t = immer::set<identity>;
    using dag_t = immer::map<identity, set_t>;


    /** Default constructor */
    dependency_graph() {}


    /**
     * Return a graph in which the incoming edges of key are exactly deps.
     * Identities that key no longer reads lose it from their outgoing
     * edges, and newly read identities gain it.
     */
    dependency_graph replace_deps(const identity& key, const set_t& deps) const
    {
        auto old = dependencies_of(key);

        return {
            deps.empty() ? incoming.erase(key) : incoming.set(key, deps),
            add_through(remove_through(outgoing, key, difference(old, deps)), key, difference(deps, old)),
        };
    }


    /**
     * Return the identities that key read during its last computation.
     */
    set_t dependencies_of(const identity& key) const
    {
        auto s = incoming.find(key);
        return s ? *s : set_t();
    }


    /**
     * Return the identities that read key during their last computation.
     */
    set_t dependents_of(const identity& key) const
    {
        auto s = outgoing.find(key);
        return s ? *s : set_t();
    }


    /**
     * Return all identities that key depends on, directly or indirectly.
     */
    set_t upstream(const identity& key) const
    {
        return closure(incoming, key);
    }


    /**
     * Return all identities that depend on key, directly or indirectly.
     */
    set_t downstream(const identity& key) const
    {
        return closure(outgoing, key);
    }


    /**
     * Return the identities that were read by at least one other.
     */
    set_t referenced() const
    {
        auto result = set_t();

        for (const auto& edges : outgoing)
        {
            result = std::move(result).insert(edges.first);
        }
        return result;
    }


    /**
     * Return the number of identities with at least one recorded
     * dependency.
     */
    std::size_t size() const
    {
        return incoming.size();
    }


    bool empty() const
    {
        return incoming.empty() && outgoing.empty();
    }


    bool operator==(const dependency_graph& other) const
    {
        return incoming == other.incoming && outgoing == other.outgoing;
    }


    bool operator!=(const dependency_graph& other) const
    {
        return ! operator==(other);
    }


private:


    /** @internal constructor */
    dependency_graph(dag_t incoming, dag_t outgoing)
    : incoming(incoming)
    , outgoing(outgoing)
    {
    }


    /**
     * A - B
     */
    static set_t difference(const set_t& A, const set_t& B)
    {
        auto result = set_t();

        for (const auto& a : A)
        {
            if (! B.count(a))
            {
                result = std::move(result).insert(a);
            }
        }
        return result;
    }


    /**
     * out[s] -= key for s in through. Entries left empty are erased.
     */
    static dag_t remove_through(dag_t o, const identity& key, const set_t& through)
    {
        for (const auto& s : through)
        {
            if (auto edges = o.find(s))
            {
                auto remaining = edges->erase(key);
                o = remaining.empty() ? o.erase(s) : o.set(s, remaining);
            }
        }
        return o;
    }


    /**
     * out[s] += key for s in through
     */
    static dag_t add_through(dag_t o, const identity& key, const set_t& through)
    {
        for (const auto& s : through)
        {
            auto edges = o.find(s);
            o = std::move(o).set(s, (edges ? *edges : set_t()).insert(key));
        }
        return o;
    }


    /**
     * Every identity reachable from key along the given edges, not
     * including key itself unless the edges lead back to it.
     */
    static set_t closure(const dag_t& edges, const identity& key)
    {
        auto result = set_t();
        auto pending = std::vector<identity>{key};

        while (! pending.empty())
        {
            auto k = pending.back();
            pending.pop_back();

            if (auto next = edges.find(k))
            {
                for (const auto& m : *next)
                {
                    if (! result.count(m))
                    {
                        result = std::move(result).insert(m);
                        pending.push_back(m);
                    }
                }
            }
        }
        return result;
    }


    dag_t incoming;
    dag_t outgoing;
};




//=============================================================================
#ifdef TEST_CALC
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
TEST_CASE("dependency graph maintains inverse edges", "[dag]")
{
    using set_t = dependency_graph::set_t;
    auto a = identity{"a"};
    auto b = identity{"b"};
    auto c = identity{"c"};
    auto d = identity{"d"};

    SECTION("for a linear graph (c reads b, b reads a)")
    {
        auto g = dependency_graph()
        .replace_deps(b, set_t().insert(a))
        .replace_deps(c, set_t().insert(b));

        REQUIRE(g.size() == 2);
        REQUIRE(g.dependencies_of(c) == set_t().insert(b));
        REQUIRE(g.dependents_of(a) == set_t().insert(b));
        REQUIRE(g.dependents_of(b) == set_t().insert(c));
        REQUIRE(g.dependents_of(c) == set_t());
        REQUIRE(g.upstream(c) == set_t().insert(a).insert(b));
        REQUIRE(g.downstream(a) == set_t().insert(b).insert(c));
        REQUIRE(g.referenced() == set_t().insert(a).insert(b));
    }

    SECTION("for a diamond (d reads b and c, both read a)")
    {
        auto g = dependency_graph()
        .replace_deps(b, set_t().insert(a))
        .replace_deps(c, set_t().insert(a))
        .replace_deps(d, set_t().insert(b).insert(c));

        REQUIRE(g.dependents_of(a) == set_t().insert(b).insert(c));
        REQUIRE(g.downstream(a) == set_t().insert(b).insert(c).insert(d));
        REQUIRE(g.upstream(d) == set_t().insert(a).insert(b).insert(c));
    }

    SECTION("replacing dependencies prunes stale outgoing edges")
    {
        auto g0 = dependency_graph().replace_deps(d, set_t().insert(a).insert(c));
        auto g1 = g0.replace_deps(d, set_t().insert(b).insert(c));

        REQUIRE(g1.dependents_of(a) == set_t());
        REQUIRE(g1.dependents_of(b) == set_t().insert(d));
        REQUIRE(g1.dependents_of(c) == set_t().insert(d));
        REQUIRE(g0.dependents_of(a) == set_t().insert(d));
        REQUIRE(g1 != g0);
    }

    SECTION("an empty dependency set removes the identity entirely")
    {
        auto g = dependency_graph()
        .replace_deps(c, set_t().insert(a))
        .replace_deps(c, set_t());

        REQUIRE(g.empty());
        REQUIRE(g == dependency_graph());
    }

    SECTION("replacing with the same set changes nothing")
    {
        auto g = dependency_graph().replace_deps(c, set_t().insert(a).insert(b));
        REQUIRE(g.replace_deps(c, set_t().insert(b).insert(a)) == g);
    }
}

#endif // TEST_CALC
