#pragma once
#include <unordered_map>
#include "calc-node.hpp"




//=============================================================================
namespace calc {
    class store;
}




//=============================================================================
/**
 * Per-identity cached values and overrides. The two have independent
 * lifetimes: setting or clearing an override never touches the cache entry
 * of the same identity, and vice versa. This class only records state; the
 * engine is responsible for invalidating dependents when an override
 * changes.
 */
class calc::store
{
public:


    //=========================================================================
    struct entry_t
    {
        expression value;
        bool valid = false;
    };


    /**
     * Return the cache entry for the given identity, or nullptr if it has
     * never been computed.
     */
    const entry_t* get_cache(const identity& id) const
    {
        auto e = cache.find(id);
        return e == cache.end() ? nullptr : &e->second;
    }


    /**
     * Return the cached value if it is valid, and nullptr otherwise.
     */
    const expression* cached(const identity& id) const
    {
        auto e = get_cache(id);
        return e && e->valid ? &e->value : nullptr;
    }


    /**
     * Store a freshly computed value and mark it valid.
     */
    void set_cache(const identity& id, const expression& value)
    {
        auto& e = cache[id];
        e.value = value;
        e.valid = true;
    }


    /**
     * Mark the cache entry invalid. The stale value is retained for
     * inspection but is never returned by cached. Return true if the entry
     * was valid.
     */
    bool invalidate(const identity& id)
    {
        auto e = cache.find(id);

        if (e == cache.end() || ! e->second.valid)
        {
            return false;
        }
        e->second.valid = false;
        return true;
    }


    /**
     * Return true if the identity has a valid cached value.
     */
    bool valid(const identity& id) const
    {
        return cached(id) != nullptr;
    }


    /**
     * Return the active override value, or nullptr if there is none.
     */
    const expression* get_override(const identity& id) const
    {
        auto o = overrides.find(id);
        return o == overrides.end() ? nullptr : &o->second;
    }


    void set_override(const identity& id, const expression& value)
    {
        overrides[id] = value;
    }


    /**
     * Remove the override, if any. Return true if one was active.
     */
    bool clear_override(const identity& id)
    {
        return overrides.erase(id) > 0;
    }


    /**
     * Return the number of cache entries, valid or not.
     */
    std::size_t size() const
    {
        return cache.size();
    }


    /**
     * Return the number of active overrides.
     */
    std::size_t num_overrides() const
    {
        return overrides.size();
    }


private:
    std::unordered_map<identity, entry_t> cache;
    std::unordered_map<identity, expression> overrides;
};




//=============================================================================
#ifdef TEST_CALC
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
TEST_CASE("store keeps cache entries per identity", "[store]")
{
    store s;
    auto a = identity{"square", {2}};
    auto b = identity{"square", {3}};

    REQUIRE(s.get_cache(a) == nullptr);
    REQUIRE(s.cached(a) == nullptr);

    s.set_cache(a, 4);
    s.set_cache(b, 9);

    REQUIRE(*s.cached(a) == expression(4));
    REQUIRE(*s.cached(b) == expression(9));
    REQUIRE(s.size() == 2);

    SECTION("invalid entries keep their value but are not returned")
    {
        REQUIRE(s.invalidate(a));
        REQUIRE_FALSE(s.invalidate(a));
        REQUIRE_FALSE(s.valid(a));
        REQUIRE(s.cached(a) == nullptr);
        REQUIRE(s.get_cache(a)->value == expression(4));
        REQUIRE(s.valid(b));
    }

    SECTION("a new value makes the entry valid again")
    {
        s.invalidate(a);
        s.set_cache(a, 5);
        REQUIRE(*s.cached(a) == expression(5));
    }

    SECTION("invalidating an unknown identity is harmless")
    {
        REQUIRE_FALSE(s.invalidate(identity{"cube", {2}}));
        REQUIRE(s.size() == 2);
    }
}




TEST_CASE("store keeps overrides apart from cache entries", "[store]")
{
    store s;
    auto a = identity{"vol"};

    s.set_cache(a, 0.1);
    s.set_override(a, 0.2);

    REQUIRE(*s.get_override(a) == expression(0.2));
    REQUIRE(*s.cached(a) == expression(0.1));
    REQUIRE(s.num_overrides() == 1);

    s.set_override(a, 0.3);
    REQUIRE(*s.get_override(a) == expression(0.3));

    REQUIRE(s.clear_override(a));
    REQUIRE_FALSE(s.clear_override(a));
    REQUIRE(s.get_override(a) == nullptr);
    REQUIRE(*s.cached(a) == expression(0.1));
}

#endif // TEST_CALC
