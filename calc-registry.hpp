#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include "calc-node.hpp"




//=============================================================================
namespace calc {
    class registry;
}




//=============================================================================
/**
 * Owns the nodes of one engine, keyed by name. A name may be defined only
 * once; nodes live as long as the registry.
 */
class calc::registry
{
public:


    //=========================================================================
    using map_t = std::unordered_map<std::string, std::unique_ptr<node>>;


    /**
     * Take ownership of the given node. Throws duplicate_name_error if a node
     * with the same name is already registered, in which case the node is
     * destroyed.
     */
    node& insert(std::unique_ptr<node> n)
    {
        if (! n)
        {
            throw std::invalid_argument("cannot register a null node");
        }
        auto key = n->name();

        if (contains(key))
        {
            throw duplicate_name_error("a node named " + key + " is already registered");
        }
        return *(nodes[key] = std::move(n));
    }


    /**
     * Return the node with the given name, or throw unknown_node_error.
     */
    node& at(const std::string& key) const
    {
        auto n = nodes.find(key);

        if (n == nodes.end())
        {
            throw unknown_node_error("no node named " + key);
        }
        return *n->second;
    }


    /**
     * Return true if a node with the given name is registered.
     */
    bool contains(const std::string& key) const
    {
        return nodes.find(key) != nodes.end();
    }


    /**
     * Return the number of registered nodes.
     */
    std::size_t size() const
    {
        return nodes.size();
    }


    bool empty() const
    {
        return nodes.empty();
    }


    auto begin() const
    {
        return nodes.begin();
    }


    auto end() const
    {
        return nodes.end();
    }


private:
    map_t nodes;
};




//=============================================================================
#ifdef TEST_CALC
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
TEST_CASE("registry holds one node per name", "[registry]")
{
    registry r;

    r.insert(std::make_unique<constant_node>("spot", 250));
    r.insert(std::make_unique<variable_node>("strike", 275));

    REQUIRE(r.size() == 2);
    REQUIRE(r.contains("spot"));
    REQUIRE_FALSE(r.contains("vol"));
    REQUIRE(r.at("strike").name() == "strike");
    REQUIRE(dynamic_cast<variable_node*>(&r.at("strike")) != nullptr);
    REQUIRE(dynamic_cast<variable_node*>(&r.at("spot")) == nullptr);

    SECTION("a second definition of a name is rejected")
    {
        REQUIRE_THROWS_AS(r.insert(std::make_unique<constant_node>("spot", 300)), duplicate_name_error);
        REQUIRE(r.size() == 2);
    }

    SECTION("looking up a missing name fails")
    {
        REQUIRE_THROWS_AS(r.at("vol"), unknown_node_error);
    }

    SECTION("null nodes are rejected")
    {
        REQUIRE_THROWS_AS(r.insert(nullptr), std::invalid_argument);
    }
}

#endif // TEST_CALC
