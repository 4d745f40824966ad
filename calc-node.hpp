#pragma once
#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <stdexcept>
#include "calc-expr.hpp"




//=============================================================================
namespace calc
{


    //=========================================================================
    class engine;
    class scope;
    class node;
    class constant_node;
    class variable_node;
    class calc_node;
    struct identity;


    //=========================================================================
    class unknown_node_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class duplicate_name_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class not_variable_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class cycle_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };


    //=========================================================================
    inline std::string to_string(const identity& id);


    //=========================================================================
    // Argument checks for node bodies, defined in calc.cpp. The index is
    // with respect to the unkeyed parts of the argument table. Each throws
    // std::invalid_argument if the part is missing or has another type.
    //=========================================================================
    int check_i32(const expression& args, std::size_t index);
    double check_f64(const expression& args, std::size_t index);
    std::string check_str(const expression& args, std::size_t index);


    /**
     * Return the parts of the table at the given index, which must all be
     * unkeyed.
     */
    std::vector<expression> check_list(const expression& args, std::size_t index);
}




//=============================================================================
/**
 * The address of one cached value: a node name together with the arguments
 * it was evaluated with. The arguments are a table, or none if the node was
 * evaluated without arguments.
 */
struct calc::identity
{
    std::string name;
    expression args;

    bool operator==(const identity& other) const
    {
        return name == other.name && args == other.args;
    }

    bool operator!=(const identity& other) const
    {
        return ! operator==(other);
    }
};




//=============================================================================
namespace std
{
    template<>
    struct hash<calc::identity>
    {
        std::size_t operator()(const calc::identity& id) const
        {
            auto seed = std::hash<std::string>()(id.name);
            return seed ^ (id.args.hash() + 0x9e3779b9 + (seed << 6) + (seed >> 2));
        }
    };
}




//=============================================================================
std::string calc::to_string(const identity& id)
{
    return id.args.empty() ? id.name : id.name + id.args.unparse();
}




//=============================================================================
/**
 * The only view of the engine given to a node while it computes. Calling
 * the scope evaluates another identity and records it as a dependency of
 * the identity being computed.
 */
class calc::scope
{
public:
    scope(engine& owner, const identity& caller) : owner(owner), caller(caller) {}


    /**
     * Evaluate the named node with the given arguments, e.g. s("d1") or
     * s("discount", 2.0, 'usd').
     */
    template<typename... Args>
    expression operator()(const std::string& name, Args&&... args) const
    {
        return evaluate(name, std::vector<expression>{expression(std::forward<Args>(args))...});
    }


    /**
     * Evaluate the named node with an argument table.
     */
    expression evaluate(const std::string& name, const expression& args) const;


    /**
     * Return the identity this scope computes on behalf of.
     */
    const identity& target() const
    {
        return caller;
    }

private:
    engine& owner;
    identity caller;
};




//=============================================================================
class calc::node
{
public:
    virtual ~node() {}


    /**
     * Return the name this node is registered under. It must not change
     * while the node is in an engine.
     */
    virtual std::string name() const = 0;


    /**
     * Return the value of this node for the given arguments. Other nodes
     * are read through the scope; only the reads made during this call are
     * recorded as dependencies of the result.
     */
    virtual expression compute(scope& s, const expression& args) const = 0;
};




//=============================================================================
class calc::constant_node : public calc::node
{
public:
    constant_node(const std::string& key, const expression& value) : key(key), value(value) {}
    std::string name() const override { return key; }
    expression compute(scope&, const expression&) const override { return value; }

private:
    std::string key;
    expression value;
};




//=============================================================================
class calc::variable_node : public calc::node
{
public:
    variable_node(const std::string& key, const expression& value) : key(key), value(value) {}
    std::string name() const override { return key; }


    /**
     * Variables are not parameterized, so any arguments are an error.
     */
    expression compute(scope&, const expression& args) const override
    {
        if (! args.empty())
        {
            throw std::invalid_argument("variable " + key + " does not take arguments, got " + args.unparse());
        }
        return value;
    }


    /**
     * Replace the stored value. This does not invalidate anything; use
     * engine::set_value for that.
     */
    void set(const expression& new_value)
    {
        value = new_value;
    }


    const expression& get() const
    {
        return value;
    }

private:
    std::string key;
    expression value;
};




//=============================================================================
class calc::calc_node : public calc::node
{
public:
    using func_t = std::function<expression(scope&, const expression&)>;

    calc_node(const std::string& key, func_t func) : key(key), func(func) {}
    std::string name() const override { return key; }
    expression compute(scope& s, const expression& args) const override { return func(s, args); }

private:
    std::string key;
    func_t func;
};




//=============================================================================
#ifdef TEST_CALC
#include <unordered_set>
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
TEST_CASE("identities compare by name and arguments", "[identity]")
{
    REQUIRE(identity{"square", {2}} == identity{"square", {2}});
    REQUIRE(identity{"square", {2}} != identity{"square", {3}});
    REQUIRE(identity{"square", {2}} != identity{"cube", {2}});
    REQUIRE(identity{"square", {2}} != identity{"square", {2.0}});
    REQUIRE(identity{"spot"} == identity{"spot", expression({})});
}




TEST_CASE("identities hash by name and arguments", "[identity]")
{
    auto ids = std::unordered_set<identity>();

    ids.insert(identity{"rate", {5}});
    ids.insert(identity{"rate", {10}});
    ids.insert(identity{"rate", {5}});
    ids.insert(identity{"rate"});

    REQUIRE(ids.size() == 3);
    REQUIRE(ids.count(identity{"rate", {10}}) == 1);
    REQUIRE(ids.count(identity{"rate", {15}}) == 0);
}




TEST_CASE("identities format for messages", "[identity]")
{
    REQUIRE(to_string(identity{"spot"}) == "spot");
    REQUIRE(to_string(identity{"square", {3}}) == "square(3)");
    REQUIRE(to_string(identity{"curve", {1, std::string("usd")}}) == "curve(1 'usd')");
}




TEST_CASE("nodes report their names", "[node]")
{
    auto c = constant_node("vol", 0.1);
    auto v = variable_node("strike", 275);
    auto f = calc_node("d1", [] (scope& s, auto) { return s("vol"); });

    REQUIRE(c.name() == "vol");
    REQUIRE(v.name() == "strike");
    REQUIRE(f.name() == "d1");

    v.set(300);
    REQUIRE(v.get() == expression(300));
}

#endif // TEST_CALC
