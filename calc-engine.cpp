#include <cmath>
#include "calc-engine.hpp"




//=============================================================================
static bool contains_nan(const calc::expression& e)
{
    if (e.has_type(calc::data_type::f64))
    {
        return std::isnan(e.get_f64());
    }
    for (const auto& part : e)
    {
        if (contains_nan(part))
        {
            return true;
        }
    }
    return false;
}

/**
 * NaN is not equal to itself, so an identity holding it could never be
 * found in the store again.
 */
static void check_args(const calc::identity& id)
{
    if (! (id.args.empty() || id.args.has_type(calc::data_type::table)))
    {
        throw std::invalid_argument("arguments to " + id.name + " must be a table, got " + id.args.type_name());
    }
    if (contains_nan(id.args))
    {
        throw std::invalid_argument("arguments to " + id.name + " may not contain NaN, got " + id.args.unparse());
    }
}




//=============================================================================
calc::expression calc::scope::evaluate(const std::string& name, const expression& args) const
{
    auto id = identity{name, args};
    check_args(id);
    return owner.resolve(id, &caller);
}




//=============================================================================
calc::engine::set_t calc::engine::insert(std::unique_ptr<node> n)
{
    require_idle("insert");

    auto key = nodes.insert(std::move(n)).name();
    auto affected = set_t();

    /*
     Only a node body that caught unknown_node_error can have read this name
     already. Such readers are the identities of this name that have
     outgoing edges.
     */
    auto readers = std::vector<identity>();

    for (const auto& entry : dag.referenced())
    {
        if (entry.name == key)
        {
            readers.push_back(entry);
        }
    }
    for (const auto& id : readers)
    {
        for (const auto& k : invalidate_transitively(id))
        {
            affected = std::move(affected).insert(k);
        }
    }
    return affected;
}

calc::expression calc::engine::evaluate(const identity& id)
{
    if (! stack.empty())
    {
        throw std::logic_error("evaluate(" + to_string(id) + ") called while computing "
            + to_string(stack.back().id) + "; read it through the scope instead");
    }
    check_args(id);
    return resolve(id, nullptr);
}

calc::engine::set_t calc::engine::set_value(const std::string& key, const expression& value)
{
    require_idle("set_value");

    auto variable = dynamic_cast<variable_node*>(&nodes.at(key));

    if (! variable)
    {
        throw not_variable_error("node " + key + " is not a variable");
    }
    variable->set(value);
    return invalidate_transitively(identity{key});
}

calc::engine::set_t calc::engine::override(const identity& id, const expression& value)
{
    require_idle("override");
    check_args(id);
    nodes.at(id.name); // throws if unknown

    if (value.empty())
    {
        throw std::invalid_argument("override of " + to_string(id) + " must have a value");
    }
    values.set_override(id, value);
    return invalidate_transitively(id);
}

calc::engine::set_t calc::engine::remove_override(const identity& id)
{
    require_idle("remove_override");
    check_args(id);
    nodes.at(id.name); // throws if unknown

    if (! values.clear_override(id))
    {
        return {};
    }
    return invalidate_transitively(id);
}

calc::engine::set_t calc::engine::invalidate(const identity& id)
{
    require_idle("invalidate");
    check_args(id);
    nodes.at(id.name); // throws if unknown
    return invalidate_transitively(id);
}




//=============================================================================
calc::expression calc::engine::resolve(const identity& id, const identity* caller)
{
    for (const auto& frame : stack)
    {
        if (frame.id == id)
        {
            throw cycle_error("dependency cycle: " + cycle_through(id));
        }
    }

    if (caller)
    {
        if (stack.empty() || stack.back().id != *caller)
        {
            throw std::logic_error("scope of " + to_string(*caller) + " used outside of its computation");
        }
        stack.back().discovered = std::move(stack.back().discovered).insert(id);
    }

    if (auto value = values.get_override(id))
    {
        return *value;
    }
    if (auto value = values.cached(id))
    {
        return *value;
    }

    const auto& n = nodes.at(id.name);
    auto value = expression();

    stack.push_back({id, set_t()});

    try {
        auto s = scope(*this, id);
        value = n.compute(s, id.args);
    }
    catch (...)
    {
        stack.pop_back();
        throw;
    }

    dag = dag.replace_deps(id, stack.back().discovered);
    values.set_cache(id, value);
    stack.pop_back();

    if (listener)
    {
        listener->computed(id, value);
    }
    return value;
}

calc::engine::set_t calc::engine::invalidate_transitively(const identity& id)
{
    auto marked = set_t().insert(id);
    auto pending = std::vector<identity>{id};

    values.invalidate(id);

    while (! pending.empty())
    {
        auto key = pending.back();
        pending.pop_back();

        /*
         An overridden identity presents the same value no matter what it
         reads, so its own readers stay valid. The identity the walk started
         from always propagates.
         */
        if (key != id && values.get_override(key))
        {
            continue;
        }

        for (const auto& k : dag.dependents_of(key))
        {
            if (! marked.count(k))
            {
                marked = std::move(marked).insert(k);
                values.invalidate(k);
                pending.push_back(k);
            }
        }
    }

    if (listener)
    {
        listener->invalidated(marked);
    }
    return marked;
}

void calc::engine::require_idle(const std::string& operation) const
{
    if (! stack.empty())
    {
        throw std::logic_error(operation + " called while computing " + to_string(stack.back().id));
    }
}

std::string calc::engine::cycle_through(const identity& id) const
{
    auto path = std::string();
    auto on_cycle = false;

    for (const auto& frame : stack)
    {
        if (frame.id == id)
        {
            on_cycle = true;
        }
        if (on_cycle)
        {
            path += to_string(frame.id) + " -> ";
        }
    }
    return path + to_string(id);
}
