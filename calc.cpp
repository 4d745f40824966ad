#include "calc.hpp"




//=============================================================================
static std::string what_wrong_type(const char* expected, const calc::expression& arg, std::size_t index)
{
    return "expected "
    + std::string(expected)
    + " at index "
    + std::to_string(index)
    + ", got "
    + arg.type_name();
}




//=============================================================================
int calc::check_i32(const expression& e, std::size_t index)
{
    auto arg = e.item(index);

    if (arg.has_type(data_type::i32))
    {
        return arg.get_i32();
    }
    throw std::invalid_argument(what_wrong_type("i32", arg, index));
}

double calc::check_f64(const expression& e, std::size_t index)
{
    auto arg = e.item(index);

    if (arg.has_type(data_type::f64))
    {
        return arg.get_f64();
    }
    throw std::invalid_argument(what_wrong_type("f64", arg, index));
}

std::string calc::check_str(const expression& e, std::size_t index)
{
    auto arg = e.item(index);

    if (arg.has_type(data_type::str))
    {
        return arg.get_str();
    }
    throw std::invalid_argument(what_wrong_type("str", arg, index));
}

std::vector<calc::expression> calc::check_list(const expression& e, std::size_t index)
{
    auto arg = e.item(index);

    if (arg.has_type(data_type::table))
    {
        auto list = arg.list();

        if (list.size() == arg.size())
        {
            return list;
        }
    }
    throw std::invalid_argument(what_wrong_type("list", arg, index));
}




//=============================================================================
calc::engine::set_t calc::assign(engine& g, const expression& table)
{
    auto parts = std::vector<expression>();

    if (table.has_type(data_type::table) && table.key().empty())
    {
        parts.assign(table.begin(), table.end());
    }
    else if (! table.empty())
    {
        parts.push_back(table);
    }

    for (const auto& part : parts)
    {
        if (part.key().empty())
        {
            throw std::invalid_argument("configuration entry " + part.unparse() + " has no variable name");
        }
    }

    auto affected = engine::set_t();

    for (const auto& part : parts)
    {
        for (const auto& id : g.set_value(part.key(), part.keyed(std::string())))
        {
            affected = std::move(affected).insert(id);
        }
    }
    return affected;
}
