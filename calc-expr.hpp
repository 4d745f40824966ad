#pragma once
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>




//=============================================================================
namespace calc
{


    //=========================================================================
    class parser;
    class expression;
    enum class data_type { none, i32, f64, str, data, table };


    //=========================================================================
    /**
     * Base class for values of application types carried inside an
     * expression, e.g. a volatility surface passed as a node argument.
     */
    struct user_data
    {
        virtual ~user_data() {}
        virtual const char* type_name() const = 0;


        /**
         * Return a plain expression (usually a keyed table) describing this
         * value, for printing. Must not itself be user data.
         */
        virtual expression to_table() const = 0;
    };


    //=========================================================================
    using data_t = std::shared_ptr<user_data>;
    template<typename T> struct capsule;
    template<typename T> struct type_info;
    template<typename T> data_t make_data(const T&);
    inline expression parse(const std::string&);
    inline expression parse(const char*);


    //=========================================================================
    class parser_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}




//=============================================================================
/**
 * A dynamically typed value. Node results, variable values, overrides and
 * argument tuples are all expressions. Tables are ordered sequences of
 * parts, each of which may carry a keyword. The empty table and none are
 * the same value.
 */
class calc::expression
{
public:
    struct none {};


    expression() {}
    expression(const none&) {}
    expression(int value)                : type(data_type::i32), i32(value) {}
    expression(double value)             : type(data_type::f64), f64(value) {}
    expression(const char* value)        : type(data_type::str), str(value) {}
    expression(const std::string& value) : type(data_type::str), str(value) {}
    expression(data_t value)             : type(data_type::data), data(value) {}


    /**
     * Construct a table. An empty table is none.
     */
    expression(const std::vector<expression>& table)
    : type(table.empty() ? data_type::none : data_type::table)
    , parts(table)
    {
    }

    expression(std::initializer_list<expression> table)
    : expression(std::vector<expression>(table))
    {
    }


    const int&         get_i32()  const { return i32; }
    const double&      get_f64()  const { return f64; }
    const std::string& get_str()  const { return str; }
    const data_t&      get_data() const { return data; }
    const std::string& key()      const { return keyword; }
    data_type dtype()                const { return type; }
    bool has_type(data_type t)       const { return type == t; }
    auto begin() const { return parts.begin(); }
    auto end()   const { return parts.end(); }


    /**
     * Return the value held by a capsule<T>, or throw a runtime_error if
     * this is not user data of type T.
     */
    template<typename T>
    const T& check_data() const
    {
        auto capsule = type == data_type::data ? std::dynamic_pointer_cast<calc::capsule<T>>(data) : nullptr;

        if (! capsule)
        {
            throw std::runtime_error(std::string("expected ") + type_info<T>::name() + ", got " + type_name());
        }
        return capsule->value;
    }


    /**
     * Return the unkeyed part at the given position among unkeyed parts, or
     * none if there are not that many.
     */
    expression item(std::size_t index) const
    {
        auto positional = list();
        return index < positional.size() ? positional[index] : expression();
    }


    /**
     * Return the value of the first part with the given keyword, with the
     * keyword stripped, or none.
     */
    expression attr(const std::string& kw) const
    {
        for (const auto& part : parts)
        {
            if (part.keyword == kw)
            {
                return part.keyed(std::string());
            }
        }
        return {};
    }


    std::vector<expression> list() const { return select(false); }
    std::vector<expression> dict() const { return select(true); }


    /**
     * Return a copy of this expression carrying the given keyword.
     */
    expression keyed(const std::string& kw) const
    {
        auto e = *this;
        e.keyword = kw;
        return e;
    }


    /**
     * Return the part at the given position, counting keyed parts. Throws
     * std::out_of_range.
     */
    const expression& at(std::size_t index) const
    {
        return parts.at(index);
    }


    std::size_t size() const
    {
        return parts.size();
    }


    bool empty() const
    {
        return type == data_type::none || (type == data_type::table && parts.empty());
    }


    bool as_boolean() const
    {
        if (type == data_type::i32) return i32 != 0;
        if (type == data_type::f64) return f64 != 0.0;
        if (type == data_type::str) return ! str.empty();
        if (type == data_type::data) return data != nullptr;
        return ! parts.empty();
    }


    /**
     * Numeric conversions truncate floats, and read strings with strtol or
     * strtod. Anything else converts to zero.
     */
    int as_i32() const
    {
        if (type == data_type::i32) return i32;
        if (type == data_type::f64) return int(f64);
        if (type == data_type::str) return int(std::strtol(str.data(), nullptr, 10));
        return 0;
    }

    double as_f64() const
    {
        if (type == data_type::i32) return i32;
        if (type == data_type::f64) return f64;
        if (type == data_type::str) return std::strtod(str.data(), nullptr);
        return 0.0;
    }


    /**
     * Strings are returned unquoted; everything else is unparsed without
     * its keyword.
     */
    std::string as_str() const
    {
        return type == data_type::str ? str : keyed(std::string()).unparse();
    }


    operator bool()        const { return as_boolean(); }
    operator int()         const { return as_i32(); }
    operator double()      const { return as_f64(); }
    operator std::string() const { return as_str(); }


    /**
     * Return source text that parses back to this expression. User data is
     * written as its to_table description, so it reads back as a table.
     */
    std::string unparse() const
    {
        auto text = keyword.empty() ? std::string() : keyword + "=";

        switch (type)
        {
            case data_type::none:  return text + "()";
            case data_type::i32:   return text + std::to_string(i32);
            case data_type::f64:   return text + std::to_string(f64);
            case data_type::str:   return text + "'" + str + "'";
            case data_type::data:  return text + data->to_table().unparse();
            case data_type::table: break;
        }

        for (std::size_t n = 0; n < parts.size(); ++n)
        {
            text += (n == 0 ? "(" : " ") + parts[n].unparse();
        }
        return text + ")";
    }


    const char* type_name() const
    {
        switch (type)
        {
            case data_type::none:  return "none";
            case data_type::i32:   return "i32";
            case data_type::f64:   return "f64";
            case data_type::str:   return "str";
            case data_type::data:  return data->type_name();
            case data_type::table: return "table";
        }
        return "unknown";
    }


    /**
     * Return a hash consistent with operator==. User data hashes by
     * identity, matching its equality.
     */
    std::size_t hash() const
    {
        auto seed = std::hash<int>()(int(type));

        auto combine = [&seed] (std::size_t h)
        {
            seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        };

        switch (type)
        {
            case data_type::none:  break;
            case data_type::i32:   combine(std::hash<int>()(i32)); break;
            case data_type::f64:   combine(std::hash<double>()(f64)); break;
            case data_type::str:   combine(std::hash<std::string>()(str)); break;
            case data_type::data:  combine(std::hash<user_data*>()(data.get())); break;
            case data_type::table: for (const auto& part : parts) combine(part.hash()); break;
        }
        combine(std::hash<std::string>()(keyword));
        return seed;
    }


    /**
     * Equality is exact: the types must match, so 1 and 1.0 differ, and
     * keywords are compared too.
     */
    bool operator==(const expression& other) const
    {
        if (type != other.type || keyword != other.keyword)
        {
            return false;
        }
        switch (type)
        {
            case data_type::none:  return true;
            case data_type::i32:   return i32 == other.i32;
            case data_type::f64:   return f64 == other.f64;
            case data_type::str:   return str == other.str;
            case data_type::data:  return data == other.data;
            case data_type::table: return parts == other.parts;
        }
        return false;
    }


    bool operator!=(const expression& other) const
    {
        return ! operator==(other);
    }


private:


    std::vector<expression> select(bool with_keyword) const
    {
        auto result = std::vector<expression>();

        for (const auto& part : parts)
        {
            if (part.keyword.empty() != with_keyword)
            {
                result.push_back(part);
            }
        }
        return result;
    }


    data_type type = data_type::none;
    int i32 = 0;
    double f64 = 0.0;
    std::string str;
    data_t data;
    std::vector<expression> parts;
    std::string keyword;
};




//=============================================================================
namespace std
{
    template<>
    struct hash<calc::expression>
    {
        std::size_t operator()(const calc::expression& e) const { return e.hash(); }
    };
}




//=============================================================================
/**
 * Holds a value of an application type T in an expression. A specialization
 * of type_info<T> supplies name() and to_table(const T&).
 */
template<typename T>
struct calc::capsule : public calc::user_data
{
    capsule(const T& value) : value(value) {}
    const char* type_name() const override { return type_info<T>::name(); }
    expression to_table() const override { return type_info<T>::to_table(value); }
    T value;
};

template<typename T>
calc::data_t calc::make_data(const T& value)
{
    return std::make_shared<capsule<T>>(value);
}




//=============================================================================
/**
 * Reads the literal syntax of expressions: integers, floats, single-quoted
 * strings, and parenthesized tables whose parts may be written key=value.
 * Several top-level parts are read as a table; a single one is returned
 * as-is.
 */
class calc::parser
{
public:


    //=========================================================================
    static expression parse(const char* source)
    {
        auto p = parser(source);
        auto parts = std::vector<expression>();

        while (p.skip_space())
        {
            parts.push_back(p.read_part());
        }
        return parts.size() == 1 ? parts.front() : expression(parts);
    }


private:


    //=========================================================================
    parser(const char* source) : c(source) {}


    static bool is_name_character(char e)
    {
        return std::isalnum(e) || e == '_' || e == '-' || e == ':' || e == '@';
    }

    static bool is_delimiter(char e)
    {
        return e == '\0' || e == ')' || std::isspace(e);
    }


    /**
     * Advance past whitespace, and return false if the source is exhausted.
     */
    bool skip_space()
    {
        while (std::isspace(*c))
        {
            ++c;
        }
        return *c != '\0';
    }


    /**
     * A part is a value, optionally preceded by name=.
     */
    expression read_part()
    {
        auto d = c;

        while (is_name_character(*d))
        {
            ++d;
        }
        if (d != c && *d == '=')
        {
            auto kw = std::string(c, d);
            c = d + 1;
            return read_value().keyed(kw);
        }
        return read_value();
    }

    expression read_value()
    {
        if (*c == '(')
        {
            return read_table();
        }
        if (*c == '\'')
        {
            return read_string();
        }
        if (std::isdigit(*c) || *c == '.' || *c == '+' || *c == '-')
        {
            return read_number();
        }
        throw parser_error("syntax error: unknown character '" + std::string(c, c + 1) + "'");
    }

    expression read_table()
    {
        auto parts = std::vector<expression>();
        ++c;

        while (true)
        {
            if (! skip_space())
            {
                throw parser_error("syntax error: unterminated expression");
            }
            if (*c == ')')
            {
                ++c;
                return parts;
            }
            parts.push_back(read_part());
        }
    }

    expression read_string()
    {
        auto start = ++c;

        while (*c != '\'')
        {
            if (*c == '\0')
            {
                throw parser_error("syntax error: unterminated string");
            }
            ++c;
        }
        auto str = std::string(start, c++);

        if (! is_delimiter(*c))
        {
            throw parser_error("syntax error: non-whitespace character following single-quoted string");
        }
        return str;
    }

    /**
     * Numbers with a decimal point or exponent are f64, others are i32.
     */
    expression read_number()
    {
        auto start = c;
        char* end = nullptr;
        auto value = std::strtod(start, &end);
        auto token = std::string(start, static_cast<const char*>(end));

        if (end == start
            || ! is_delimiter(*end)
            || token.find_first_not_of("+-.0123456789eE") != std::string::npos)
        {
            throw parser_error("syntax error: bad numeric literal");
        }
        c = end;

        if (token.find_first_of(".eE") == std::string::npos)
        {
            errno = 0;
            auto integer = std::strtol(start, nullptr, 10);

            if (errno == ERANGE || integer < INT_MIN || integer > INT_MAX)
            {
                throw parser_error("syntax error: integer literal " + token + " is out of range");
            }
            return int(integer);
        }
        return value;
    }


    const char* c;
};




//=============================================================================
calc::expression calc::parse(const std::string& source)
{
    return parser::parse(source.data());
}

calc::expression calc::parse(const char* source)
{
    return parser::parse(source);
}




//=============================================================================
#ifdef TEST_CALC
#include <unordered_set>
#include <catch2/catch.hpp>
using namespace calc;




//=============================================================================
TEST_CASE("none and the empty table are the same value", "[expression]")
{
    REQUIRE(expression().empty());
    REQUIRE(expression({}).empty());
    REQUIRE(expression({}).dtype() == data_type::none);
    REQUIRE(expression() == expression::none());
    REQUIRE(expression() == expression(std::vector<expression>()));
    REQUIRE(expression() != expression{0});
    REQUIRE(expression().unparse() == "()");
}




TEST_CASE("expression equality is exact", "[expression]")
{
    REQUIRE(expression{2, "x"} == expression{2, "x"});
    REQUIRE(expression(1) != expression(1.0));
    REQUIRE(expression("put") != expression("put").keyed("option-type"));
    REQUIRE(expression{1, 2} != expression{2, 1});
    REQUIRE(expression{1, 2} != expression{1, 2, 3});
}




TEST_CASE("expressions serve as hash keys", "[expression]")
{
    auto seen = std::unordered_set<expression>();

    seen.insert(expression{2, 3});
    seen.insert(parse("(2 3)"));
    seen.insert(expression{3, 2});
    seen.insert(expression());
    seen.insert(expression({}));
    seen.insert(parse("n=3"));
    seen.insert(expression(3).keyed("n"));

    REQUIRE(seen.size() == 4);
    REQUIRE(seen.count(expression{2, 3}));
    REQUIRE_FALSE(seen.count(expression{2.0, 3.0}));
}




TEST_CASE("tables give access to keyed and unkeyed parts", "[expression]")
{
    auto e = parse("(1 a=2 'three' b=(4 5))");

    REQUIRE(e.dtype() == data_type::table);
    REQUIRE(e.size() == 4);
    REQUIRE(e.list().size() == 2);
    REQUIRE(e.dict().size() == 2);
    REQUIRE(e.item(0) == expression(1));
    REQUIRE(e.item(1) == expression("three"));
    REQUIRE(e.item(2).empty());
    REQUIRE(e.attr("a") == expression(2));
    REQUIRE(e.attr("b") == expression{4, 5});
    REQUIRE(e.attr("c").empty());
    REQUIRE(e.at(1).key() == "a");
    REQUIRE_THROWS_AS(e.at(4), std::out_of_range);
}




TEST_CASE("expression converts to plain values", "[expression]")
{
    REQUIRE(expression(3).as_f64() == 3.0);
    REQUIRE(expression(3.7).as_i32() == 3);
    REQUIRE(expression("12").as_i32() == 12);
    REQUIRE(expression("2.5").as_f64() == 2.5);
    REQUIRE(expression("abc").as_str() == "abc");
    REQUIRE(expression(7).keyed("k").as_str() == "7");
    REQUIRE(expression{1, 2}.as_str() == "(1 2)");
    REQUIRE(expression(0).as_boolean() == false);
    REQUIRE(expression{1}.as_boolean());
    REQUIRE(double(expression(1.5)) == 1.5);
    REQUIRE(int(expression(4)) == 4);
    REQUIRE(std::string(expression("x")) == "x");
}




TEST_CASE("expressions unparse to text the parser reads back", "[expression]")
{
    auto e = expression{
        expression("call").keyed("option-type"),
        expression(275).keyed("strike-price"),
        expression{1, 2.5},
    };

    REQUIRE(e.unparse() == "(option-type='call' strike-price=275 (1 2.500000))");
    REQUIRE(parse(e.unparse()) == e);
    REQUIRE(expression(1).type_name() == std::string("i32"));
    REQUIRE(expression{1}.type_name() == std::string("table"));
}




//=============================================================================
struct strike_ladder
{
    double low;
    double high;
};

namespace calc
{
    template<>
    struct type_info<strike_ladder>
    {
        static const char* name() { return "strike_ladder"; }

        static expression to_table(const strike_ladder& v)
        {
            return {expression(v.low).keyed("low"), expression(v.high).keyed("high")};
        }
    };
}

TEST_CASE("user data is carried in capsules", "[expression]")
{
    auto e = expression(make_data(strike_ladder{90.0, 110.0}));

    REQUIRE(e.dtype() == data_type::data);
    REQUIRE(e.type_name() == std::string("strike_ladder"));
    REQUIRE(e.check_data<strike_ladder>().high == 110.0);
    REQUIRE(e.unparse() == "(low=90.000000 high=110.000000)");
    REQUIRE(parse(e.unparse()).attr("low") == expression(90.0));
    REQUIRE(e == e);
    REQUIRE(e != expression(make_data(strike_ladder{90.0, 110.0})));
    REQUIRE_THROWS_AS(expression(1).check_data<strike_ladder>(), std::runtime_error);
}




TEST_CASE("the parser reads literals", "[parser]")
{
    REQUIRE(parse("12") == expression(12));
    REQUIRE(parse("+12") == expression(12));
    REQUIRE(parse("-12") == expression(-12));
    REQUIRE(parse("2147483647") == expression(2147483647));
    REQUIRE(parse("-2147483648") == expression(INT_MIN));
    REQUIRE(parse("3000000000.0") == expression(3e9));
    REQUIRE(parse("13.5") == expression(13.5));
    REQUIRE(parse("-13.5e2") == expression(-1350.0));
    REQUIRE(parse("+13e2") == expression(1300.0));
    REQUIRE(parse(".5") == expression(0.5));
    REQUIRE(parse("2.0").dtype() == data_type::f64);
    REQUIRE(parse("'call'") == expression("call"));
    REQUIRE(parse("''") == expression(""));
    REQUIRE(parse("").empty());
    REQUIRE(parse("  ").empty());
}




TEST_CASE("the parser reads tables and keywords", "[parser]")
{
    REQUIRE(parse("(1 2 3)") == expression{1, 2, 3});
    REQUIRE(parse("( 1.0  2.0 )") == expression{1.0, 2.0});
    REQUIRE(parse("()").empty());
    REQUIRE(parse("(1 ')' 2)").size() == 3);
    REQUIRE(parse("(0 1 (2 3))").unparse() == "(0 1 (2 3))");
    REQUIRE(parse("option-type='put'").key() == "option-type");
    REQUIRE(parse("option-type='put'").get_str() == "put");
    REQUIRE(parse("curve=(1 2 3)").size() == 3);
    REQUIRE(parse("curve=(1 2 3)").key() == "curve");
    REQUIRE(parse("vol=0.1 spot=250") == expression{
        expression(0.1).keyed("vol"),
        expression(250).keyed("spot")});
    REQUIRE(parse("(vol=0.1)\n").attr("vol") == expression(0.1));
    REQUIRE(parse("(vol=0.1)\n").size() == 1);
}




TEST_CASE("the parser rejects malformed source", "[parser]")
{
    REQUIRE_THROWS_AS(parse("call"), parser_error);
    REQUIRE_THROWS_AS(parse("a=b"), parser_error);
    REQUIRE_THROWS_AS(parse("-"), parser_error);
    REQUIRE_THROWS_AS(parse("1.2.0"), parser_error);
    REQUIRE_THROWS_AS(parse("1e2e2"), parser_error);
    REQUIRE_THROWS_AS(parse("13a"), parser_error);
    REQUIRE_THROWS_AS(parse("0x10"), parser_error);
    REQUIRE_THROWS_AS(parse("strike-price=3000000000"), parser_error);
    REQUIRE_THROWS_AS(parse("(-2147483649)"), parser_error);
    REQUIRE_THROWS_AS(parse("99999999999999999999999"), parser_error);
    REQUIRE_THROWS_AS(parse("(1 2"), parser_error);
    REQUIRE_THROWS_AS(parse("('abc)"), parser_error);
    REQUIRE_THROWS_AS(parse("'abc'd"), parser_error);
}

#endif // TEST_CALC
