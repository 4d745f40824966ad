#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <rxcpp/rx.hpp>
#include "calc.hpp"




//=============================================================================
struct Event
{
    Event(calc::identity id, calc::expression value) : id(id), value(value) {}
    Event(calc::engine::set_t invalidated) : invalidated(invalidated) {}

    bool is_computation() const
    {
        return ! id.name.empty();
    }

    calc::identity id;
    calc::expression value;
    calc::engine::set_t invalidated;
};




//=============================================================================
/**
 * Forwards engine notifications onto an rxcpp subject, so they can be
 * observed as a stream.
 */
class EventBridge : public calc::engine::listener_t
{
public:
    EventBridge(rxcpp::subjects::subject<Event> bus) : bus(bus) {}

    void computed(const calc::identity& id, const calc::expression& value) override
    {
        bus.get_subscriber().on_next(Event(id, value));
    }

    void invalidated(const calc::engine::set_t& ids) override
    {
        bus.get_subscriber().on_next(Event(ids));
    }

private:
    rxcpp::subjects::subject<Event> bus;
};




//=============================================================================
static calc::expression load(std::string fname)
{
    auto ifs = std::ifstream(fname);

    if (! ifs.is_open())
    {
        throw std::runtime_error("could not open configuration file " + fname);
    }
    auto ser = std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return calc::parse(ser);
}

static double norm_cdf(double x)
{
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}




//=============================================================================
static void build(calc::engine& g)
{
    using calc::scope;

    // Externally determined market data
    g.constant("vol", 0.1);
    g.constant("spot-price", 250);
    g.constant("risk-free-rate", 0.02);

    // Chosen by the user
    g.variable("option-type", "call");
    g.variable("time-to-expiry", std::numeric_limits<double>::quiet_NaN());
    g.variable("strike-price", std::numeric_limits<double>::quiet_NaN());

    g.define("d1", [] (scope& s, auto)
    {
        double S   = s("spot-price");
        double K   = s("strike-price");
        double r   = s("risk-free-rate");
        double vol = s("vol");
        double T   = s("time-to-expiry");
        return (std::log(S / K) + (r + vol * vol / 2) * T) / (vol * std::sqrt(T));
    });

    g.define("d2", [] (scope& s, auto)
    {
        return s("d1").as_f64() - s("vol").as_f64() * std::sqrt(s("time-to-expiry").as_f64());
    });

    g.define("call-price", [] (scope& s, auto)
    {
        double d1 = s("d1");
        double d2 = s("d2");
        double S  = s("spot-price");
        double K  = s("strike-price");
        double T  = s("time-to-expiry");
        double r  = s("risk-free-rate");
        return norm_cdf(d1) * S - norm_cdf(d2) * K * std::exp(-r * T);
    });

    g.define("put-price", [] (scope& s, auto)
    {
        double d1 = s("d1");
        double d2 = s("d2");
        double S  = s("spot-price");
        double K  = s("strike-price");
        double T  = s("time-to-expiry");
        double r  = s("risk-free-rate");
        return norm_cdf(-d2) * K * std::exp(-r * T) - norm_cdf(-d1) * S;
    });

    g.define("option-price", [] (scope& s, auto)
    {
        auto type = s("option-type").as_str();

        if (type == "call")
        {
            return s("call-price");
        }
        if (type == "put")
        {
            return s("put-price");
        }
        throw std::invalid_argument("unknown option type " + type);
    });
}




//=============================================================================
int main(int argc, const char* argv[])
{
    using namespace rxcpp;


    // Declare the event bus
    //=========================================================================
    auto event_subject = subjects::subject<Event>();
    auto event_stream = event_subject.get_observable();
    auto computations = 0;

    event_stream
    .filter([] (const Event& e) { return e.is_computation(); })
    .subscribe([&computations] (const Event& e)
    {
        ++computations;
        std::printf("    computed %s = %s\n", calc::to_string(e.id).data(), e.value.as_str().data());
    });

    event_stream
    .filter([] (const Event& e) { return ! e.is_computation(); })
    .map([] (const Event& e) { return e.invalidated.size(); })
    .subscribe([] (std::size_t n) { std::printf("    invalidated %zu identities\n", n); });


    // Build the graph and price some options
    //=========================================================================
    EventBridge bridge(event_subject);
    calc::engine g(&bridge);

    try {
        build(g);

        // 1) An out of the money call option, as configured
        calc::assign(g, load(argc > 1 ? argv[1] : "black-scholes.calc"));
        std::printf("1: value of a %s option is %.2f\n", g.evaluate("option-type").as_str().data(), g.evaluate("option-price").as_f64());

        // 2) As 1 but at the money
        g.set_value("strike-price", g.evaluate("spot-price"));
        std::printf("2: value of a %s option is %.2f\n", g.evaluate("option-type").as_str().data(), g.evaluate("option-price").as_f64());

        // 3) Market data cannot be set, but it can be overridden
        g.override("vol", 2 * g.evaluate("vol").as_f64());
        std::printf("3: value of a %s option is %.2f\n", g.evaluate("option-type").as_str().data(), g.evaluate("option-price").as_f64());
        g.remove_override("vol");

        std::printf("option-price reads %zu identities\n", g.graph().upstream(calc::identity{"option-price"}).size());
    }
    catch (const std::exception& e)
    {
        std::cerr << "black-scholes: " << e.what() << std::endl;
        event_subject.get_subscriber().on_completed();
        return 1;
    }

    event_subject.get_subscriber().on_completed();
    std::printf("%d computations\n", computations);

    return 0;
}
