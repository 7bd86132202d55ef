#include "incrgraph/engine/engine.inline.hpp"
#include "incrgraph/engine/engine_trace.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace incrgraph;

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== incrgraph ======\n" << std::flush;

        EngineConfig config;
        config.collect_stats = true;
        config.observers.push_back(std::make_shared<EngineTrace>(std::cout));
        auto engine = make_engine(std::move(config));

        // Diamond: a feeds b and c, both feed d.
        auto a = engine->create_source(1, NodeOptions<int>{"a"});
        auto b = engine->create_derived([&] { return engine->read(a) + 1; }, NodeOptions<int>{"b"});
        auto c = engine->create_derived([&] { return engine->read(a) + 2; }, NodeOptions<int>{"c"});
        auto d = engine->create_derived(
            [&] { return engine->read(b) * engine->read(c); }, NodeOptions<int>{"d"});

        int notified = 0;
        auto subscription = engine->subscribe(d, [&notified] { ++notified; });

        for (int value : {2, 2, 5})
        {
            engine->write(a, value);
            std::cout << fmt::format("a={} d={} notified={}\n", value, engine->read(d), notified);
        }
        subscription.unsubscribe();

        std::cout << engine->stats().summary() << "\n";
        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
