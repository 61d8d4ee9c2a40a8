#include "objreg/Registry.hpp"
#include "objreg/io/NullSink.hpp"
#include "probe.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace objreg;

TEST_CASE("persist_all visits each leaf exactly once", "[persist]")
{
    Registry mesh{"mesh"};
    Probe a{"a", mesh};
    Registry sub{"sub", mesh};
    Probe b{"b", mesh};
    Probe s1{"s1", sub};
    Probe s2{"s2", sub};

    io::NullSink sink;
    mesh.persist_all(sink);

    REQUIRE(a.calls == 1);
    REQUIRE(b.calls == 1);
    REQUIRE(s1.calls == 1);
    REQUIRE(s2.calls == 1);

    mesh.persist_all(sink);
    REQUIRE(a.calls == 2);
    REQUIRE(s2.calls == 2);
}

TEST_CASE("persist_all emits blocks in insertion order", "[persist]")
{
    Registry run{"case"};
    Probe z{"z", run};
    Registry fluid{"fluid", run};
    Probe t{"T", fluid};
    Probe a{"a", run};

    RecordingSink sink;
    run.persist_all(sink);

    const std::vector<std::string> want{
        "begin z",     "type=probe", "calls=1", "end",
        "begin fluid", "type=registry",
        "begin T",     "type=probe", "calls=1", "end",
        "end",
        "begin a",     "type=probe", "calls=1", "end",
    };
    REQUIRE(sink.events == want);
}

TEST_CASE("Removed entries are not persisted", "[persist]")
{
    Registry r{"r"};
    Probe kept{"kept", r};
    Probe gone{"gone", r};
    r.remove("gone");

    io::NullSink sink;
    r.persist_all(sink);
    REQUIRE(kept.calls == 1);
    REQUIRE(gone.calls == 0);
}

TEST_CASE("Empty registry persists nothing", "[persist]")
{
    Registry r{"r"};
    RecordingSink sink;
    r.persist_all(sink);
    REQUIRE(sink.events.empty());
}
