#include "objreg/Registry.hpp"
#include "probe.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace objreg;

TEST_CASE("Registry insert + lookup of distinct names", "[registry]")
{
    Registry mesh{"mesh"};
    Probe a{"U", mesh};
    Probe b{"p", mesh};

    REQUIRE(mesh.size() == 2);
    REQUIRE(&mesh.lookup("U") == &a);
    REQUIRE(&mesh.lookup("p") == &b);
    REQUIRE(&mesh.lookup("U") != &mesh.lookup("p"));
    REQUIRE(a.owner() == &mesh);
    REQUIRE(a.registered());
    REQUIRE(a.key() == "U");
}

TEST_CASE("Duplicate name fails and leaves the original entry", "[registry]")
{
    Registry mesh{"mesh"};
    Probe leafA{"U", mesh};
    Probe leafB{"p", mesh};

    // Constructing a second "U" throws before the object exists
    REQUIRE_THROWS_AS(Probe("U", mesh), DuplicateNameError);
    REQUIRE(&mesh.lookup("U") == &leafA);
    REQUIRE(mesh.size() == 2);

    // Same through an explicit insert of a checked-out entry
    Probe leafC{"C", mesh};
    Registerable& removed = mesh.remove("C");
    REQUIRE(&removed == &leafC);
    REQUIRE_FALSE(leafC.registered());

    REQUIRE_THROWS_AS(mesh.insert("U", leafC), DuplicateNameError);
    REQUIRE(&mesh.lookup("U") == &leafA);
    REQUIRE(&mesh.lookup("p") == &leafB);

    mesh.remove("p");
    REQUIRE_THROWS_AS(mesh.lookup("p"), NotFoundError);
}

TEST_CASE("remove then lookup reports NotFoundError", "[registry]")
{
    Registry r{"r"};
    Probe e{"e", r};

    r.remove("e");
    REQUIRE_THROWS_AS(r.lookup("e"), NotFoundError);
    REQUIRE_FALSE(r.contains("e"));
    REQUIRE(r.empty());

    // Absent name is an error every time
    REQUIRE_THROWS_AS(r.remove("e"), NotFoundError);
    REQUIRE_THROWS_AS(r.remove("never"), NotFoundError);
}

TEST_CASE("Entry can be registered under a key other than its name", "[registry]")
{
    Registry r{"r"};
    Probe e{"velocity", r};
    r.remove("velocity");

    r.insert("U", e);
    REQUIRE(&r.lookup("U") == &e);
    REQUIRE_FALSE(r.contains("velocity"));
    REQUIRE(e.name() == "velocity");
    REQUIRE(e.key() == "U");
    REQUIRE(e.path() == "r/U");
}

TEST_CASE("Names are case-sensitive and must be valid", "[registry]")
{
    Registry r{"r"};
    Probe lower{"u", r};
    Probe upper{"U", r};
    REQUIRE(&r.lookup("u") != &r.lookup("U"));
    REQUIRE_FALSE(r.contains(" u"));

    REQUIRE_THROWS_AS(Probe("", r), InvalidNameError);
    REQUIRE_THROWS_AS(Probe("a/b", r), InvalidNameError);
    REQUIRE(r.size() == 2);
}

TEST_CASE("names() follows insertion order, sorted_names() does not", "[registry]")
{
    Registry r{"r"};
    Probe z{"z", r};
    Probe a{"a", r};
    Probe m{"m", r};

    REQUIRE(r.names() == std::vector<std::string>{"z", "a", "m"});
    REQUIRE(r.sorted_names() == std::vector<std::string>{"a", "m", "z"});

    r.remove("a");
    REQUIRE(r.names() == std::vector<std::string>{"z", "m"});
    a.check_in();
    REQUIRE(r.names() == std::vector<std::string>{"z", "m", "a"});
}

TEST_CASE("Root registry and paths", "[registry]")
{
    Registry run{"case"};
    Registry region{"fluid", run};
    Probe t{"T", region};

    REQUIRE(run.is_root());
    REQUIRE(run.parent() == nullptr);
    REQUIRE(region.parent() == &run);
    REQUIRE(&region.top() == &run);
    REQUIRE(&run.top() == &run);
    REQUIRE(t.path() == "case/fluid/T");
    REQUIRE(region.path() == "case/fluid");
}

TEST_CASE("Keys written by the registry itself are reserved", "[registry]")
{
    Registry r{"r"};
    REQUIRE_THROWS_AS(Probe("type", r), InvalidNameError);
    REQUIRE(r.empty());

    // alias keys are checked too
    Probe e{"kind", r};
    r.remove("kind");
    REQUIRE_THROWS_AS(r.insert("type", e), InvalidNameError);
    e.check_in();
    REQUIRE(&r.lookup("kind") == &e);
}
