#include "objreg/Registry.hpp"
#include "probe.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace objreg;

TEST_CASE("Recursive lookup finds nested entries", "[lookup][recursive]")
{
    Registry root{"root"};
    Registry mesh1{"mesh1", root};
    Probe u{"U", mesh1};

    REQUIRE(&root.lookup("U", true) == &u);
    REQUIRE_THROWS_AS(root.lookup("U", false), NotFoundError);
    REQUIRE_THROWS_AS(root.lookup("U"), NotFoundError);
    REQUIRE(root.contains("U", true));
    REQUIRE_FALSE(root.contains("U"));
}

TEST_CASE("Recursive lookup reaches arbitrary depth", "[lookup][recursive]")
{
    Registry a{"a"};
    Registry b{"b", a};
    Registry c{"c", b};
    Registry d{"d", c};
    Probe deep{"deep", d};

    REQUIRE(&a.lookup("deep", true) == &deep);
    REQUIRE(&b.lookup("deep", true) == &deep);
    REQUIRE(&a.lookup("d", true) == &d);
    REQUIRE_THROWS_AS(a.lookup("missing", true), NotFoundError);
}

TEST_CASE("Recursive lookup prefers direct children, then insertion order", "[lookup][recursive]")
{
    Registry root{"root"};
    Registry first{"first", root};
    Registry second{"second", root};
    Probe in_second{"x", second};
    Probe in_first{"x", first};

    // both regions hold "x": the earlier-inserted region wins
    REQUIRE(&root.lookup("x", true) == &in_first);

    Probe direct{"x", root};
    REQUIRE(&root.lookup("x", true) == &direct);
}

TEST_CASE("lookup_typed distinguishes mismatch from absence", "[lookup][typed]")
{
    Registry root{"root"};
    Registry sub{"sub", root};
    Probe p{"p", root};
    Other o{"o", root};

    REQUIRE(&root.lookup_typed<Probe>("p") == &p);
    REQUIRE(&root.lookup_typed<Registry>("sub") == &sub);
    REQUIRE(&root.lookup_typed<Registerable>("sub") == &sub);

    // leaf expected, registry found
    REQUIRE_THROWS_AS(root.lookup_typed<Probe>("sub"), TypeMismatchError);
    // different leaf kind
    REQUIRE_THROWS_AS(root.lookup_typed<Probe>("o"), TypeMismatchError);
    // registry expected, leaf found
    REQUIRE_THROWS_AS(root.lookup_typed<Registry>("p"), TypeMismatchError);
    // absent stays NotFound
    REQUIRE_THROWS_AS(root.lookup_typed<Probe>("nope"), NotFoundError);

    const Registry& croot = root;
    REQUIRE(&croot.lookup_typed<Probe>("p") == &p);
    REQUIRE_THROWS_AS(croot.lookup_typed<Other>("p"), TypeMismatchError);
}

TEST_CASE("Both error kinds are RegistryError", "[lookup][typed]")
{
    Registry root{"root"};
    Other o{"o", root};
    REQUIRE_THROWS_AS(root.lookup_typed<Probe>("o"), RegistryError);
    REQUIRE_THROWS_AS(root.lookup("x"), RegistryError);
}

TEST_CASE("lookup_path walks nested registries", "[lookup][path]")
{
    Registry run{"case"};
    Registry fluid{"fluid", run};
    Registry sub{"patches", fluid};
    Probe t{"T", fluid};
    Probe w{"wall", sub};

    REQUIRE(&run.lookup_path("fluid/T") == &t);
    REQUIRE(&run.lookup_path("fluid/patches/wall") == &w);
    REQUIRE(&fluid.lookup_path("T") == &t);
    REQUIRE_THROWS_AS(run.lookup_path("fluid/missing"), NotFoundError);
    REQUIRE_THROWS_AS(run.lookup_path("solid/T"), NotFoundError);
    // intermediate component is a leaf
    REQUIRE_THROWS_AS(run.lookup_path("fluid/T/x"), TypeMismatchError);
}

TEST_CASE("lookup_in_ancestors climbs towards the root", "[lookup][ancestors]")
{
    Registry run{"case"};
    Probe settings{"settings", run};
    Registry fluid{"fluid", run};
    Registry patches{"patches", fluid};
    Probe local{"local", fluid};

    REQUIRE(&patches.lookup_in_ancestors<Probe>("settings") == &settings);
    REQUIRE(&patches.lookup_in_ancestors<Probe>("local") == &local);
    REQUIRE_THROWS_AS(patches.lookup_in_ancestors<Probe>("nowhere"), NotFoundError);
    REQUIRE_THROWS_AS(patches.lookup_in_ancestors<Other>("settings"), TypeMismatchError);
    // children of the starting registry's siblings are not searched
    REQUIRE_THROWS_AS(run.lookup_in_ancestors<Probe>("local"), NotFoundError);
}

TEST_CASE("entries_of lists direct children of one kind", "[lookup]")
{
    Registry root{"root"};
    Probe a{"a", root};
    Other o{"o", root};
    Registry sub{"sub", root};
    Probe b{"b", root};
    Probe nested{"n", sub};

    auto probes = root.entries_of<Probe>();
    REQUIRE(probes.size() == 2);
    REQUIRE(probes[0] == &a);
    REQUIRE(probes[1] == &b);
    REQUIRE(root.entries_of<Registry>().size() == 1);
}
