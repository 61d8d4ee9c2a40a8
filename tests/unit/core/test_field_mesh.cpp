#include "mesh/Field.hpp"
#include "mesh/Mesh.hpp"
#include "objreg/Registry.hpp"
#include "probe.hpp"
#include <array>
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using namespace objreg;
using objreg::mesh::Field;
using objreg::mesh::Mesh;
using objreg::mesh::ScalarField;

TEST_CASE("Mesh extents and registration", "[mesh]")
{
    Registry run{"case"};
    Mesh fluid{"fluid", run, {4, 3, 2}, 1};

    REQUIRE(fluid.extents() == std::array<int, 3>{6, 5, 4});
    REQUIRE(fluid.volume_with_ghosts() == 120);
    REQUIRE(fluid.interior_cells() == 24);
    REQUIRE(&run.lookup_typed<Mesh>("fluid") == &fluid);
    REQUIRE(&run.lookup_typed<Registry>("fluid") == &fluid);
}

TEST_CASE("Invalid mesh geometry throws and is not left registered", "[mesh]")
{
    Registry run{"case"};
    REQUIRE_THROWS_AS(Mesh("bad", run, {0, 1, 1}, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(Mesh("bad", run, {1, 1, 1}, -1), std::invalid_argument);
    REQUIRE_FALSE(run.contains("bad"));

    Mesh standalone{"solo", {2, 2, 2}, 0};
    REQUIRE(standalone.is_root());
}

TEST_CASE("Field registers into its mesh and indexes interior-relative", "[field]")
{
    Mesh m{"m", {3, 2, 2}, 1};
    {
        ScalarField T{"T", m, 300.0};
        REQUIRE(&m.lookup_typed<ScalarField>("T") == &T);
        REQUIRE(T.extents() == std::array<int, 3>{5, 4, 4});
        REQUIRE(T.span().size() == 80);
        REQUIRE(T(0, 0, 0) == 300.0);
        REQUIRE(T(-1, -1, -1) == 300.0);

        T(0, 0, 0) = 1.0;
        // first interior cell sits one ghost layer in on every axis
        REQUIRE(T.raw()[(1 * 4 + 1) * 5 + 1] == 1.0);

        T.fill(2.0);
        REQUIRE(T(2, 1, 1) == 2.0);
    }
    REQUIRE_FALSE(m.contains("T"));
}

TEST_CASE("Field<float> is a different kind from Field<double>", "[field]")
{
    Mesh m{"m", {1, 1, 1}, 0};
    Field<float> f{"f", m};
    REQUIRE_THROWS_AS(m.lookup_typed<ScalarField>("f"), TypeMismatchError);
    REQUIRE(&m.lookup_typed<Field<float>>("f") == &f);
}

TEST_CASE("Field serializes interior values only", "[field]")
{
    Mesh m{"m", {2, 1, 1}, 2};
    ScalarField p{"p", m, -1.0};
    p(0, 0, 0) = 10.0;
    p(1, 0, 0) = 20.0;

    RecordingSink sink;
    m.persist_all(sink);
    const std::vector<std::string> want{"begin p",      "type=scalarField", "extents=(6 5 5)",
                                        "ng=2",         "internalField[2]", "end"};
    REQUIRE(sink.events == want);
}

TEST_CASE("Mesh serializes geometry before its children", "[mesh]")
{
    Registry run{"case"};
    Mesh fluid{"fluid", run, {1, 1, 1}, 0};
    ScalarField t{"T", fluid};

    RecordingSink sink;
    run.persist_all(sink);
    REQUIRE(sink.events.size() >= 5);
    REQUIRE(sink.events[0] == "begin fluid");
    REQUIRE(sink.events[1] == "type=mesh");
    REQUIRE(sink.events[2] == "local=(1 1 1)");
    REQUIRE(sink.events[3] == "ng=0");
    REQUIRE(sink.events[4] == "begin T");
}

TEST_CASE("Mesh reserves its geometry keys", "[mesh]")
{
    Mesh m{"m", {1, 1, 1}, 0};
    REQUIRE_THROWS_AS(ScalarField("ng", m), InvalidNameError);
    REQUIRE_THROWS_AS(ScalarField("local", m), InvalidNameError);
    REQUIRE_THROWS_AS(ScalarField("type", m), InvalidNameError);
    REQUIRE(m.empty());

    // plain registries only reserve "type"
    Registry run{"case"};
    Probe ng{"ng", run};
    REQUIRE(run.contains("ng"));
}
