#include "mesh/Mesh.hpp"
#include "objreg/io/ISink.hpp"
#include <stdexcept>
#include <utility>

using namespace objreg::mesh;

static std::string triple(const std::array<int, 3>& a)
{
    return "(" + std::to_string(a[0]) + " " + std::to_string(a[1]) + " " + std::to_string(a[2]) +
           ")";
}

Mesh::Mesh(std::string name, Registry& parent, std::array<int, 3> local, int ng)
    : Registry(std::move(name), parent), local_(local), ng_(ng)
{
    validate();
}

Mesh::Mesh(std::string name, std::array<int, 3> local, int ng)
    : Registry(std::move(name)), local_(local), ng_(ng)
{
    validate();
}

void Mesh::validate() const
{
    if (local_[0] < 1 || local_[1] < 1 || local_[2] < 1)
        throw std::invalid_argument("Mesh '" + name() + "': interior sizes must be >= 1, got " +
                                    triple(local_));
    if (ng_ < 0)
        throw std::invalid_argument("Mesh '" + name() + "': ghost width must be >= 0");
}

void Mesh::serialize(io::ISink& sink) const
{
    sink.write_entry("local", triple(local_));
    sink.write_entry("ng", std::to_string(ng_));
    Registry::serialize(sink);
}
