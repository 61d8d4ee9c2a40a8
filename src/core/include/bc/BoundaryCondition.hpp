#pragma once
#include "bc/Boundary.hpp"
#include <string>
#include <unordered_map>
#include <utility>

/**
 * @file BoundaryCondition.hpp
 * @brief Boundary conditions that find their fields through the registry.
 *
 * @details
 * A boundary condition only stores the **name** of the field it acts on. At
 * :cpp:func:`apply` time it looks the field up in the registry it is handed (normally the
 * region's :cpp:class:`objreg::mesh::Mesh`). The BC module therefore never links against the
 * module that creates the field; they share a name, nothing more.
 *
 * Fields must be registered before the first ``apply``. A missing field surfaces as
 * :cpp:class:`objreg::NotFoundError`, a field of another kind as
 * :cpp:class:`objreg::TypeMismatchError`.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct Clamp : objreg::bc::BCBase {
 *     using BCBase::BCBase;
 *     void apply(objreg::Registry& mesh) override {
 *       for (double& v : target(mesh).span()) v = std::max(v, 0.0);
 *     }
 *   };
 * @endrst
 */

namespace objreg
{
class Registry;
}

namespace objreg::bc
{

using KV = std::unordered_map<std::string, std::string>;

struct BCInfo
{
    std::string type;  // table key, e.g. "dirichlet"
    std::string field; // registered name of the target field
    Face face;
};

struct IBoundaryCondition
{
    virtual ~IBoundaryCondition() = default;
    virtual const BCInfo& info() const = 0;
    virtual void apply(Registry& mesh) = 0;
};

// Stores BCInfo and resolves the target field by name.
struct BCBase : IBoundaryCondition
{
    explicit BCBase(BCInfo info) : info_(std::move(info)) {}

    const BCInfo& info() const final override { return info_; }

  protected:
    mesh::ScalarField& target(Registry& mesh) const;

    BCInfo info_;
};

} // namespace objreg::bc
