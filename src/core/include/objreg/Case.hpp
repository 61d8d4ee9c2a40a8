#pragma once
#include "bc/Table.hpp"
#include "mesh/Field.hpp"
#include "mesh/Mesh.hpp"
#include "objreg/Dictionary.hpp"
#include "objreg/Registry.hpp"
#include "objreg/io/CaseConfig.hpp"
#include <memory>
#include <string_view>
#include <vector>

/**
 * @file Case.hpp
 * @brief Application façade that builds a registry tree from a :cpp:struct:`CaseConfig`.
 *
 * @details
 * The case owns every object it creates and a root :cpp:class:`objreg::Registry` named after
 * the case. Construction order is regions, dictionaries, fields, boundary conditions, so every
 * producer exists before any consumer is built. Members are declared so that destruction runs
 * the other way round and the root registry is torn down last.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   objreg::bc::Table table;
 *   objreg::bc::register_builtin_bcs(table);
 *
 *   objreg::Case C(objreg::io::load_case_from_yaml("cavity.yaml"), table);
 *   C.apply_boundaries();
 *
 *   objreg::io::DictSink sink{std::cout};
 *   C.persist(sink);
 * @endrst
 */

namespace objreg
{

class Case
{
  public:
    Case(const io::CaseConfig& cfg, const bc::Table& table);

    Registry& root() noexcept { return root_; }
    const Registry& root() const noexcept { return root_; }

    // `name` is the registered (already resolved) region name.
    mesh::Mesh& region(std::string_view name) { return root_.lookup_typed<mesh::Mesh>(name); }

    // Applies every BC in configuration order against its region.
    void apply_boundaries();
    void persist(io::ISink& sink) const { root_.persist_all(sink); }

    std::size_t region_count() const noexcept { return regions_.size(); }
    std::size_t field_count() const noexcept { return fields_.size(); }
    std::size_t boundary_count() const noexcept { return bcs_.size(); }

  private:
    struct BoundBC
    {
        mesh::Mesh* region;
        std::unique_ptr<bc::IBoundaryCondition> bc;
    };

    Registry root_;
    std::vector<std::unique_ptr<mesh::Mesh>> regions_;
    std::vector<std::unique_ptr<Dictionary>> dicts_;
    std::vector<std::unique_ptr<mesh::ScalarField>> fields_;
    std::vector<BoundBC> bcs_;
};

} // namespace objreg
