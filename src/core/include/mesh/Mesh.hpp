#pragma once
#include "objreg/Registry.hpp"
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

/**
 * @file Mesh.hpp
 * @brief One structured mesh region, which is also the registry its fields live in.
 *
 * Holds the interior cell counts and the uniform ghost width \c ng. Utility methods return
 * ghost-inclusive extents and the volume used when fields allocate storage. Being a
 * :cpp:class:`objreg::Registry`, the mesh is "the database" that fields, dictionaries and
 * boundary conditions of the region share: producers register into it, consumers look names
 * up in it.
 *
 * @rst
 *.. code-block:: cpp
 *
 *   objreg::Registry run{"cavity"};
 *   objreg::mesh::Mesh fluid{"fluid", run, {16, 16, 1}, 1};
 *   fluid.extents();            // {18, 18, 3}
 *   fluid.volume_with_ghosts(); // 972
 * @endrst
 *
 * @throws std::invalid_argument when an interior size is < 1 or \c ng < 0.
 */

namespace objreg::mesh
{

class Mesh : public Registry
{
  public:
    // Region registered under `parent`.
    Mesh(std::string name, Registry& parent, std::array<int, 3> local, int ng);
    // Stand-alone region (top of its own tree).
    Mesh(std::string name, std::array<int, 3> local, int ng);

    const std::array<int, 3>& local() const noexcept { return local_; }
    int ng() const noexcept { return ng_; }

    std::array<int, 3> extents() const noexcept
    {
        return {local_[0] + 2 * ng_, local_[1] + 2 * ng_, local_[2] + 2 * ng_};
    }
    std::size_t volume_with_ghosts() const noexcept
    {
        const auto e = extents();
        return static_cast<std::size_t>(e[0]) * static_cast<std::size_t>(e[1]) *
               static_cast<std::size_t>(e[2]);
    }
    std::size_t interior_cells() const noexcept
    {
        return static_cast<std::size_t>(local_[0]) * static_cast<std::size_t>(local_[1]) *
               static_cast<std::size_t>(local_[2]);
    }

    std::string_view type_name() const noexcept override { return "mesh"; }
    void serialize(io::ISink& sink) const override;

  protected:
    bool reserved_key(std::string_view key) const noexcept override
    {
        return key == "local" || key == "ng" || Registry::reserved_key(key);
    }

  private:
    void validate() const;

    std::array<int, 3> local_{};
    int ng_ = 0;
};

} // namespace objreg::mesh
