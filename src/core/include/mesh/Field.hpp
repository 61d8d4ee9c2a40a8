#pragma once
#include "mesh/Mesh.hpp"
#include "objreg/Registerable.hpp"
#include "objreg/io/ISink.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file Field.hpp
 * @brief Cell-centred scalar field that registers itself into its mesh.
 *
 * \c Field\<T\> owns ghost-padded storage sized from its :cpp:class:`objreg::mesh::Mesh` and is
 * inserted into that mesh under its name on construction, so any module holding the mesh can
 * find it with ``mesh.lookup_typed<Field<double>>("T")``. Destroying the field removes it from
 * the mesh.
 *
 * Indexing is interior-relative: ``(0,0,0)`` is the first interior cell and ``(-1,j,k)`` the
 * first ghost layer on the minus-I face. Storage is row-major, I fastest.
 *
 * @tparam T arithmetic element type (e.g., double, float)
 *
 *@rst
 *.. code-block:: cpp
 *
 *   objreg::mesh::Field<double> p{"p", fluid, 101325.0};
 *   p(0, 0, 0) = 1.0e5;
 *   for (double& v : p.span()) v *= 2.0; // ghosts included
 * @endrst
 *
 * @note Bounds are not checked. Prefer unit tests to validate extents.
 */

namespace objreg::mesh
{

namespace layout
{

// Linearization with totals INCLUDING ghosts
struct Indexer3D
{
    int nx{}, ny{}, nz{};
    inline std::size_t operator()(int i, int j, int k) const noexcept
    {
        return static_cast<std::size_t>((k * ny + j) * nx + i);
    }
};

} // namespace layout

template <class T> class Field final : public Registerable
{
    static_assert(std::is_arithmetic_v<T>, "Field<T>: T must be arithmetic");

  public:
    Field(std::string name, Mesh& mesh, T init = T{})
        : Registerable(std::move(name), mesh), local_(mesh.local()), ng_(mesh.ng()),
          ext_(mesh.extents()), idx_{ext_[0], ext_[1], ext_[2]},
          data_(mesh.volume_with_ghosts(), init)
    {
    }

    inline T& operator()(int i, int j, int k) noexcept
    {
        return data_[idx_(i + ng_, j + ng_, k + ng_)];
    }
    inline const T& operator()(int i, int j, int k) const noexcept
    {
        return data_[idx_(i + ng_, j + ng_, k + ng_)];
    }

    // Whole ghost-inclusive buffer.
    std::span<T> span() noexcept { return {data_.data(), data_.size()}; }
    std::span<const T> span() const noexcept { return {data_.data(), data_.size()}; }

    T* raw() noexcept { return data_.data(); }
    const T* raw() const noexcept { return data_.data(); }

    void fill(T v) { std::fill(data_.begin(), data_.end(), v); }

    const std::array<int, 3>& local() const noexcept { return local_; }
    const std::array<int, 3>& extents() const noexcept { return ext_; }
    int ng() const noexcept { return ng_; }

    std::string_view type_name() const noexcept override { return "scalarField"; }

    // Writes geometry and the interior values (ghosts are not persisted).
    void serialize(io::ISink& sink) const override
    {
        sink.write_entry("extents", "(" + std::to_string(ext_[0]) + " " +
                                        std::to_string(ext_[1]) + " " +
                                        std::to_string(ext_[2]) + ")");
        sink.write_entry("ng", std::to_string(ng_));

        std::vector<double> interior;
        interior.reserve(static_cast<std::size_t>(local_[0]) * local_[1] * local_[2]);
        for (int k = 0; k < local_[2]; ++k)
            for (int j = 0; j < local_[1]; ++j)
                for (int i = 0; i < local_[0]; ++i)
                    interior.push_back(static_cast<double>((*this)(i, j, k)));
        sink.write_scalars("internalField", interior);
    }

  private:
    std::array<int, 3> local_{};
    int ng_ = 0;
    std::array<int, 3> ext_{};
    layout::Indexer3D idx_{};
    std::vector<T> data_;
};

using ScalarField = Field<double>;

} // namespace objreg::mesh
