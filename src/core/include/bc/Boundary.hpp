#pragma once
#include "mesh/Field.hpp"
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @file Boundary.hpp
 * @brief Face vocabulary and ghost-layer fill operators for registered scalar fields.
 *
 * @details
 * Operators fill **every** ghost layer ``l = 1..ng`` on one of the six axis-aligned faces of a
 * :cpp:class:`objreg::mesh::Field`. Edges and corners are left alone; applying BCs on several
 * axes means the last face write wins there.
 *
 * - **Dirichlet**: :math:`f_{\text{ghost}} = c`.
 * - **Zero gradient**: constant extrapolation of the nearest interior value,
 *   :math:`f(-l) = f(0)` (first order).
 * - **Extrapolate1**: linear extrapolation from the first two interior cells,
 *   :math:`d = f(0) - f(1)`, :math:`f(-l) = f(0) + l\,d`. Needs at least 2 interior cells
 *   along the face normal.
 * - **Mapped**: ghost cells take the nearest interior value of **another** field with the same
 *   geometry (e.g. a temperature BC driven by a reference field owned by another module).
 *
 * Unit spacing along the normal is assumed.
 *
 * @rst
 *.. code-block:: cpp
 *
 *   using namespace objreg::bc;
 *   apply_dirichlet(T, parse_face("x-"), 400.0);
 *   apply_zero_gradient(T, Face{Axis::K, +1});
 * @endrst
 */

namespace objreg::bc
{

enum class Axis : std::uint8_t
{
    I = 0,
    J = 1,
    K = 2
};

struct Face
{
    Axis axis = Axis::I;
    int sign = -1; // -1 minus face, +1 plus face

    bool operator==(const Face&) const = default;
};

// Accepts x-|x+|y-|y+|z-|z+ and west|east|south|north|bottom|top.
inline Face parse_face(std::string_view s)
{
    if (s == "x-" || s == "west")
        return {Axis::I, -1};
    if (s == "x+" || s == "east")
        return {Axis::I, +1};
    if (s == "y-" || s == "south")
        return {Axis::J, -1};
    if (s == "y+" || s == "north")
        return {Axis::J, +1};
    if (s == "z-" || s == "bottom")
        return {Axis::K, -1};
    if (s == "z+" || s == "top")
        return {Axis::K, +1};
    throw std::invalid_argument("unknown face '" + std::string(s) + "'");
}

inline std::string to_string(Face f)
{
    static constexpr const char* axes = "xyz";
    return std::string(1, axes[static_cast<int>(f.axis)]) + (f.sign < 0 ? "-" : "+");
}

// Visits each ghost cell on `face`: fn(ghost ijk, layer l, nearest interior ijk).
template <class T, class Fn> void for_each_ghost(const mesh::Field<T>& f, Face face, Fn&& fn)
{
    const int a = static_cast<int>(face.axis);
    const int b = (a + 1) % 3;
    const int c = (a + 2) % 3;
    const auto& n = f.local();
    const int edge = face.sign < 0 ? 0 : n[a] - 1;

    std::array<int, 3> g{}, in{};
    for (int ic = 0; ic < n[c]; ++ic)
        for (int ib = 0; ib < n[b]; ++ib)
        {
            in[a] = edge;
            in[b] = g[b] = ib;
            in[c] = g[c] = ic;
            for (int l = 1; l <= f.ng(); ++l)
            {
                g[a] = face.sign < 0 ? -l : n[a] - 1 + l;
                fn(g, l, in);
            }
        }
}

template <class T> inline T& at(mesh::Field<T>& f, const std::array<int, 3>& ijk) noexcept
{
    return f(ijk[0], ijk[1], ijk[2]);
}
template <class T>
inline const T& at(const mesh::Field<T>& f, const std::array<int, 3>& ijk) noexcept
{
    return f(ijk[0], ijk[1], ijk[2]);
}

template <class T> void apply_dirichlet(mesh::Field<T>& f, Face face, T value)
{
    for_each_ghost(f, face, [&](const auto& g, int, const auto&) { at(f, g) = value; });
}

template <class T> void apply_zero_gradient(mesh::Field<T>& f, Face face)
{
    for_each_ghost(f, face, [&](const auto& g, int, const auto& in) { at(f, g) = at(f, in); });
}

template <class T> void apply_extrapolate1(mesh::Field<T>& f, Face face)
{
    const int a = static_cast<int>(face.axis);
    if (f.local()[a] < 2)
        throw std::invalid_argument("extrapolate on face " + to_string(face) + " of '" +
                                    f.name() + "' needs >= 2 interior cells along the normal");
    for_each_ghost(f, face,
                   [&](const auto& g, int l, const auto& in)
                   {
                       auto in2 = in;
                       in2[a] -= face.sign; // one cell further inside
                       const T f0 = at(f, in);
                       const T d = f0 - at(f, in2);
                       at(f, g) = f0 + static_cast<T>(l) * d;
                   });
}

template <class T> void apply_mapped(mesh::Field<T>& f, const mesh::Field<T>& src, Face face)
{
    if (src.local() != f.local() || src.ng() != f.ng())
        throw std::invalid_argument("mapped BC: '" + src.name() + "' and '" + f.name() +
                                    "' have different geometry");
    for_each_ghost(f, face, [&](const auto& g, int, const auto& in) { at(f, g) = at(src, in); });
}

} // namespace objreg::bc
