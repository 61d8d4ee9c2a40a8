#pragma once
#include "bc/BoundaryCondition.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Table.hpp
 * @brief String-keyed creation table for boundary conditions.
 *
 * @details
 * The table is filled once at startup (:cpp:func:`register_builtin_bcs` plus any
 * application-specific entries) and then used to build BCs from configuration by key. Each
 * creator receives the target :cpp:struct:`BCInfo` and the free-form parameters of that BC.
 *
 * Builtins: ``dirichlet`` (``value``), ``zero_gradient``, ``extrapolate``, ``mapped``
 * (``source``: name of the field whose interior feeds the ghosts).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   objreg::bc::Table T;
 *   objreg::bc::register_builtin_bcs(T);
 *   auto bc = T.make({"dirichlet", "T", parse_face("x-")}, {{"value", "400"}});
 *   bc->apply(fluid);
 * @endrst
 */

namespace objreg::bc
{

class Table
{
  public:
    using Create = std::function<std::unique_ptr<IBoundaryCondition>(BCInfo, const KV&)>;

    // Replaces an existing creator with the same key.
    void add(std::string key, Create f) { creators_[std::move(key)] = std::move(f); }
    bool contains(const std::string& key) const noexcept { return creators_.count(key) != 0; }
    std::vector<std::string> keys() const;

    // Throws objreg::NotFoundError for an unknown info.type, std::invalid_argument for bad
    // parameters.
    std::unique_ptr<IBoundaryCondition> make(BCInfo info, const KV& params) const;

  private:
    std::unordered_map<std::string, Create> creators_;
};

void register_builtin_bcs(Table& t);

} // namespace objreg::bc
