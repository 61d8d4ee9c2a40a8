#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception types raised by :cpp:class:`objreg::Registry` operations.
 *
 * @details
 * Every registry failure is synchronous and catchable. All types derive from
 * :cpp:class:`objreg::RegistryError` so callers that only care about "the lookup failed" can
 * catch one base, while callers that defer work (e.g. "producer not registered yet") catch
 * :cpp:class:`objreg::NotFoundError` specifically.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   try {
 *     auto& T = mesh.lookup_typed<Field<double>>("T");
 *   } catch (const objreg::NotFoundError&) {
 *     // producer has not registered "T" yet
 *   } catch (const objreg::TypeMismatchError& e) {
 *     LOGE("%s\n", e.what());
 *   }
 * @endrst
 */

namespace objreg
{

struct RegistryError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Name already taken among the direct children of a registry.
struct DuplicateNameError : RegistryError
{
    using RegistryError::RegistryError;
};

// No entry with that name at any searched level.
struct NotFoundError : RegistryError
{
    using RegistryError::RegistryError;
};

// Entry exists but is not of the requested kind.
struct TypeMismatchError : RegistryError
{
    using RegistryError::RegistryError;
};

// Insertion would break the tree shape (second parent, cycle, root object, re-parenting).
struct HierarchyError : RegistryError
{
    using RegistryError::RegistryError;
};

// Empty name or name containing the path separator '/'.
struct InvalidNameError : RegistryError
{
    using RegistryError::RegistryError;
};

} // namespace objreg
