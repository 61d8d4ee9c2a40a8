#pragma once
#include "objreg/Errors.hpp"
#include "objreg/Registerable.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <typeinfo>
#include <unordered_map>
#include <vector>

/**
 * @file Registry.hpp
 * @brief Named, tree-structured container of :cpp:class:`objreg::Registerable` objects.
 *
 * @details
 * A Registry maps **names** to non-owning references to registered objects. A Registry is
 * itself a Registerable, so registries nest and form a tree (case → region → fields). Objects
 * are owned by whoever created them; the registry only indexes them, and RAII in
 * :cpp:class:`objreg::Registerable` keeps the index in sync with object lifetimes.
 *
 * **Lookup rules**
 *
 * - Names are case-sensitive and used verbatim (no trimming or normalisation). A name must be
 *   non-empty and must not contain ``/``, which is reserved for :cpp:func:`lookup_path`.
 * - ``lookup(name, false)`` searches direct children only.
 * - ``lookup(name, true)`` checks direct children first, then descends depth-first into nested
 *   registries in insertion order; the first match wins.
 * - ``lookup_typed<T>`` reports a found entry of the wrong kind as
 *   :cpp:class:`objreg::TypeMismatchError`, never as :cpp:class:`objreg::NotFoundError`.
 *
 * **Ordering**: :cpp:func:`names`, :cpp:func:`persist_all` and recursive lookup all follow
 * insertion order.
 *
 * **Threading**: no internal locking. Mutation and persistence must not run concurrently.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   objreg::Registry run{"case"};                 // root: not registered anywhere
 *   objreg::mesh::Mesh fluid{"fluid", run, {8,8,8}, 1};
 *   objreg::mesh::Field<double> T{"T", fluid};
 *
 *   auto& t1 = fluid.lookup_typed<objreg::mesh::Field<double>>("T");
 *   auto& t2 = run.lookup("T", true);             // found through "fluid"
 *   auto& t3 = run.lookup_path("fluid/T");
 *
 *   objreg::io::DictSink sink{std::cout};
 *   run.persist_all(sink);
 * @endrst
 */

namespace objreg
{

class Registry : public Registerable
{
  public:
    // Root registry (a whole case); never registered anywhere.
    explicit Registry(std::string name);
    // Nested registry, inserted into `parent` under `name`.
    Registry(std::string name, Registry& parent);
    ~Registry() override;

    // ---- mutation -------------------------------------------------------------------------
    void insert(std::string name, Registerable& entry);
    Registerable& remove(std::string_view name);

    // ---- lookup ---------------------------------------------------------------------------
    Registerable& lookup(std::string_view name, bool recursive = false);
    const Registerable& lookup(std::string_view name, bool recursive = false) const;

    template <class T> T& lookup_typed(std::string_view name, bool recursive = false)
    {
        Registerable& e = lookup(name, recursive);
        auto* p = dynamic_cast<T*>(&e);
        if (!p)
            throw TypeMismatchError(mismatch_message(e, typeid(T).name()));
        return *p;
    }
    template <class T>
    const T& lookup_typed(std::string_view name, bool recursive = false) const
    {
        const Registerable& e = lookup(name, recursive);
        auto* p = dynamic_cast<const T*>(&e);
        if (!p)
            throw TypeMismatchError(mismatch_message(e, typeid(T).name()));
        return *p;
    }

    // Walks this registry, then each parent up to the top (direct children only at each level).
    template <class T> T& lookup_in_ancestors(std::string_view name)
    {
        for (Registry* r = this; r; r = r->parent())
        {
            if (Registerable* e = r->find(name, false))
            {
                auto* p = dynamic_cast<T*>(e);
                if (!p)
                    throw TypeMismatchError(mismatch_message(*e, typeid(T).name()));
                return *p;
            }
        }
        throw NotFoundError(not_found_message(name, "in any ancestor of"));
    }

    // Slash-separated path relative to this registry, e.g. "fluid/T".
    Registerable& lookup_path(std::string_view rel_path);

    bool contains(std::string_view name, bool recursive = false) const noexcept;

    // Direct children of kind T, in insertion order.
    template <class T> std::vector<T*> entries_of() const
    {
        std::vector<T*> out;
        for (Registerable* e : order_)
            if (auto* p = dynamic_cast<T*>(e))
                out.push_back(p);
        return out;
    }

    std::size_t size() const noexcept { return order_.size(); }
    bool empty() const noexcept { return order_.empty(); }
    std::vector<std::string> names() const;
    std::vector<std::string> sorted_names() const;

    Registry* parent() const noexcept { return owner(); }
    const Registry& top() const noexcept;

    // ---- persistence ----------------------------------------------------------------------
    // Serializes every direct child in insertion order, each inside a block named by its key.
    void persist_all(io::ISink& sink) const;

    std::string_view type_name() const noexcept override { return "registry"; }
    void serialize(io::ISink& sink) const override;

  protected:
    // Keys this registry writes itself when persisted; children may not use them.
    virtual bool reserved_key(std::string_view name) const noexcept { return name == "type"; }

  private:
    friend class Registerable;

    Registerable* find(std::string_view name, bool recursive) const noexcept;
    // Unindexes `entry`; it stays owned (checked out) until re-inserted or destroyed.
    void detach(Registerable& entry) noexcept;
    // Drops every reference to `entry` (called from its destructor).
    void forget(Registerable& entry) noexcept;

    std::string mismatch_message(const Registerable& found, const char* wanted) const;
    std::string not_found_message(std::string_view name, const char* where) const;

    std::unordered_map<std::string, Registerable*> idx_;
    std::vector<Registerable*> order_;    // insertion order
    std::vector<Registerable*> detached_; // owned here but checked out
};

} // namespace objreg
