#pragma once
#include <string>
#include <string_view>

/**
 * @file Registerable.hpp
 * @brief Base for objects with lifetime-scoped membership in a :cpp:class:`objreg::Registry`.
 *
 * @details
 * A Registerable is constructed against the registry it joins and is inserted there under its
 * name before the constructor returns. The destructor removes it again, so a registry never
 * holds a pointer to a destroyed object, whichever path (scope exit, unwinding, ``reset()``)
 * ends its life.
 *
 * Objects built without a registry are **roots**: they are never inserted anywhere and
 * :cpp:func:`objreg::Registry::insert` rejects them.
 *
 * The owning registry is fixed at construction. :cpp:func:`check_out` / :cpp:func:`check_in`
 * temporarily remove and re-insert the object in that same registry; moving it to another
 * registry is not supported.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct Probe final : objreg::Registerable {
 *     Probe(std::string n, objreg::Registry& r) : Registerable(std::move(n), r) {}
 *     std::string_view type_name() const noexcept override { return "probe"; }
 *     void serialize(objreg::io::ISink& s) const override { s.write_entry("hits", "0"); }
 *   };
 *
 *   objreg::Registry mesh{"mesh"};
 *   {
 *     Probe p{"p", mesh};      // mesh.contains("p") == true
 *   }                          // mesh.contains("p") == false
 * @endrst
 *
 * @note Registerables are neither copyable nor movable: their address is what is registered.
 */

namespace objreg
{

class Registry;

namespace io
{
    class ISink;
}

class Registerable
{
  public:
    virtual ~Registerable();

    Registerable(const Registerable&) = delete;
    Registerable& operator=(const Registerable&) = delete;
    Registerable(Registerable&&) = delete;
    Registerable& operator=(Registerable&&) = delete;

    const std::string& name() const noexcept { return name_; }

    // Registry this object was first inserted into (nullptr for roots and once the owner
    // itself has been destroyed, registered or checked out).
    Registry* owner() const noexcept { return owner_; }

    // Name this object is currently registered under (empty when not registered).
    const std::string& key() const noexcept { return key_; }

    bool is_root() const noexcept { return root_; }
    bool registered() const noexcept { return registered_; }
    // Owning registry was destroyed while this object was still registered.
    bool orphaned() const noexcept { return orphaned_; }

    // Slash-separated path from the top registry, e.g. "case/fluid/T".
    std::string path() const;

    // Kind label used in sink output and error messages.
    virtual std::string_view type_name() const noexcept { return "object"; }

    virtual void serialize(io::ISink& sink) const = 0;

    // Re-insert into the owning registry after a check_out()/remove(), under the key it was
    // last registered with. Throws the same errors as Registry::insert.
    void check_in();
    // Remove from the owning registry, keeping the object alive. No-op when not registered.
    void check_out() noexcept;

  protected:
    // Root object: never registered anywhere.
    explicit Registerable(std::string name);
    // Inserted into `owner` under `name`; throws if the insertion fails.
    Registerable(std::string name, Registry& owner);

  private:
    friend class Registry;

    std::string name_;
    std::string key_;
    std::string last_key_; // key before the last detach, used by check_in()
    Registry* owner_{nullptr};
    bool root_{false};
    bool registered_{false};
    bool orphaned_{false};
};

} // namespace objreg
