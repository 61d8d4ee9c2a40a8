#include "objreg/Registry.hpp"
#include "objreg/Log.hpp"
#include "objreg/io/ISink.hpp"
#include <algorithm>
#include <utility>

using namespace objreg;

namespace
{

void check_name(std::string_view name, const std::string& where)
{
    if (name.empty())
        throw InvalidNameError("empty name in '" + where + "'");
    if (name.find('/') != std::string_view::npos)
        throw InvalidNameError("name '" + std::string(name) + "' in '" + where +
                               "' contains '/'");
}

} // namespace

Registry::Registry(std::string name) : Registerable(std::move(name)) {}

Registry::Registry(std::string name, Registry& parent) : Registerable(std::move(name), parent) {}

Registry::~Registry()
{
    if (!order_.empty())
        LOGD("[registry] '%s' destroyed with %zu entries still registered\n", this->name().c_str(),
             order_.size());
    auto orphan = [](Registerable* e)
    {
        e->registered_ = false;
        e->owner_ = nullptr;
        e->orphaned_ = true;
        e->key_.clear();
        e->last_key_.clear();
    };
    for (Registerable* e : order_)
        orphan(e);
    for (Registerable* e : detached_)
        orphan(e);
}

// ---------------------- mutation -----------------------------------

void Registry::insert(std::string name, Registerable& entry)
{
    check_name(name, path());
    if (reserved_key(name))
        throw InvalidNameError("name '" + name + "' is reserved in " +
                               std::string(type_name()) + " '" + path() + "'");

    if (&entry == this)
        throw HierarchyError("cannot insert registry '" + path() + "' into itself");
    if (entry.root_)
        throw HierarchyError("'" + entry.name_ + "' is a root object and cannot be registered");
    if (entry.orphaned_)
        throw HierarchyError("'" + entry.name_ + "' outlived its registry and cannot be re-registered");
    if (entry.registered_)
        throw HierarchyError("'" + entry.name_ + "' is already registered as '" + entry.path() +
                             "'");
    if (entry.owner_ && entry.owner_ != this)
        throw HierarchyError("'" + entry.name_ + "' belongs to '" + entry.owner_->path() +
                             "'; re-parenting into '" + path() + "' is not supported");
    for (const Registerable* p = this; p; p = p->owner_)
        if (p == &entry)
            throw HierarchyError("inserting '" + entry.name_ + "' into '" + path() +
                                 "' would create a cycle");

    if (idx_.count(name))
        throw DuplicateNameError("duplicate name '" + name + "' in '" + path() + "'");

    order_.push_back(&entry);
    idx_.emplace(name, &entry);
    detached_.erase(std::remove(detached_.begin(), detached_.end(), &entry), detached_.end());

    entry.owner_ = this;
    entry.key_ = std::move(name);
    entry.registered_ = true;

    LOGD("[registry] insert '%s' into '%s'\n", entry.key_.c_str(), this->name().c_str());
}

Registerable& Registry::remove(std::string_view name)
{
    auto it = idx_.find(std::string(name));
    if (it == idx_.end())
        throw NotFoundError(not_found_message(name, "in"));
    Registerable& e = *it->second;
    detach(e);
    return e;
}

void Registry::detach(Registerable& entry) noexcept
{
    LOGD("[registry] remove '%s' from '%s'\n", entry.key_.c_str(), this->name().c_str());
    idx_.erase(entry.key_);
    order_.erase(std::remove(order_.begin(), order_.end(), &entry), order_.end());
    entry.registered_ = false;
    entry.last_key_ = std::move(entry.key_);
    entry.key_.clear();
    detached_.push_back(&entry);
}

void Registry::forget(Registerable& entry) noexcept
{
    if (entry.registered_)
        detach(entry);
    detached_.erase(std::remove(detached_.begin(), detached_.end(), &entry), detached_.end());
}

// ---------------------- lookup -------------------------------------

Registerable* Registry::find(std::string_view name, bool recursive) const noexcept
{
    auto it = idx_.find(std::string(name));
    if (it != idx_.end())
        return it->second;
    if (!recursive)
        return nullptr;
    for (Registerable* e : order_)
        if (auto* sub = dynamic_cast<const Registry*>(e))
            if (Registerable* hit = sub->find(name, true))
                return hit;
    return nullptr;
}

Registerable& Registry::lookup(std::string_view name, bool recursive)
{
    Registerable* e = find(name, recursive);
    if (!e)
        throw NotFoundError(not_found_message(name, recursive ? "anywhere below" : "in"));
    return *e;
}

const Registerable& Registry::lookup(std::string_view name, bool recursive) const
{
    const Registerable* e = find(name, recursive);
    if (!e)
        throw NotFoundError(not_found_message(name, recursive ? "anywhere below" : "in"));
    return *e;
}

Registerable& Registry::lookup_path(std::string_view rel_path)
{
    Registry* cur = this;
    std::size_t pos = 0;
    for (;;)
    {
        const std::size_t slash = rel_path.find('/', pos);
        const std::string_view part = rel_path.substr(pos, slash == std::string_view::npos
                                                               ? std::string_view::npos
                                                               : slash - pos);
        if (slash == std::string_view::npos)
            return cur->lookup(part);
        cur = &cur->lookup_typed<Registry>(part);
        pos = slash + 1;
    }
}

bool Registry::contains(std::string_view name, bool recursive) const noexcept
{
    return find(name, recursive) != nullptr;
}

std::vector<std::string> Registry::names() const
{
    std::vector<std::string> out;
    out.reserve(order_.size());
    for (const Registerable* e : order_)
        out.push_back(e->key_);
    return out;
}

std::vector<std::string> Registry::sorted_names() const
{
    auto out = names();
    std::sort(out.begin(), out.end());
    return out;
}

const Registry& Registry::top() const noexcept
{
    const Registry* r = this;
    while (r->parent())
        r = r->parent();
    return *r;
}

// ---------------------- persistence --------------------------------

void Registry::persist_all(io::ISink& sink) const
{
    for (const Registerable* e : order_)
    {
        sink.begin_block(e->key_);
        sink.write_entry("type", e->type_name());
        e->serialize(sink);
        sink.end_block();
    }
}

void Registry::serialize(io::ISink& sink) const
{
    persist_all(sink);
}

// ---------------------- messages -----------------------------------

std::string Registry::mismatch_message(const Registerable& found, const char* wanted) const
{
    return "entry '" + found.path() + "' is a " + std::string(found.type_name()) +
           ", not the requested type (" + wanted + ")";
}

std::string Registry::not_found_message(std::string_view name, const char* where) const
{
    return "no entry '" + std::string(name) + "' " + where + " '" + path() + "'";
}
