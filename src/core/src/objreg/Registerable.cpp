#include "objreg/Registerable.hpp"
#include "objreg/Registry.hpp"
#include <utility>

using namespace objreg;

Registerable::Registerable(std::string name) : name_(std::move(name)), root_(true) {}

Registerable::Registerable(std::string name, Registry& owner) : name_(std::move(name))
{
    // If this throws the object never finishes construction, so nothing is left registered.
    owner.insert(name_, *this);
}

Registerable::~Registerable()
{
    if (owner_)
        owner_->forget(*this);
}

std::string Registerable::path() const
{
    if (!registered_ || !owner_)
        return name_;
    return owner_->path() + "/" + key_;
}

void Registerable::check_in()
{
    if (registered_)
        return;
    if (!owner_)
        throw HierarchyError("check_in: '" + name_ + "' has no owning registry" +
                             (orphaned_ ? " (owner destroyed)" : ""));
    owner_->insert(last_key_.empty() ? name_ : last_key_, *this);
}

void Registerable::check_out() noexcept
{
    if (registered_ && owner_)
        owner_->detach(*this);
}
