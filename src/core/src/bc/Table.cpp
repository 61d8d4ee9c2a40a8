#include "bc/Table.hpp"
#include "objreg/Errors.hpp"
#include <algorithm>

using namespace objreg::bc;

std::vector<std::string> Table::keys() const
{
    std::vector<std::string> out;
    out.reserve(creators_.size());
    for (const auto& kv : creators_)
        out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<IBoundaryCondition> Table::make(BCInfo info, const KV& params) const
{
    auto it = creators_.find(info.type);
    if (it == creators_.end())
        throw objreg::NotFoundError("No boundary condition for key: " + info.type);
    return it->second(std::move(info), params);
}
