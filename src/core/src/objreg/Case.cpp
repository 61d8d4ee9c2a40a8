#include "objreg/Case.hpp"
#include "objreg/Log.hpp"

namespace objreg
{

Case::Case(const io::CaseConfig& cfg, const bc::Table& table) : root_(cfg.case_name)
{
    logx::Scope scope{root_.path()};

    for (const auto& r : cfg.regions)
        regions_.push_back(
            std::make_unique<mesh::Mesh>(cfg.resolve_name(r.name), root_, r.local, r.ng));

    for (const auto& d : cfg.dictionaries)
    {
        Registry& owner = d.region.empty()
                              ? root_
                              : static_cast<Registry&>(region(cfg.resolve_name(d.region)));
        dicts_.push_back(std::make_unique<Dictionary>(cfg.resolve_name(d.name), owner, d.entries));
    }

    for (std::size_t i = 0; i < cfg.regions.size(); ++i)
        for (const auto& f : cfg.regions[i].fields)
            fields_.push_back(
                std::make_unique<mesh::ScalarField>(cfg.resolve_name(f.name), *regions_[i], f.value));

    for (std::size_t i = 0; i < cfg.regions.size(); ++i)
    {
        for (const auto& b : cfg.regions[i].boundaries)
        {
            bc::BCInfo info{b.type, cfg.resolve_name(b.field), bc::parse_face(b.face)};
            bc::KV params = b.params;
            if (auto it = params.find("source"); it != params.end())
                it->second = cfg.resolve_name(it->second);
            bcs_.push_back(BoundBC{regions_[i].get(), table.make(std::move(info), params)});
        }
    }

    LOGI("[case] %zu regions, %zu dictionaries, %zu fields, %zu boundary conditions\n",
         regions_.size(), dicts_.size(), fields_.size(), bcs_.size());
}

void Case::apply_boundaries()
{
    for (auto& b : bcs_)
    {
        const auto& info = b.bc->info();
        logx::Scope where{b.region->path()};
        LOGD("[bc] apply %s on %s face %s\n", info.type.c_str(), info.field.c_str(),
             bc::to_string(info.face).c_str());
        b.bc->apply(*b.region);
    }
}

} // namespace objreg
