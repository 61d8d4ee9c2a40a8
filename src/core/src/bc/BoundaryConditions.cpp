#include "bc/BoundaryCondition.hpp"
#include "bc/Table.hpp"
#include "objreg/Log.hpp"
#include "objreg/Registry.hpp"
#include <stdexcept>

using namespace objreg;
using namespace objreg::bc;
using mesh::ScalarField;

mesh::ScalarField& BCBase::target(Registry& mesh) const
{
    return mesh.lookup_typed<ScalarField>(info_.field);
}

namespace
{

const std::string& require(const KV& kv, const BCInfo& info, const char* key)
{
    auto it = kv.find(key);
    if (it == kv.end())
        throw std::invalid_argument(info.type + " BC on '" + info.field + "': missing '" + key +
                                    "'");
    return it->second;
}

double parse_double(const std::string& s, const BCInfo& info, const char* key)
{
    try
    {
        std::size_t used = 0;
        const double v = std::stod(s, &used);
        if (used == s.size())
            return v;
    }
    catch (const std::logic_error&)
    {
        // fall through to the common message (stod throws invalid_argument/out_of_range)
    }
    throw std::invalid_argument(info.type + " BC on '" + info.field + "': '" + key + "' = '" + s +
                                "' is not a number");
}

struct DirichletBC final : BCBase
{
    DirichletBC(BCInfo info, double value) : BCBase(std::move(info)), value_(value) {}
    void apply(Registry& mesh) override { apply_dirichlet(target(mesh), info_.face, value_); }

  private:
    double value_;
};

struct ZeroGradientBC final : BCBase
{
    using BCBase::BCBase;
    void apply(Registry& mesh) override { apply_zero_gradient(target(mesh), info_.face); }
};

struct ExtrapolateBC final : BCBase
{
    using BCBase::BCBase;
    void apply(Registry& mesh) override { apply_extrapolate1(target(mesh), info_.face); }
};

// Ghosts of the target follow the interior of another registered field.
struct MappedBC final : BCBase
{
    MappedBC(BCInfo info, std::string source) : BCBase(std::move(info)), source_(std::move(source))
    {
    }
    void apply(Registry& mesh) override
    {
        const auto& src = mesh.lookup_typed<ScalarField>(source_);
        apply_mapped(target(mesh), src, info_.face);
    }

  private:
    std::string source_;
};

} // namespace

void objreg::bc::register_builtin_bcs(Table& t)
{
    t.add("dirichlet",
          [](BCInfo info, const KV& kv) -> std::unique_ptr<IBoundaryCondition>
          {
              const double v = parse_double(require(kv, info, "value"), info, "value");
              return std::make_unique<DirichletBC>(std::move(info), v);
          });
    t.add("zero_gradient", [](BCInfo info, const KV&) -> std::unique_ptr<IBoundaryCondition>
          { return std::make_unique<ZeroGradientBC>(std::move(info)); });
    t.add("extrapolate", [](BCInfo info, const KV&) -> std::unique_ptr<IBoundaryCondition>
          { return std::make_unique<ExtrapolateBC>(std::move(info)); });
    t.add("mapped",
          [](BCInfo info, const KV& kv) -> std::unique_ptr<IBoundaryCondition>
          {
              std::string src = require(kv, info, "source");
              if (src == info.field)
                  throw std::invalid_argument("mapped BC on '" + info.field +
                                              "': source must differ from the target");
              return std::make_unique<MappedBC>(std::move(info), std::move(src));
          });
    LOGD("[bc] %zu builtin boundary conditions registered\n", t.keys().size());
}
