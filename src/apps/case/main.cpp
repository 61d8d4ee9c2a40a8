#include "bc/Table.hpp"
#include "objreg/Case.hpp"
#include "objreg/Errors.hpp"
#include "objreg/Log.hpp"
#include "objreg/io/CaseConfig.hpp"
#include "objreg/io/DictSink.hpp"
#include "objreg/io/NullSink.hpp"
#include "objreg/io/YamlSink.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include <mpi.h>
#include <yaml-cpp/yaml.h>

using objreg::Case;
using objreg::io::CaseConfig;
using objreg::io::DictSink;
using objreg::io::load_case_from_yaml;
using objreg::io::NullSink;
using objreg::io::YamlSink;

// Initializes MPI exactly once and finalizes it only if we were the owner.
// Safe under mpirun or standalone.
struct MpiOnce
{
    bool owner{false};

    MpiOnce(int& argc, char**& argv)
    {
        int inited = 0;
        MPI_Initialized(&inited);
        if (!inited)
        {
            MPI_Init(&argc, &argv);
            owner = true;
        }
    }
    ~MpiOnce()
    {
        int fin = 0;
        MPI_Finalized(&fin);
        if (!fin && owner)
            MPI_Finalize();
    }
};

static int persist_case(const Case& C, const CaseConfig::Output& out, int rank, int size)
{
    using Format = CaseConfig::Output::Format;

    if (out.format == Format::Null)
    {
        NullSink sink;
        C.persist(sink);
        return 0;
    }

    // Each rank owns its own tree: ranks > 0 write "<path>.r<rank>", stdout is rank 0 only.
    std::ofstream file;
    std::ostream* os = &std::cout;
    if (out.path != "-")
    {
        const std::string path = size > 1 ? out.path + ".r" + std::to_string(rank) : out.path;
        file.open(path);
        if (!file)
        {
            LOGE("[output] cannot open '%s'\n", path.c_str());
            return 1;
        }
        os = &file;
        LOGI("[output] writing %s\n", path.c_str());
    }
    else if (rank != 0)
    {
        return 0;
    }

    if (out.format == Format::Yaml)
    {
        YamlSink sink;
        C.persist(sink);
        *os << sink.str() << '\n';
    }
    else
    {
        DictSink sink{*os};
        C.persist(sink);
    }
    os->flush();
    return *os ? 0 : 1;
}

int main(int argc, char** argv)
{
    MpiOnce runtime(argc, argv);

    // INFO/DEBUG from rank 0 only; OBJREG_LOG=quiet|error|warn|info|debug overrides
    objreg::logx::init({objreg::logx::Level::Info, /*rank0_only*/ true});

    int rank = 0, size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const std::string cfg_path = (argc > 1) ? argv[1] : "case.yaml";

    try
    {
        const CaseConfig cfg = load_case_from_yaml(cfg_path);
        // Environment wins over the case file
        if (cfg.log_level && !std::getenv("OBJREG_LOG"))
            objreg::logx::set_level(*cfg.log_level);
        LOGD("[config] %s loaded, log level %s\n", cfg_path.c_str(),
             objreg::logx::level_name(objreg::logx::level()));

        objreg::bc::Table table;
        objreg::bc::register_builtin_bcs(table);

        Case C(cfg, table);
        C.apply_boundaries();
        return persist_case(C, cfg.output, rank, size);
    }
    catch (const objreg::RegistryError& e)
    {
        LOGE("[registry] %s\n", e.what());
    }
    catch (const YAML::Exception& e)
    {
        LOGE("[config] %s: %s\n", cfg_path.c_str(), e.what());
    }
    catch (const std::exception& e)
    {
        LOGE("%s\n", e.what());
    }
    return 1;
}
