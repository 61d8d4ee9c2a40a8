#pragma once
#include "objreg/Log.hpp"
#include <array>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @file   CaseConfig.hpp
 * @brief  YAML → CaseConfig loader and schema for the ``objreg_case`` app.
 *
 * @details
 * @rst
 * The **case file** describes which registries and objects to build. This file defines:
 *
 * - :cpp:struct:`CaseConfig`: the strongly-typed config object
 * - :cpp:func:`load_case_from_yaml` / :cpp:func:`parse_case`: loaders
 *
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    case: <string>                 # name of the root registry
 *    log: info                      # quiet | error | warn | info | debug (optional)
 *
 *    output:
 *      format: dict                 # dict | yaml | null
 *      path: "-"                    # "-" = stdout, else a file path
 *
 *    names:                         # default name -> registered name
 *      T: temperature
 *
 *    dictionaries:
 *      - name: transportProperties
 *        region: fluid              # optional; omitted = case root
 *        entries: { nu: "1e-5" }
 *
 *    regions:
 *      - name: fluid
 *        local: [nx, ny, nz]        # interior sizes (ints)
 *        ng: 1                      # uniform ghost width
 *        fields:
 *          - { name: T, value: 300.0 }
 *        boundaries:
 *          - { field: T, face: x-, type: dirichlet, params: { value: "400" } }
 *
 * **Semantics**
 *
 * - Every default name (regions, fields, dictionaries, BC ``field`` and ``source``) goes
 *   through :cpp:func:`CaseConfig::resolve_name` before use, so one override renames the
 *   object and every reference to it.
 * - BCs are built after all fields of the case exist and applied in file order.
 * - Malformed entries raise ``std::runtime_error`` naming the offending key.
 * @endrst
 */

namespace objreg::io
{

struct CaseConfig
{
    std::string case_name = "case";
    std::optional<logx::Level> log_level;

    struct Output
    {
        enum class Format
        {
            Dict,
            Yaml,
            Null
        };
        Format format = Format::Dict;
        std::string path = "-";
    } output;

    std::unordered_map<std::string, std::string> names;

    struct DictSpec
    {
        std::string name;
        std::string region; // empty = case root
        YAML::Node entries;
    };
    std::vector<DictSpec> dictionaries;

    struct FieldSpec
    {
        std::string name;
        double value = 0.0;
    };
    struct BCSpec
    {
        std::string field;
        std::string face;
        std::string type;
        std::unordered_map<std::string, std::string> params;
    };
    struct RegionSpec
    {
        std::string name;
        std::array<int, 3> local{1, 1, 1};
        int ng = 1;
        std::vector<FieldSpec> fields;
        std::vector<BCSpec> boundaries;
    };
    std::vector<RegionSpec> regions;

    // Override from `names`, or the default unchanged.
    std::string resolve_name(std::string_view dflt) const
    {
        auto it = names.find(std::string(dflt));
        return it == names.end() ? std::string(dflt) : it->second;
    }
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

static inline CaseConfig::Output::Format parse_format(const std::string& s)
{
    const auto v = to_lower(s);
    if (v == "dict")
        return CaseConfig::Output::Format::Dict;
    if (v == "yaml")
        return CaseConfig::Output::Format::Yaml;
    if (v == "null" || v == "none")
        return CaseConfig::Output::Format::Null;
    throw std::runtime_error("output.format: unknown value '" + s + "'");
}

static inline std::string required_string(const YAML::Node& n, const char* key,
                                          const std::string& where)
{
    auto v = n[key];
    if (!v || !v.IsScalar())
        throw std::runtime_error(where + ": missing '" + key + "'");
    return v.as<std::string>();
}

inline CaseConfig parse_case(const YAML::Node& root)
{
    CaseConfig cfg;

    if (auto n = root["case"])
        cfg.case_name = n.as<std::string>();
    if (auto n = root["log"])
        cfg.log_level = logx::parse_level(n.as<std::string>());

    if (auto O = root["output"])
    {
        if (auto n = O["format"])
            cfg.output.format = parse_format(n.as<std::string>());
        if (auto n = O["path"])
            cfg.output.path = n.as<std::string>();
    }

    if (auto N = root["names"])
    {
        for (auto it = N.begin(); it != N.end(); ++it)
            cfg.names.emplace(it->first.as<std::string>(), it->second.as<std::string>());
    }

    if (auto D = root["dictionaries"])
    {
        for (const auto& item : D)
        {
            CaseConfig::DictSpec d;
            d.name = required_string(item, "name", "dictionaries[]");
            if (auto r = item["region"])
                d.region = r.as<std::string>();
            if (auto e = item["entries"])
                d.entries = e;
            cfg.dictionaries.push_back(std::move(d));
        }
    }

    if (auto R = root["regions"])
    {
        for (const auto& item : R)
        {
            CaseConfig::RegionSpec r;
            r.name = required_string(item, "name", "regions[]");
            const std::string where = "regions[" + r.name + "]";
            if (auto L = item["local"])
            {
                auto v = L.as<std::vector<int>>();
                if (v.size() != 3)
                    throw std::runtime_error(where + ".local: expected 3 ints");
                r.local = {v[0], v[1], v[2]};
            }
            if (auto n = item["ng"])
                r.ng = n.as<int>();

            if (auto F = item["fields"])
            {
                for (const auto& f : F)
                {
                    CaseConfig::FieldSpec fs;
                    fs.name = required_string(f, "name", where + ".fields[]");
                    if (auto v = f["value"])
                        fs.value = v.as<double>();
                    r.fields.push_back(std::move(fs));
                }
            }

            if (auto B = item["boundaries"])
            {
                for (const auto& b : B)
                {
                    CaseConfig::BCSpec bs;
                    bs.field = required_string(b, "field", where + ".boundaries[]");
                    bs.face = required_string(b, "face", where + ".boundaries[" + bs.field + "]");
                    bs.type = required_string(b, "type", where + ".boundaries[" + bs.field + "]");
                    if (auto P = b["params"])
                    {
                        for (auto it = P.begin(); it != P.end(); ++it)
                            bs.params.emplace(it->first.as<std::string>(),
                                              it->second.as<std::string>());
                    }
                    r.boundaries.push_back(std::move(bs));
                }
            }
            cfg.regions.push_back(std::move(r));
        }
    }

    return cfg;
}

inline CaseConfig load_case_from_yaml(const std::string& path)
{
    return parse_case(YAML::LoadFile(path));
}

inline CaseConfig load_case_from_string(const std::string& text)
{
    return parse_case(YAML::Load(text));
}

} // namespace objreg::io
