#pragma once
#include "objreg/Registerable.hpp"
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @file Dictionary.hpp
 * @brief Registered key/value settings (e.g. ``transportProperties``).
 *
 * @details
 * Values are stored as strings and converted on read through yaml-cpp, so ``"1e-5"`` reads
 * back as a double and ``"[1, 2, 3]"`` as a ``std::vector<int>``. Entries are serialized in
 * key order inside an ``entries`` block, so a user key such as ``type`` never meets the
 * block's own ``type`` entry.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   objreg::Dictionary props{"transportProperties", run};
 *   props.set("nu", "1.5e-5");
 *
 *   // elsewhere, with only the registry at hand:
 *   const auto& d = fluid.lookup_in_ancestors<objreg::Dictionary>("transportProperties");
 *   double nu = d.get_as<double>("nu");
 * @endrst
 */

namespace objreg
{

class Registry;

class Dictionary final : public Registerable
{
  public:
    Dictionary(std::string name, Registry& owner);
    // Copies a YAML map. Scalars are stored verbatim, sequences and maps as flow-style YAML
    // text. Throws std::runtime_error when `entries` is neither a map nor null.
    Dictionary(std::string name, Registry& owner, const YAML::Node& entries);

    void set(std::string key, std::string value);
    bool contains(std::string_view key) const noexcept;

    // Throws std::runtime_error naming the dictionary and key when missing.
    const std::string& get(std::string_view key) const;
    std::string get_or(std::string_view key, std::string fallback) const;

    template <class V> V get_as(std::string_view key) const
    {
        const std::string& raw = get(key);
        try
        {
            return YAML::Load(raw).as<V>();
        }
        catch (const YAML::Exception& e)
        {
            throw std::runtime_error("Dictionary '" + name() + "': cannot convert '" +
                                     std::string(key) + "' = '" + raw + "': " + e.what());
        }
    }

    std::vector<std::string> keys() const;
    std::size_t size() const noexcept { return entries_.size(); }

    std::string_view type_name() const noexcept override { return "dictionary"; }
    void serialize(io::ISink& sink) const override;

  private:
    std::map<std::string, std::string, std::less<>> entries_;
};

} // namespace objreg
