#include "objreg/Dictionary.hpp"
#include "objreg/Registry.hpp"
#include "objreg/io/ISink.hpp"
#include <utility>

using namespace objreg;

Dictionary::Dictionary(std::string name, Registry& owner) : Registerable(std::move(name), owner)
{
}

Dictionary::Dictionary(std::string name, Registry& owner, const YAML::Node& entries)
    : Registerable(std::move(name), owner)
{
    if (!entries || entries.IsNull())
        return;
    if (!entries.IsMap())
        throw std::runtime_error("Dictionary '" + this->name() + "': entries must be a map");

    for (auto it = entries.begin(); it != entries.end(); ++it)
    {
        const auto key = it->first.as<std::string>();
        if (it->second.IsScalar())
        {
            entries_[key] = it->second.as<std::string>();
        }
        else
        {
            YAML::Emitter e;
            e << YAML::Flow << it->second;
            entries_[key] = e.c_str();
        }
    }
}

void Dictionary::set(std::string key, std::string value)
{
    entries_[std::move(key)] = std::move(value);
}

bool Dictionary::contains(std::string_view key) const noexcept
{
    return entries_.find(key) != entries_.end();
}

const std::string& Dictionary::get(std::string_view key) const
{
    auto it = entries_.find(key);
    if (it == entries_.end())
        throw std::runtime_error("Dictionary '" + name() + "': missing key '" +
                                 std::string(key) + "'");
    return it->second;
}

std::string Dictionary::get_or(std::string_view key, std::string fallback) const
{
    auto it = entries_.find(key);
    return it == entries_.end() ? std::move(fallback) : it->second;
}

std::vector<std::string> Dictionary::keys() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_)
        out.push_back(kv.first);
    return out;
}

void Dictionary::serialize(io::ISink& sink) const
{
    sink.begin_block("entries");
    for (const auto& kv : entries_)
        sink.write_entry(kv.first, kv.second);
    sink.end_block();
}
