#pragma once
#include "objreg/io/ISink.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @file YamlSink.hpp
 * @brief Sink that builds a YAML document with ``YAML::Emitter``.
 *
 * @details
 * Each block becomes a nested map keyed by the block name, entries become scalar values and
 * scalar lists become flow sequences. The emitter starts with an open top-level map, so a
 * whole :cpp:func:`objreg::Registry::persist_all` pass yields one YAML mapping. Call
 * :cpp:func:`str` once all blocks are closed.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   objreg::io::YamlSink y;
 *   run.persist_all(y);
 *   YAML::Node doc = YAML::Load(y.str());
 *   double nu = doc["transportProperties"]["nu"].as<double>();
 * @endrst
 */

namespace objreg::io
{

class YamlSink final : public ISink
{
  public:
    YamlSink();

    void begin_block(std::string_view name) override;
    // Throws std::logic_error when no block is open.
    void end_block() override;
    void write_entry(std::string_view key, std::string_view value) override;
    void write_scalars(std::string_view key, std::span<const double> values) override;

    // Closes the top-level map on first call; throws std::logic_error if blocks remain open.
    std::string str();

  private:
    YAML::Emitter out_;
    int depth_{0};
    bool closed_{false};
};

} // namespace objreg::io
