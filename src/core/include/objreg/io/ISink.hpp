#pragma once
#include <span>
#include <string_view>

/**
 * @file ISink.hpp
 * @brief Output abstraction that :cpp:func:`objreg::Registerable::serialize` writes to.
 *
 * @details
 * A sink receives a stream of nested, named **blocks** holding key/value entries and scalar
 * lists. :cpp:func:`objreg::Registry::persist_all` opens one block per registered child (named
 * by its registry key) and writes a ``type`` entry before calling the child's ``serialize``;
 * a child only writes its own entries.
 *
 * The concrete layout (dictionary text, YAML, nothing at all) belongs to the sink. Blocking
 * behaviour is the sink's concern as well; the registry never performs I/O itself.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct CountingSink : objreg::io::ISink {
 *     int blocks = 0;
 *     void begin_block(std::string_view) override { ++blocks; }
 *     void end_block() override {}
 *     void write_entry(std::string_view, std::string_view) override {}
 *     void write_scalars(std::string_view, std::span<const double>) override {}
 *   };
 * @endrst
 */

namespace objreg::io
{

class ISink
{
  public:
    virtual ~ISink() = default;

    virtual void begin_block(std::string_view name) = 0;
    virtual void end_block() = 0;
    virtual void write_entry(std::string_view key, std::string_view value) = 0;
    virtual void write_scalars(std::string_view key, std::span<const double> values) = 0;
};

} // namespace objreg::io
