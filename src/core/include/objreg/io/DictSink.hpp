#pragma once
#include "objreg/io/ISink.hpp"
#include <cstddef>
#include <ostream>

/**
 * @file DictSink.hpp
 * @brief Dictionary-style text sink.
 *
 * @details
 * Emits the registry tree as nested brace blocks with ``key value;`` entries. Nested blocks
 * are indented by four spaces per level; scalar lists are written as ``N ( v0 v1 ... )`` with
 * ``%.17g`` precision so values read back bit-exact.
 *
 * @rst
 * .. code-block:: text
 *
 *   fluid
 *   {
 *       type registry;
 *       local (4 4 4);
 *       T
 *       {
 *           type scalarField;
 *           internalField 64 ( 300 300 ... );
 *       }
 *   }
 * @endrst
 */

namespace objreg::io
{

class DictSink final : public ISink
{
  public:
    explicit DictSink(std::ostream& os) : os_(os) {}

    void begin_block(std::string_view name) override;
    // Throws std::logic_error when no block is open.
    void end_block() override;
    void write_entry(std::string_view key, std::string_view value) override;
    void write_scalars(std::string_view key, std::span<const double> values) override;

    std::size_t depth() const noexcept { return depth_; }

  private:
    void indent();

    std::ostream& os_;
    std::size_t depth_{0};
};

} // namespace objreg::io
