#pragma once
#include "objreg/io/ISink.hpp"

namespace objreg::io
{

/// Discards everything (dry runs, timing the tree walk without output).
class NullSink final : public ISink
{
  public:
    void begin_block(std::string_view) override {}
    void end_block() override {}
    void write_entry(std::string_view, std::string_view) override {}
    void write_scalars(std::string_view, std::span<const double>) override {}
};

} // namespace objreg::io
