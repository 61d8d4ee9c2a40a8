#include "objreg/io/DictSink.hpp"
#include <cstdio>
#include <stdexcept>

using namespace objreg::io;

void DictSink::indent()
{
    for (std::size_t i = 0; i < depth_; ++i)
        os_ << "    ";
}

void DictSink::begin_block(std::string_view name)
{
    indent();
    os_ << name << '\n';
    indent();
    os_ << "{\n";
    ++depth_;
}

void DictSink::end_block()
{
    if (depth_ == 0)
        throw std::logic_error("DictSink::end_block without matching begin_block");
    --depth_;
    indent();
    os_ << "}\n";
}

void DictSink::write_entry(std::string_view key, std::string_view value)
{
    indent();
    os_ << key << ' ' << value << ";\n";
}

void DictSink::write_scalars(std::string_view key, std::span<const double> values)
{
    indent();
    os_ << key << ' ' << values.size() << " (";
    char buf[32];
    for (double v : values)
    {
        std::snprintf(buf, sizeof(buf), " %.17g", v);
        os_ << buf;
    }
    os_ << " );\n";
}
