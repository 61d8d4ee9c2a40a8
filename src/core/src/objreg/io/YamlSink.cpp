#include "objreg/io/YamlSink.hpp"
#include <stdexcept>

using namespace objreg::io;

YamlSink::YamlSink()
{
    out_.SetDoublePrecision(17);
    out_ << YAML::BeginMap;
}

void YamlSink::begin_block(std::string_view name)
{
    out_ << YAML::Key << std::string(name) << YAML::Value << YAML::BeginMap;
    ++depth_;
}

void YamlSink::end_block()
{
    if (depth_ == 0)
        throw std::logic_error("YamlSink::end_block without matching begin_block");
    out_ << YAML::EndMap;
    --depth_;
}

void YamlSink::write_entry(std::string_view key, std::string_view value)
{
    out_ << YAML::Key << std::string(key) << YAML::Value << std::string(value);
}

void YamlSink::write_scalars(std::string_view key, std::span<const double> values)
{
    out_ << YAML::Key << std::string(key) << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (double v : values)
        out_ << v;
    out_ << YAML::EndSeq;
}

std::string YamlSink::str()
{
    if (!closed_)
    {
        if (depth_ != 0)
            throw std::logic_error("YamlSink::str with " + std::to_string(depth_) +
                                   " block(s) still open");
        out_ << YAML::EndMap;
        closed_ = true;
    }
    if (!out_.good())
        throw std::runtime_error("YamlSink: emitter error: " + out_.GetLastError());
    return out_.c_str();
}
