#include "wavedag/common/value.inline.hpp"
#include <sstream>

namespace wavedag
{

const char* Value::type_name() const noexcept
{
    switch (m_storage.index())
    {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        default: return "unknown";
    }
}

double Value::as_number() const
{
    if (!has_value())
    {
        throw ValueEmptyError{};
    }
    if (const auto* i = std::get_if<std::int64_t>(&m_storage))
    {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&m_storage))
    {
        return *d;
    }
    throw ValueTypeError{std::string{"Value type mismatch: expected number, got "} + type_name()};
}

std::string Value::to_string() const
{
    struct Renderer
    {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const
        {
            std::ostringstream oss;
            oss << d;
            return oss.str();
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Renderer{}, m_storage);
}

std::string to_string(const ValueMap& values)
{
    std::string result = "{";
    bool first = true;
    for (const auto& [key, value] : values)
    {
        if (!first)
        {
            result += ", ";
        }
        first = false;
        result += key;
        result += "=";
        result += value.to_string();
    }
    result += "}";
    return result;
}

} // namespace wavedag
