#include "phasegraph/config/parameter.hpp"

namespace phasegraph
{

std::vector<std::string> format_parameter_arguments(const Parameter& parameter,
                                                    const ParameterValues& values)
{
    auto it = values.find(parameter.long_name);

    switch (parameter.kind)
    {
    case ParameterKind::Flag:
        if (it != values.end())
        {
            return {parameter.long_name};
        }
        return {};

    case ParameterKind::Choice:
        if (it != values.end() && !it->second.empty())
        {
            return {parameter.long_name, it->second};
        }
        if (parameter.default_value && !parameter.default_value->empty())
        {
            return {parameter.long_name, *parameter.default_value};
        }
        return {};

    case ParameterKind::String:
        if (it != values.end())
        {
            return {parameter.long_name, it->second};
        }
        return {};
    }
    return {};
}

} // namespace phasegraph
