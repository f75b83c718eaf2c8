#include <utility> // for std::move

#include "forms/argument_error.hpp"

namespace forms {

namespace {

auto null_message(const std::string& param_name) -> std::string
{
    return "Value cannot be null. (Parameter '" + param_name + "')";
}

}

argument_error::argument_error(std::string param_name,
                               const std::string& what_arg):
    invalid_argument(what_arg),
    param_name_(std::move(param_name))
{
    // Intentionally empty.
}

auto argument_error::param_name() const -> std::string
{
    return param_name_;
}

argument_null_error::argument_null_error(std::string param_name):
    argument_error(param_name, null_message(param_name))
{
    // Intentionally empty.
}

}
