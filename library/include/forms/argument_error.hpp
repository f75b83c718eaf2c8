#ifndef argument_error_hpp
#define argument_error_hpp

#include <stdexcept> // for std::invalid_argument
#include <string>

namespace forms {

/// @brief Invalid argument error that names the offending parameter.
struct argument_error: public std::invalid_argument
{
    argument_error(std::string param_name, const std::string& what_arg);

    [[nodiscard]] auto param_name() const -> std::string;

private:
    std::string param_name_;
};

/// @brief Error for an argument that was required but absent.
struct argument_null_error: public argument_error
{
    explicit argument_null_error(std::string param_name);
};

}

#endif /* argument_error_hpp */
