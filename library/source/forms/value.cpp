#include <iomanip> // for std::quoted

#include "forms/utility.hpp"
#include "forms/value.hpp"

namespace forms {

auto is_null(const value& v) noexcept -> bool
{
    if (std::holds_alternative<std::nullptr_t>(v)) {
        return true;
    }
    const auto p = std::get_if<const object*>(&v);
    return p && !*p;
}

auto is_reference(const value& v) noexcept -> bool
{
    return to_object(v) != nullptr;
}

auto kind_name(const value& v) noexcept -> std::string_view
{
    return std::visit(detail::overloaded{
        [](std::nullptr_t) { return std::string_view{"null"}; },
        [](bool) { return std::string_view{"bool"}; },
        [](std::int64_t) { return std::string_view{"integer"}; },
        [](double) { return std::string_view{"floating"}; },
        [](const std::string&) { return std::string_view{"string"}; },
        [](const date_time&) { return std::string_view{"date_time"}; },
        [](const object* p) {
            return p? std::string_view{"object"}: std::string_view{"null"};
        },
    }, v);
}

auto to_object(const value& v) noexcept -> const object*
{
    const auto p = std::get_if<const object*>(&v);
    return p? *p: nullptr;
}

auto operator<<(std::ostream& os, const value& v) -> std::ostream&
{
    std::visit(detail::overloaded{
        [&os](std::nullptr_t) {
            os << "null";
        },
        [&os](bool arg) {
            os << std::boolalpha << arg << std::noboolalpha;
        },
        [&os](std::int64_t arg) {
            os << arg;
        },
        [&os](double arg) {
            os << arg;
        },
        [&os](const std::string& arg) {
            os << std::quoted(arg);
        },
        [&os](const date_time& arg) {
            os << "date_time{" << arg.time_since_epoch().count() << "}";
        },
        [&os](const object* arg) {
            if (arg) {
                os << "object@" << static_cast<const void*>(arg);
            }
            else {
                os << "null";
            }
        },
    }, v);
    return os;
}

}
