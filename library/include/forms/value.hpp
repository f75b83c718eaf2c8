#ifndef value_hpp
#define value_hpp

#include <chrono>
#include <cstddef> // for std::nullptr_t
#include <cstdint> // for std::int64_t
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace forms {

struct object;

using date_time = std::chrono::system_clock::time_point;

/// @brief Runtime value.
/// @details What an expression evaluates to, and what a model may be handed
///   over as. Every alternative except <code>const object*</code> is
///   copied by value and so has no identity of its own.
/// @note A <code>const object*</code> that is null is treated the same as
///   <code>nullptr</code>.
using value = std::variant<
    std::nullptr_t,
    bool,
    std::int64_t,
    double,
    std::string,
    date_time,
    const object*
>;

/// @brief Whether the given value is absent.
auto is_null(const value& v) noexcept -> bool;

/// @brief Whether the given value refers to an object.
/// @note Only non-null object references have a stable identity that can be
///   shared between separately made copies of the value.
auto is_reference(const value& v) noexcept -> bool;

/// @brief Gets a short name for the kind of the given value.
auto kind_name(const value& v) noexcept -> std::string_view;

/// @brief Gets the referenced object.
/// @return Pointer to the object, or <code>nullptr</code> if the value does
///   not refer to an object.
auto to_object(const value& v) noexcept -> const object*;

auto operator<<(std::ostream& os, const value& v) -> std::ostream&;

}

#endif /* value_hpp */
