#ifndef object_hpp
#define object_hpp

#include <stdexcept> // for std::runtime_error
#include <string>
#include <string_view>

#include "forms/value.hpp"

namespace forms {

/// @brief Error reading a member of an object.
struct member_access_error: public std::runtime_error
{
    member_access_error(std::string member, const std::string& what_arg);

    [[nodiscard]] auto member() const -> std::string;

private:
    std::string member_;
};

/// @brief Reference-typed object.
/// @details Base for the data objects that forms are edited against. Objects
///   are identified by their address, so two distinct instances are never
///   the same model no matter their contents.
/// @note Implementations expose their fields and properties by name through
///   <code>get_member</code>.
struct object
{
    object() = default;
    object(const object&) = default;
    object(object&&) = default;
    virtual ~object() = default;

    auto operator=(const object&) -> object& = default;
    auto operator=(object&&) -> object& = default;

    /// @brief Gets the current value of the named field or property.
    /// @throws member_access_error if this object has no such member.
    [[nodiscard]] virtual auto get_member(std::string_view name) const
        -> value = 0;
};

/// @brief Makes the error to throw for a member that an object lacks.
auto no_such_member(const object& obj, std::string_view name)
    -> member_access_error;

}

#endif /* object_hpp */
