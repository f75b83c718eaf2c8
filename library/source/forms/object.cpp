#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "forms/object.hpp"

namespace forms {

member_access_error::member_access_error(std::string member,
                                         const std::string& what_arg):
    runtime_error(what_arg),
    member_(std::move(member))
{
    // Intentionally empty.
}

auto member_access_error::member() const -> std::string
{
    return member_;
}

auto no_such_member(const object& obj, std::string_view name)
    -> member_access_error
{
    std::ostringstream os;
    os << value{&obj} << " has no member named '" << name << "'";
    return member_access_error{std::string{name}, os.str()};
}

}
