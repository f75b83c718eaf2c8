#ifndef field_identifier_hpp
#define field_identifier_hpp

#include <concepts> // for std::equality_comparable, std::copyable
#include <cstddef> // for std::size_t
#include <functional> // for std::hash
#include <ostream>
#include <string>

#include "forms/argument_error.hpp"
#include "forms/expression.hpp"
#include "forms/object.hpp"
#include "forms/value.hpp"

namespace forms {

/// @brief Field identifier.
/// @details Identifies a field that can be edited, by pairing the model
///   object that owns the field with the name of the field. This is what
///   validation state gets tracked against.
/// @note The model is referred to, not owned. The caller keeps it alive for
///   as long as the identifier is used.
/// @note Equality is by model identity (address) and by exact, case
///   sensitive, field name. No ordering is defined.
class field_identifier
{
public:
    /// @throws argument_null_error if @p model is null.
    field_identifier(const object* model, std::string field_name);

    /// @throws argument_null_error if @p model or @p field_name is null.
    field_identifier(const object* model, const char* field_name);

    /// @brief Initializing constructor.
    /// @throws argument_null_error if @p model is null.
    /// @throws argument_error if @p model is not reference typed.
    field_identifier(const value& model, std::string field_name);

    /// @throws argument_null_error if @p model or @p field_name is null.
    /// @throws argument_error if @p model is not reference typed.
    field_identifier(const value& model, const char* field_name);

    /// @brief Accessor expression constructor.
    /// @details Gets the field name and the model from an expression of the
    ///   form <code>target.member</code>, where that form may be wrapped in
    ///   one conversion to object. Only <code>target</code> is evaluated.
    /// @throws unsupported_expression_error if @p accessor is of any other
    ///   form, or if evaluating its target isn't supported.
    /// @throws member_access_error if evaluating the target fails.
    /// @throws argument_null_error if the target evaluates to null.
    /// @throws argument_error if the target isn't reference typed.
    explicit field_identifier(const expression& accessor);

    [[nodiscard]] auto model() const noexcept -> const object&
    {
        return *model_;
    }

    [[nodiscard]] auto field_name() const noexcept -> const std::string&
    {
        return field_name_;
    }

private:
    const object* model_{};
    std::string field_name_;
};

inline auto operator==(const field_identifier& lhs,
                       const field_identifier& rhs) noexcept -> bool
{
    return (&lhs.model() == &rhs.model())
        && (lhs.field_name() == rhs.field_name());
}

static_assert(std::equality_comparable<field_identifier>);
static_assert(std::copyable<field_identifier>);

/// @brief Gets the hash of the given identifier.
/// @note Only the model's address is hashed, never its contents, so the hash
///   stays the same while the model is edited.
auto hash_value(const field_identifier& id) noexcept -> std::size_t;

auto operator<<(std::ostream& os, const field_identifier& id)
    -> std::ostream&;

}

namespace std {

template <>
struct hash<forms::field_identifier>
{
    auto operator()(const forms::field_identifier& id) const noexcept
        -> std::size_t
    {
        return forms::hash_value(id);
    }
};

}

#endif /* field_identifier_hpp */
