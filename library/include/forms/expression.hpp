#ifndef expression_hpp
#define expression_hpp

#include <memory> // for std::shared_ptr
#include <ostream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "forms/value.hpp"

namespace forms {

struct expression;

/// @brief Shared handle to an immutable expression node.
using expression_ptr = std::shared_ptr<const expression>;

/// @brief Error for an expression of a shape that isn't supported.
struct unsupported_expression_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;
};

/// @brief Target type of a conversion.
enum class conversion: int {
    /// @brief Implicit conversion to a generic, object typed, value.
    /// @note This is what wraps a value typed member read that is used
    ///   where an object is expected.
    object,
    integer,
    floating,
    string,
};

auto operator<<(std::ostream& os, conversion type) -> std::ostream&;

struct constant_expression
{
    value constant;
};

/// @brief Read of a field or property of the target.
struct member_expression
{
    expression_ptr target;
    std::string member;
};

struct convert_expression
{
    expression_ptr operand;
    conversion type{conversion::object};
};

struct call_expression
{
    expression_ptr target;
    std::string method;
    std::vector<expression_ptr> arguments;
};

struct index_expression
{
    expression_ptr target;
    std::vector<expression_ptr> arguments;
};

/// @brief Expression tree node.
/// @details Describes an accessor like <code>() => model.Property</code> as
///   data so that it can be picked apart without running it.
struct expression
{
    std::variant<
        constant_expression,
        member_expression,
        convert_expression,
        call_expression,
        index_expression
    > node;
};

auto make_constant(value v) -> expression;
auto make_member(expression target, std::string member) -> expression;
auto make_convert(expression operand,
                  conversion type = conversion::object) -> expression;
auto make_call(expression target, std::string method,
               std::vector<expression> arguments = {}) -> expression;
auto make_index(expression target, std::vector<expression> arguments)
    -> expression;

/// @brief Gets the node the given handle refers to.
/// @throws unsupported_expression_error if @p child is empty.
auto to_expression(const expression_ptr& child) -> const expression&;

/// @brief Gets a short name for the kind of node the given expression is.
auto kind_name(const expression& expr) noexcept -> std::string_view;

/// @brief Evaluates the given expression.
/// @details Only constants, member reads, and conversions to object are
///   evaluated. Calls and indexers are never run.
/// @throws unsupported_expression_error if the expression is or contains a
///   call, an indexer, a conversion other than to object, or an empty child.
/// @throws member_access_error if a member is read from something that's
///   not an object, or from an object that doesn't have that member.
auto evaluate(const expression& expr) -> value;

/// @note An empty child is written as <code>null</code>.
auto operator<<(std::ostream& os, const expression& expr) -> std::ostream&;

}

#endif /* expression_hpp */
