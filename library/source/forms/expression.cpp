#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "forms/expression.hpp"
#include "forms/object.hpp"
#include "forms/utility.hpp"

namespace forms {

namespace {

auto to_ptr(expression expr) -> expression_ptr
{
    return std::make_shared<const expression>(std::move(expr));
}

auto to_ptrs(std::vector<expression> exprs) -> std::vector<expression_ptr>
{
    auto result = std::vector<expression_ptr>{};
    result.reserve(size(exprs));
    for (auto&& expr: exprs) {
        result.push_back(to_ptr(std::move(expr)));
    }
    return result;
}

auto write(std::ostream& os, const expression_ptr& child) -> std::ostream&
{
    if (!child) {
        os << "null";
        return os;
    }
    os << *child;
    return os;
}

auto write_arguments(std::ostream& os,
                     const std::vector<expression_ptr>& arguments)
    -> std::ostream&
{
    auto add_separator = false;
    for (auto&& argument: arguments) {
        if (add_separator) {
            os << ", ";
        }
        write(os, argument);
        add_separator = true;
    }
    return os;
}

auto not_evaluated(const expression& expr) -> unsupported_expression_error
{
    std::ostringstream os;
    os << "cannot evaluate " << kind_name(expr) << " expression '" << expr
       << "', only constants, member reads, and conversions to object are "
          "evaluated";
    return unsupported_expression_error{os.str()};
}

auto read_member(const value& target, const std::string& member) -> value
{
    if (is_null(target)) {
        throw member_access_error{member,
            "cannot read member '" + member + "' of null"};
    }
    const auto obj = to_object(target);
    if (!obj) {
        throw member_access_error{member,
            "cannot read member '" + member + "' of " +
            std::string{kind_name(target)} + " value"};
    }
    return obj->get_member(member);
}

}

auto operator<<(std::ostream& os, conversion type) -> std::ostream&
{
    switch (type) {
    case conversion::object:
        os << "object";
        return os;
    case conversion::integer:
        os << "integer";
        return os;
    case conversion::floating:
        os << "floating";
        return os;
    case conversion::string:
        os << "string";
        return os;
    }
    os << "conversion(" << to_underlying(type) << ")";
    return os;
}

auto make_constant(value v) -> expression
{
    return expression{constant_expression{std::move(v)}};
}

auto make_member(expression target, std::string member) -> expression
{
    return expression{member_expression{
        to_ptr(std::move(target)), std::move(member)
    }};
}

auto make_convert(expression operand, conversion type) -> expression
{
    return expression{convert_expression{to_ptr(std::move(operand)), type}};
}

auto make_call(expression target, std::string method,
               std::vector<expression> arguments) -> expression
{
    return expression{call_expression{
        to_ptr(std::move(target)), std::move(method),
        to_ptrs(std::move(arguments))
    }};
}

auto make_index(expression target, std::vector<expression> arguments)
    -> expression
{
    return expression{index_expression{
        to_ptr(std::move(target)), to_ptrs(std::move(arguments))
    }};
}

auto to_expression(const expression_ptr& child) -> const expression&
{
    if (!child) {
        throw unsupported_expression_error{
            "expression has an empty child node"};
    }
    return *child;
}

auto kind_name(const expression& expr) noexcept -> std::string_view
{
    return std::visit(detail::overloaded{
        [](const constant_expression&) {
            return std::string_view{"constant"};
        },
        [](const member_expression&) {
            return std::string_view{"member access"};
        },
        [](const convert_expression&) {
            return std::string_view{"convert"};
        },
        [](const call_expression&) {
            return std::string_view{"call"};
        },
        [](const index_expression&) {
            return std::string_view{"index"};
        },
    }, expr.node);
}

auto evaluate(const expression& expr) -> value
{
    if (const auto p = std::get_if<constant_expression>(&expr.node)) {
        return p->constant;
    }
    if (const auto p = std::get_if<member_expression>(&expr.node)) {
        return read_member(evaluate(to_expression(p->target)), p->member);
    }
    if (const auto p = std::get_if<convert_expression>(&expr.node)) {
        if (p->type == conversion::object) {
            // Boxing doesn't change what's referred to.
            return evaluate(to_expression(p->operand));
        }
    }
    throw not_evaluated(expr);
}

auto operator<<(std::ostream& os, const expression& expr) -> std::ostream&
{
    std::visit(detail::overloaded{
        [&os](const constant_expression& arg) {
            os << arg.constant;
        },
        [&os](const member_expression& arg) {
            write(os, arg.target) << '.' << arg.member;
        },
        [&os](const convert_expression& arg) {
            os << '(' << arg.type << ')';
            write(os, arg.operand);
        },
        [&os](const call_expression& arg) {
            write(os, arg.target) << '.' << arg.method << '(';
            write_arguments(os, arg.arguments) << ')';
        },
        [&os](const index_expression& arg) {
            write(os, arg.target) << '[';
            write_arguments(os, arg.arguments) << ']';
        },
    }, expr.node);
    return os;
}

}
