#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "forms/field_identifier.hpp"
#include "forms/utility.hpp"

namespace forms {

namespace {

constexpr auto model_param = "model";
constexpr auto field_name_param = "field_name";
constexpr auto reference_required_message =
    "The model must be a reference-typed object.";

auto checked_model(const object* model) -> const object*
{
    if (!model) {
        throw argument_null_error{model_param};
    }
    return model;
}

auto checked_model(const value& model) -> const object*
{
    if (is_null(model)) {
        throw argument_null_error{model_param};
    }
    if (!is_reference(model)) {
        std::ostringstream os;
        os << reference_required_message;
        os << " Got " << kind_name(model) << " value " << model << ".";
        throw argument_error{model_param, os.str()};
    }
    return to_object(model);
}

auto checked_field_name(const char* field_name) -> std::string
{
    if (!field_name) {
        throw argument_null_error{field_name_param};
    }
    return field_name;
}

auto unsupported_accessor(const expression& expr)
    -> unsupported_expression_error
{
    std::ostringstream os;
    os << "The provided expression contains a " << kind_name(expr);
    os << " expression which is not supported. field_identifier only";
    os << " supports simple member accessors (fields, properties) of an";
    os << " object. Got '" << expr << "'.";
    return unsupported_expression_error{os.str()};
}

auto to_member_expression(const expression& accessor)
    -> const member_expression&
{
    auto body = &accessor;
    // Value typed members get used as objects via an implicit conversion.
    if (const auto p = std::get_if<convert_expression>(&body->node)) {
        if (p->type == conversion::object) {
            body = &to_expression(p->operand);
        }
    }
    if (const auto p = std::get_if<member_expression>(&body->node)) {
        return *p;
    }
    throw unsupported_accessor(*body);
}

auto model_of(const member_expression& member) -> value
{
    return evaluate(to_expression(member.target));
}

}

field_identifier::field_identifier(const object* model,
                                   std::string field_name):
    model_{checked_model(model)},
    field_name_{std::move(field_name)}
{
    // Intentionally empty.
}

field_identifier::field_identifier(const object* model,
                                   const char* field_name):
    model_{checked_model(model)},
    field_name_{checked_field_name(field_name)}
{
    // Intentionally empty.
}

field_identifier::field_identifier(const value& model,
                                   std::string field_name):
    model_{checked_model(model)},
    field_name_{std::move(field_name)}
{
    // Intentionally empty.
}

field_identifier::field_identifier(const value& model,
                                   const char* field_name):
    model_{checked_model(model)},
    field_name_{checked_field_name(field_name)}
{
    // Intentionally empty.
}

field_identifier::field_identifier(const expression& accessor):
    field_identifier{[&accessor]() -> field_identifier {
        const auto& member = to_member_expression(accessor);
        return {model_of(member), member.member};
    }()}
{
    // Intentionally empty.
}

auto hash_value(const field_identifier& id) noexcept -> std::size_t
{
    auto seed = std::size_t{};
    hash_combine(seed, &id.model());
    hash_combine(seed, id.field_name());
    return seed;
}

auto operator<<(std::ostream& os, const field_identifier& id)
    -> std::ostream&
{
    os << static_cast<const void*>(&id.model()) << '.' << id.field_name();
    return os;
}

}
