#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

#include "forms/object.hpp"
#include "forms/value.hpp"

using namespace forms;

namespace {

struct empty_object: object
{
    auto get_member(std::string_view name) const -> value override
    {
        throw no_such_member(*this, name);
    }
};

auto to_string(const value& v) -> std::string
{
    std::ostringstream os;
    os << v;
    return os.str();
}

}

TEST(value, default_construction)
{
    EXPECT_TRUE(is_null(value{}));
    EXPECT_FALSE(is_reference(value{}));
    EXPECT_EQ(kind_name(value{}), "null");
}

TEST(value, is_null)
{
    const auto obj = empty_object{};
    EXPECT_TRUE(is_null(value{nullptr}));
    EXPECT_TRUE(is_null(value{static_cast<const object*>(nullptr)}));
    EXPECT_FALSE(is_null(value{&obj}));
    EXPECT_FALSE(is_null(value{false}));
    EXPECT_FALSE(is_null(value{std::string{}}));
}

TEST(value, is_reference)
{
    const auto obj = empty_object{};
    EXPECT_TRUE(is_reference(value{&obj}));
    EXPECT_FALSE(is_reference(value{static_cast<const object*>(nullptr)}));
    EXPECT_FALSE(is_reference(value{true}));
    EXPECT_FALSE(is_reference(value{std::int64_t{1}}));
    EXPECT_FALSE(is_reference(value{1.5}));
    EXPECT_FALSE(is_reference(value{std::string{"model"}}));
    EXPECT_FALSE(is_reference(value{std::chrono::system_clock::now()}));
}

TEST(value, kind_name)
{
    const auto obj = empty_object{};
    EXPECT_EQ(kind_name(value{true}), "bool");
    EXPECT_EQ(kind_name(value{std::int64_t{1}}), "integer");
    EXPECT_EQ(kind_name(value{1.5}), "floating");
    EXPECT_EQ(kind_name(value{std::string{}}), "string");
    EXPECT_EQ(kind_name(value{date_time{}}), "date_time");
    EXPECT_EQ(kind_name(value{&obj}), "object");
    EXPECT_EQ(kind_name(value{static_cast<const object*>(nullptr)}), "null");
}

TEST(value, to_object)
{
    const auto obj = empty_object{};
    EXPECT_EQ(to_object(value{&obj}), &obj);
    EXPECT_EQ(to_object(value{std::int64_t{1}}), nullptr);
    EXPECT_EQ(to_object(value{}), nullptr);
}

TEST(value, ostream_operator_support)
{
    const auto obj = empty_object{};
    EXPECT_EQ(to_string(value{}), "null");
    EXPECT_EQ(to_string(value{true}), "true");
    EXPECT_EQ(to_string(value{std::int64_t{-3}}), "-3");
    EXPECT_EQ(to_string(value{std::string{"a b"}}), "\"a b\"");
    EXPECT_EQ(to_string(value{date_time{}}), "date_time{0}");
    std::ostringstream expected;
    expected << "object@" << static_cast<const void*>(&obj);
    EXPECT_EQ(to_string(value{&obj}), expected.str());
}

TEST(object, no_such_member)
{
    const auto obj = empty_object{};
    try {
        static_cast<void>(obj.get_member("missing"));
        FAIL() << "expected exception";
    }
    catch (const member_access_error& ex) {
        EXPECT_EQ(ex.member(), "missing");
        EXPECT_TRUE(std::string_view{ex.what()}.ends_with(
            " has no member named 'missing'"));
    }
}
