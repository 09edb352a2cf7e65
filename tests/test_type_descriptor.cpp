#include <gtest/gtest.h>
#include "mapping/type_descriptor.hpp"
#include "fakes.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace sproc_mapper::mapping;
using sproc_mapper::test::Order;
using sproc_mapper::test::User;

TEST(TypeDescriptorTest, FieldsInDeclarationOrder) {
    const auto& descriptor = describe<User>();

    ASSERT_EQ(descriptor.fields().size(), 4u);
    EXPECT_EQ(descriptor.fields()[0].name, "id");
    EXPECT_EQ(descriptor.fields()[1].name, "name");
    EXPECT_EQ(descriptor.fields()[2].name, "email");
    EXPECT_EQ(descriptor.fields()[3].name, "age");
    EXPECT_NE(descriptor.type_name().find("User"), std::string::npos);
}

TEST(TypeDescriptorTest, BuiltOncePerType) {
    EXPECT_EQ(&describe<User>(), &describe<User>());
}

TEST(TypeDescriptorTest, OptionalFlag) {
    const auto& descriptor = describe<User>();
    EXPECT_FALSE(descriptor.find("id")->optional);
    EXPECT_TRUE(descriptor.find("email")->optional);
}

TEST(TypeDescriptorTest, FindIsCaseInsensitive) {
    const auto& descriptor = describe<Order>();
    EXPECT_NE(descriptor.find("orderid"), nullptr);
    EXPECT_NE(descriptor.find("ORDERID"), nullptr);
    EXPECT_EQ(descriptor.find("order_id"), nullptr);
    EXPECT_EQ(descriptor.find("missing"), nullptr);
}

TEST(TypeDescriptorTest, AssignCoercesText) {
    User user;
    describe<User>().find("id")->assign(user, std::string("42"));
    describe<User>().find("name")->assign(user, std::string("alice"));

    EXPECT_EQ(user.id, 42);
    EXPECT_EQ(user.name, "alice");
}

TEST(TypeDescriptorTest, NullIntoOptionalField) {
    User user;
    user.email = "old@example.com";

    describe<User>().find("email")->assign(user, std::nullopt);
    EXPECT_FALSE(user.email.has_value());
}

TEST(TypeDescriptorTest, NullIntoRequiredFieldThrows) {
    User user;
    user.age = 5;

    EXPECT_THROW(describe<User>().find("age")->assign(user, std::nullopt), FieldMappingError);
    EXPECT_EQ(user.age, 5);
}

TEST(TypeDescriptorTest, FailedCoercionLeavesFieldUntouched) {
    User user;
    user.age = 5;

    EXPECT_THROW(describe<User>().find("age")->assign(user, std::string("old")), FieldMappingError);
    EXPECT_EQ(user.age, 5);
}

TEST(TypeDescriptorTest, ReadProducesParameterValues) {
    User user;
    user.id = 42;
    user.name = "alice";

    const auto& descriptor = describe<User>();
    EXPECT_EQ(descriptor.find("id")->read(user), ParameterValue(std::int64_t{42}));
    EXPECT_EQ(descriptor.find("name")->read(user), ParameterValue(std::string("alice")));
    EXPECT_TRUE(is_null(descriptor.find("email")->read(user)));
}

TEST(ParameterValueTest, Conversions) {
    EXPECT_EQ(to_parameter_value(7), ParameterValue(std::int64_t{7}));
    EXPECT_EQ(to_parameter_value(2.5f), ParameterValue(2.5));
    EXPECT_EQ(to_parameter_value(true), ParameterValue(true));
    EXPECT_EQ(to_parameter_value('x'), ParameterValue(std::string("x")));
    EXPECT_EQ(to_parameter_value("text"), ParameterValue(std::string("text")));
    EXPECT_TRUE(is_null(to_parameter_value(nullptr)));
    EXPECT_TRUE(is_null(to_parameter_value(std::optional<int>{})));
    EXPECT_EQ(to_parameter_value(std::optional<int>{3}), ParameterValue(std::int64_t{3}));
}

TEST(ParameterValueTest, DisplayString) {
    EXPECT_EQ(to_display_string(ParameterValue{}), "NULL");
    EXPECT_EQ(to_display_string(ParameterValue(std::int64_t{42})), "42");
    EXPECT_EQ(to_display_string(ParameterValue(std::string("alice"))), "'alice'");
    EXPECT_EQ(to_display_string(ParameterValue(false)), "false");
    EXPECT_EQ(to_display_string(ParameterValue(Date{2024, 1, 2})), "2024-01-02");
}

TEST(ParameterValueTest, UnsignedWithinBigintRange) {
    EXPECT_EQ(to_parameter_value(std::uint32_t{4000000000u}), ParameterValue(std::int64_t{4000000000}));
    EXPECT_EQ(to_parameter_value(std::uint64_t{9223372036854775807ull}),
              ParameterValue(std::int64_t{9223372036854775807}));
}

TEST(ParameterValueTest, UnsignedAboveBigintRangeRejected) {
    EXPECT_THROW(to_parameter_value(std::uint64_t{9223372036854775808ull}), std::out_of_range);
    EXPECT_THROW(to_parameter_value(std::numeric_limits<std::uint64_t>::max()), std::out_of_range);
}
