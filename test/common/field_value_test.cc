#include <gtest/gtest.h>
#include "../../src/common/field_value.h"

using namespace SalKafka;

TEST(FieldValueTest, ScalarAndArrayShape) {
    EXPECT_FALSE(IsArrayValue(FieldValue(int64_t{1})));
    EXPECT_FALSE(IsArrayValue(FieldValue(std::string("x"))));
    EXPECT_TRUE(IsArrayValue(FieldValue(std::vector<double>{1.0, 2.0})));
    EXPECT_EQ(ValueLength(FieldValue(std::vector<int64_t>{1, 2, 3})), 3u);
    EXPECT_EQ(ValueLength(FieldValue(1.5)), 1u);
}

TEST(FieldValueTest, MatchesTypeWithoutCoercion) {
    EXPECT_TRUE(ValueMatchesType(FieldValue(int64_t{1}), FieldType::kInt, false));
    EXPECT_TRUE(ValueMatchesType(FieldValue(int64_t{1}), FieldType::kLong, false));
    EXPECT_FALSE(ValueMatchesType(FieldValue(int64_t{1}), FieldType::kDouble, false));
    EXPECT_FALSE(ValueMatchesType(FieldValue(int64_t{1}), FieldType::kInt, true));
    EXPECT_TRUE(ValueMatchesType(FieldValue(std::vector<bool>{true}), FieldType::kBoolean, true));
    EXPECT_FALSE(ValueMatchesType(FieldValue(std::string("a")), FieldType::kMap, false));
}

TEST(FieldValueTest, Rendering) {
    EXPECT_EQ(ToString(FieldValue(true)), "true");
    EXPECT_EQ(ToString(FieldValue(int64_t{-7})), "-7");
    EXPECT_EQ(ToString(FieldValue(1.1)), "1.1");
    EXPECT_EQ(ToString(FieldValue(std::string("abc"))), "\"abc\"");
    EXPECT_EQ(ToString(FieldValue(std::vector<int64_t>{1, 1, 1})), "[1, 1, 1]");
}

TEST(FieldValueTest, RenderMapInGivenOrder) {
    FieldMap fields;
    fields["b"] = int64_t{2};
    fields["a"] = int64_t{1};
    EXPECT_EQ(ToString(fields, {"a", "missing", "b"}), "a=1, b=2");
}
