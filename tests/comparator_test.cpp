/**
 * @file comparator_test.cpp
 * @brief 返回值比较策略
 */

#include <gtest/gtest.h>

#include "core/comparator.h"

using namespace glide;

class ComparatorTest : public ::testing::Test {
protected:
    Comparator cmp;

    static Value json(const char *text) {
        return *parse_json(text);
    }
};

TEST_F(ComparatorTest, IntegersCompareExactly) {
    EXPECT_TRUE(cmp.compare_raw(3, "3").passed);
    EXPECT_FALSE(cmp.compare_raw(3, "4").passed);
    EXPECT_TRUE(cmp.compare_raw(json("9007199254740993"), "9007199254740993").passed);
    EXPECT_FALSE(cmp.compare_raw(json("9007199254740993"), "9007199254740992").passed);
}

TEST_F(ComparatorTest, FloatsUseTolerance) {
    EXPECT_TRUE(cmp.compare_raw(0.3, "0.30000000000000004").passed);
    EXPECT_TRUE(cmp.compare_raw(1.0, "1.0000005").passed);
    EXPECT_FALSE(cmp.compare_raw(1.0, "1.001").passed);
    // 大数按相对误差
    EXPECT_TRUE(cmp.compare_raw(1e15, "1000000000000000.5").passed);
}

TEST_F(ComparatorTest, IntegerAndFloatMix) {
    EXPECT_TRUE(cmp.compare_raw(2, "2.0").passed);
    EXPECT_TRUE(cmp.compare_raw(2.0, "2").passed);
}

TEST_F(ComparatorTest, CustomTolerance) {
    TolerancePolicy loose;
    loose.abs_tolerance = 0.01;
    Comparator c(loose);
    EXPECT_TRUE(c.compare_raw(1.0, "1.005").passed);
    EXPECT_FALSE(c.compare_raw(1.0, "1.02").passed);
}

TEST_F(ComparatorTest, NumericTextIsCoerced) {
    EXPECT_TRUE(cmp.compare_raw(5, "\"5\"").passed);
    EXPECT_TRUE(cmp.compare_raw(2.5, "\" 2.5 \"").passed);
    auto c = cmp.compare_raw(5, "\"five\"");
    EXPECT_FALSE(c.passed);
    EXPECT_TRUE(c.type_mismatch);
}

TEST_F(ComparatorTest, BooleanCoercion) {
    EXPECT_TRUE(cmp.compare_raw(true, "true").passed);
    EXPECT_TRUE(cmp.compare_raw(true, "\"True\"").passed);
    EXPECT_TRUE(cmp.compare_raw(false, "0").passed);
    EXPECT_TRUE(cmp.compare_raw(true, "1").passed);
    EXPECT_FALSE(cmp.compare_raw(true, "false").passed);
    auto c = cmp.compare_raw(true, "2");
    EXPECT_FALSE(c.passed);
    EXPECT_TRUE(c.type_mismatch);
}

TEST_F(ComparatorTest, NullMatchesNoneAndNull) {
    EXPECT_TRUE(cmp.compare_raw(nullptr, "null").passed);
    EXPECT_TRUE(cmp.compare_raw(nullptr, "\"None\"").passed);
    EXPECT_FALSE(cmp.compare_raw(nullptr, "0").passed);
}

TEST_F(ComparatorTest, TextIsExact) {
    EXPECT_TRUE(cmp.compare_raw("abc", "\"abc\"").passed);
    EXPECT_FALSE(cmp.compare_raw("abc", "\"abc \"").passed);
    // 非 JSON 输出按字符串处理
    EXPECT_TRUE(cmp.compare_raw("hello", "hello").passed);
    auto c = cmp.compare_raw("1", "1");
    EXPECT_FALSE(c.passed);
    EXPECT_TRUE(c.type_mismatch);
}

TEST_F(ComparatorTest, SequencesElementWise) {
    EXPECT_TRUE(cmp.compare_raw(json("[1, 2.5, \"x\"]"), "[1, 2.5000000001, \"x\"]").passed);

    auto order = cmp.compare_raw(json("[1, 2]"), "[2, 1]");
    EXPECT_FALSE(order.passed);
    EXPECT_NE(order.message.find("[0]"), std::string::npos);

    auto length = cmp.compare_raw(json("[1, 2]"), "[1, 2, 3]");
    EXPECT_FALSE(length.passed);
    EXPECT_NE(length.message.find("length"), std::string::npos);
}

TEST_F(ComparatorTest, SequenceFromReprText) {
    EXPECT_TRUE(cmp.compare_raw(json("[1, 2, 3]"), "\"[1, 2, 3]\"").passed);
    auto c = cmp.compare_raw(json("[1, 2, 3]"), "\"(1, 2, 3)\"");
    EXPECT_FALSE(c.passed);
    EXPECT_TRUE(c.type_mismatch);
}

TEST_F(ComparatorTest, MappingsByKey) {
    EXPECT_TRUE(cmp.compare_raw(json("{\"a\": 1, \"b\": [true]}"), "{\"b\": [1], \"a\": 1.0}").passed);

    auto missing = cmp.compare_raw(json("{\"a\": 1, \"b\": 2}"), "{\"a\": 1}");
    EXPECT_FALSE(missing.passed);
    EXPECT_NE(missing.message.find("missing key 'b'"), std::string::npos);

    auto extra = cmp.compare_raw(json("{\"a\": 1}"), "{\"a\": 1, \"z\": 0}");
    EXPECT_FALSE(extra.passed);
    EXPECT_NE(extra.message.find("unexpected key 'z'"), std::string::npos);
}

TEST_F(ComparatorTest, NestedMismatchReportsPath) {
    auto c = cmp.compare_raw(json("{\"rows\": [[1, 2], [3, 4]]}"), "{\"rows\": [[1, 2], [3, \"x\"]]}");
    EXPECT_FALSE(c.passed);
    EXPECT_TRUE(c.type_mismatch);
    EXPECT_NE(c.message.find(".rows[1][1]"), std::string::npos);
}

TEST_F(ComparatorTest, NormalizedActualIsReported) {
    auto c = cmp.compare_raw(5, "\"5\"");
    ASSERT_TRUE(c.passed);
    EXPECT_EQ(c.actual, Value(5));
}

TEST_F(ComparatorTest, FloatsEqualHandlesNaN) {
    EXPECT_FALSE(cmp.floats_equal(std::nan(""), std::nan("")));
    EXPECT_TRUE(cmp.floats_equal(0.0, -0.0));
}
