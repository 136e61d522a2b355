//! # Fallback Combinator Tests

#include "common/fallback.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace sigdoc;

namespace {

struct Failure {
    int code;
};

} // namespace

TEST(FallbackTest, ReturnsPrimaryValue) {
    int fallback_calls = 0;
    auto value = with_fallback([] { return Result<std::string, Failure>(std::string("primary")); },
                               [&](const Failure&) {
                                   ++fallback_calls;
                                   return std::string("fallback");
                               });
    EXPECT_EQ(value, "primary");
    EXPECT_EQ(fallback_calls, 0);
}

TEST(FallbackTest, PassesErrorToFallback) {
    auto value = with_fallback([] { return Result<std::string, Failure>(Failure{7}); },
                               [](const Failure& failure) {
                                   return "recovered " + std::to_string(failure.code);
                               });
    EXPECT_EQ(value, "recovered 7");
}

TEST(FallbackTest, FallbackResultConvertsToValueType) {
    auto value = with_fallback([] { return Result<long, Failure>(Failure{1}); },
                               [](const Failure&) { return 3; });
    static_assert(std::is_same_v<decltype(value), long>);
    EXPECT_EQ(value, 3L);
}

TEST(FallbackTest, MoveOnlyValue) {
    auto value = with_fallback(
        [] { return Result<Box<int>, Failure>(make_box<int>(5)); },
        [](const Failure&) { return make_box<int>(0); });
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, 5);
}
