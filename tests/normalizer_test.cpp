//! # Annotation Normalizer Tests
//!
//! End-to-end behavior of `normalize`: structured path, pattern fallback,
//! color wrapping and idempotence.

#include "annotation/normalizer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace sigdoc::annotation;

TEST(NormalizerTest, StripsQualifiers) {
    EXPECT_EQ(normalize("outer.inner.MyType"), "MyType");
    EXPECT_EQ(normalize("typing.Optional[typing.List[mod.Widget]]"), "Optional[List[Widget]]");
}

TEST(NormalizerTest, KeepsGenericArguments) {
    EXPECT_EQ(normalize("Container[KeyT, ValT]"), "Container[KeyT, ValT]");
}

TEST(NormalizerTest, Unions) {
    EXPECT_EQ(normalize("Union[str, int, float]"), "str | int | float");
    EXPECT_EQ(normalize("typing.Union[str, int, float]"), "str | int | float");
    EXPECT_EQ(normalize("int | str"), "int | str");
}

TEST(NormalizerTest, ClassReprFallsBackToPatterns) {
    EXPECT_EQ(normalize("<class 'int'>"), "int");
    EXPECT_EQ(normalize("<class 'pkg.Widget'>"), "pkg.Widget");
    EXPECT_EQ(normalize("Dict[str, <class 'int'>]"), "Dict[str, int]");
}

TEST(NormalizerTest, MalformedInputStillReturnsText) {
    EXPECT_EQ(normalize(""), "");
    EXPECT_EQ(normalize("{{{not valid"), "{{{not valid");
    EXPECT_EQ(normalize("typing.List[str"), "List[str");
}

TEST(NormalizerTest, Idempotent) {
    const std::vector<std::string> inputs = {
        "int",
        "outer.inner.MyType",
        "typing.Dict[str, List[mod.Item]]",
        "Union[str, int, float]",
        "Optional[Union[int, None]]",
        "Union[Union[a, b], c]",
        "Literal['a', \"b\", 3]",
        "Tuple[int, ...]",
        "(int | str)[0]",
        "<class 'int'>",
        "Dict[str, <class 'float'>]",
        "numpy.ndarray[<class 'float'>]",
        "List[<class 'pkg.Widget'>]",
        "<class 'a.b.C'>",
        "typing.List[str",
        "{{{not valid",
        "",
    };

    for (const auto& input : inputs) {
        auto once = normalize(input);
        EXPECT_EQ(normalize(once), once) << "input: " << input;
    }
}

TEST(NormalizerTest, CleanedTextIsNormalizedAgain) {
    EXPECT_EQ(normalize("numpy.ndarray[<class 'float'>]"), "ndarray[float]");
    EXPECT_EQ(normalize("List[<class 'pkg.Widget'>]"), "List[Widget]");
    EXPECT_EQ(normalize("<class 'a.b.C'>"), "C");
    // Still unparseable after cleanup
    EXPECT_EQ(normalize("typing.List[<class 'int'>"), "List[int");
}

TEST(NormalizerTest, LongInputs) {
    const std::string module(100000, 'a');
    EXPECT_EQ(normalize("<" + module + ".B"), "<B");

    std::string chain = "a";
    for (int i = 0; i < 100000; ++i) {
        chain += "|a";
    }
    EXPECT_EQ(normalize(chain), chain);

    const std::string name(200000, 'n');
    EXPECT_EQ(normalize("typing.List[" + name + "]"), "List[" + name + "]");
}

TEST(NormalizerTest, TwoSegmentReprIsNotIdempotent) {
    auto once = normalize("<class 'pkg.Widget'>");
    EXPECT_EQ(once, "pkg.Widget");
    EXPECT_EQ(normalize(once), "Widget");
}

TEST(NormalizerTest, Color) {
    EXPECT_EQ(normalize("typing.List[int]", "cyan"), "<fg=cyan>(List[int])</>");
    EXPECT_EQ(normalize("typing.List[int]", ""), "List[int]");
    EXPECT_EQ(normalize("", "red"), "<fg=red>()</>");
    EXPECT_EQ(format_with_color("x | y", "green"), "<fg=green>(x | y)</>");
}
