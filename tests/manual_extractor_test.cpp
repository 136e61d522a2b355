//! # Manual Parameter Extraction Tests

#include "docstring/manual_extractor.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace sigdoc::docstring;

TEST(ManualExtractorTest, EmptyInput) {
    EXPECT_TRUE(extract_params_manual("").empty());
    EXPECT_TRUE(extract_params_manual("Nothing documented here.").empty());
}

TEST(ManualExtractorTest, ParamFields) {
    auto params = extract_params_manual(":param a: alpha\n:param b: beta\n");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params["a"], "alpha");
    EXPECT_EQ(params["b"], "beta");
}

TEST(ManualExtractorTest, DescriptionEndsAtBlankLine) {
    auto params = extract_params_manual(":param a: first line\nsecond line\n\nUnrelated prose.");
    EXPECT_EQ(params["a"], "first line\nsecond line");
}

TEST(ManualExtractorTest, FirstParamFieldWins) {
    auto params = extract_params_manual(":param x: first\n:param x: second\n");
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params["x"], "first");
}

TEST(ManualExtractorTest, IndentedDocstring) {
    auto params = extract_params_manual("Summary.\n\n    :param a: alpha\n    :param b: beta\n    ");
    EXPECT_EQ(params["a"], "alpha");
    EXPECT_EQ(params["b"], "beta");
}

TEST(ManualExtractorTest, NumpySection) {
    auto params = extract_params_manual("Parameters\n"
                                        "----------\n"
                                        "alpha : float\n"
                                        "    Learning rate.\n"
                                        "beta : int\n"
                                        "    Momentum steps.\n");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params["alpha"], "Learning rate.");
    EXPECT_EQ(params["beta"], "Momentum steps.");
}

TEST(ManualExtractorTest, NumpySectionEndsAtCapitalizedLine) {
    auto params = extract_params_manual("Parameters\n"
                                        "----------\n"
                                        "x : int\n"
                                        "    the x\n"
                                        "Returns\n"
                                        "-------\n"
                                        "y : int\n"
                                        "    not a parameter\n");
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params["x"], "the x");
}

TEST(ManualExtractorTest, EarlierPassTakesPrecedence) {
    auto params = extract_params_manual(":param a: from field\n"
                                        "\n"
                                        "Parameters\n"
                                        "----------\n"
                                        "a : int\n"
                                        "    from numpy\n"
                                        "b : int\n"
                                        "    only numpy\n");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params["a"], "from field");
    EXPECT_EQ(params["b"], "only numpy");
}

TEST(ManualExtractorTest, ParamFieldMustStartTheLine) {
    auto params = extract_params_manual("See :param a: for details\n:param b: bee\n");
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params["b"], "bee");
}

TEST(ManualExtractorTest, LongParamDescription) {
    const std::string words(100000, 'w');
    auto params = extract_params_manual(":param x: " + words + "\n  " + words + "\n:param y: why\n");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params["x"], words + "\n  " + words);
    EXPECT_EQ(params["y"], "why");
}

TEST(ManualExtractorTest, LongNumpySection) {
    const std::string long_name(100000, 'q');
    const std::string long_description(100000, 'd');

    std::string doc = "Parameters\n----------\n";
    // Too long to be recognized as an item head, so it starts no entry
    doc += long_name + " : str\n    ignored\n";
    for (int i = 0; i < 5000; ++i) {
        doc += "p" + std::to_string(i) + " : int\n    value " + std::to_string(i) + "\n";
    }
    doc += "big : str\n    " + long_description + "\n";

    auto params = extract_params_manual(doc);
    EXPECT_EQ(params.size(), 5001u);
    EXPECT_EQ(params.count(long_name), 0u);
    EXPECT_EQ(params["p0"], "value 0");
    EXPECT_EQ(params["p4999"], "value 4999");
    EXPECT_EQ(params["big"], long_description);
}
