//! # Parameter Extraction Tests
//!
//! `extract_params` combines the structured parser with the manual
//! extractor as a fallback.

#include "docstring/extractor.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace sigdoc::docstring;

TEST(ExtractorTest, EmptyDocstringForEveryStyle) {
    for (auto style : {DocstringStyle::Google, DocstringStyle::Numpy, DocstringStyle::Sphinx,
                       DocstringStyle::Epydoc, DocstringStyle::Auto}) {
        EXPECT_TRUE(extract_params("", style).empty()) << style_name(style);
    }
}

TEST(ExtractorTest, GoogleDocstring) {
    auto params = extract_params("Summary.\n"
                                 "\n"
                                 "    Args:\n"
                                 "        name (str): Who to greet.\n"
                                 "        loud (bool, optional):  Shout it.  \n");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params["name"], "Who to greet.");
    EXPECT_EQ(params["loud"], "Shout it.");
}

TEST(ExtractorTest, ParametersWithoutDescriptionAreOmitted) {
    auto params = extract_params(":param a:\n:param b: bee\n", DocstringStyle::Sphinx);
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params["b"], "bee");
}

TEST(ExtractorTest, FallsBackToManualExtraction) {
    const char* doc = "Summary.\n\nArgs:\n    broken item\n:param x: the x value\n";

    auto params = extract_params(doc, DocstringStyle::Google);
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params["x"], "the x value");
}

TEST(ExtractorTest, FallbackHandlesLongDescription) {
    const std::string words(100000, 'w');
    auto params = extract_params("Args:\n    no colon here\n\n:param x: " + words,
                                 DocstringStyle::Google);
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params["x"], words);
}

TEST(ExtractorTest, StyleHintSelectsConvention) {
    const char* doc = "Summary.\n"
                      "\n"
                      "Parameters\n"
                      "----------\n"
                      "x : int\n"
                      "    The x.\n";

    EXPECT_EQ(extract_params(doc, DocstringStyle::Numpy)["x"], "The x.");
    // Valid as Sphinx too, just without fields
    EXPECT_TRUE(extract_params(doc, DocstringStyle::Sphinx).empty());
}

TEST(ExtractorTest, ParseStyleNames) {
    EXPECT_EQ(parse_style("google"), DocstringStyle::Google);
    EXPECT_EQ(parse_style("NumPy"), DocstringStyle::Numpy);
    EXPECT_EQ(parse_style("SPHINX"), DocstringStyle::Sphinx);
    EXPECT_EQ(parse_style("epydoc"), DocstringStyle::Epydoc);
    EXPECT_EQ(parse_style("auto"), DocstringStyle::Auto);
    EXPECT_FALSE(parse_style("rest").has_value());
    EXPECT_EQ(style_name(DocstringStyle::Numpy), "numpy");
}
