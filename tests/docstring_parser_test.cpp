//! # Structured Docstring Parser Tests

#include "docstring/doc_parser.hpp"
#include "docstring/text.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace sigdoc;
using namespace sigdoc::docstring;

namespace {

const char* GOOGLE_DOC = R"(Fetch rows from a table.

    Retrieves rows pertaining to the given keys.

    Args:
        table (Table): An open table handle.
        keys (Sequence[str], optional): Keys to fetch.
            Continued description.
        *args: Extra positional arguments.

    Returns:
        dict: A mapping of keys to rows.

    Raises:
        IOError: An error occurred accessing the table.
    )";

const char* NUMPY_DOC = R"(Compute things.

    Parameters
    ----------
    x : int
        The x value.
    y : str, optional
        The y value.

    Returns
    -------
    int
        The result.

    Raises
    ------
    ValueError
        If x is negative.
    )";

const char* SPHINX_DOC = R"(Open a file.

    :param str path: File to read.
    :param mode: Open mode,
        continued here.
    :type mode: str, optional
    :returns: The contents.
    :rtype: bytes
    :raises IOError: If unreadable.
    )";

const char* EPYDOC_DOC = R"(Add numbers.

    @param a: First operand.
    @type a: int
    @param b: Second operand.
    @return: The sum.
    @rtype: int
    @raise ValueError: On overflow.
    )";

} // namespace

class DocstringParserTest : public ::testing::Test {
protected:
    auto parse_ok(const std::string& text, DocstringStyle style) -> ParsedDocstring {
        auto result = parse_docstring(text, style);
        if (is_err(result)) {
            ADD_FAILURE() << "parse failed at line " << unwrap_err(result).line << ": "
                          << unwrap_err(result).message;
            return ParsedDocstring{};
        }
        return unwrap(result);
    }

    auto parse_err(const std::string& text, DocstringStyle style) -> DocstringError {
        auto result = parse_docstring(text, style);
        if (is_ok(result)) {
            ADD_FAILURE() << "expected a parse error";
            return DocstringError{.message = "", .line = 0};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Text helpers
// ============================================================================

TEST(DocstringTextTest, CleanDocstringRemovesCommonIndent) {
    auto lines = clean_docstring("  Summary.\n\n      Body.\n        Deeper.\n    ");
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "Summary.");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "Body.");
    EXPECT_EQ(lines[3], "  Deeper.");
    EXPECT_EQ(lines[4], "");
}

TEST(DocstringTextTest, StripOptional) {
    std::string type = "Sequence[str], optional";
    EXPECT_TRUE(strip_optional(type));
    EXPECT_EQ(type, "Sequence[str]");

    type = "optional";
    EXPECT_TRUE(strip_optional(type));
    EXPECT_EQ(type, "");

    type = "Optional[int]";
    EXPECT_FALSE(strip_optional(type));
    EXPECT_EQ(type, "Optional[int]");
}

TEST(DocstringTextTest, TopLevelColonSkipsBrackets) {
    EXPECT_EQ(find_top_level_colon("x (Dict[str, int]): d"), 18u);
    EXPECT_EQ(find_top_level_colon("f(a: int)"), std::string::npos);
}

// ============================================================================
// Google
// ============================================================================

TEST_F(DocstringParserTest, Google) {
    auto doc = parse_ok(GOOGLE_DOC, DocstringStyle::Google);

    EXPECT_EQ(doc.style, DocstringStyle::Google);
    EXPECT_EQ(doc.summary, "Fetch rows from a table.");
    EXPECT_EQ(doc.description, "Retrieves rows pertaining to the given keys.");

    ASSERT_EQ(doc.params.size(), 3u);
    EXPECT_EQ(doc.params[0].name, "table");
    EXPECT_EQ(doc.params[0].type, "Table");
    EXPECT_EQ(doc.params[0].description, "An open table handle.");
    EXPECT_FALSE(doc.params[0].is_optional);

    EXPECT_EQ(doc.params[1].name, "keys");
    EXPECT_EQ(doc.params[1].type, "Sequence[str]");
    EXPECT_TRUE(doc.params[1].is_optional);
    EXPECT_EQ(doc.params[1].description, "Keys to fetch.\nContinued description.");

    EXPECT_EQ(doc.params[2].name, "*args");
    EXPECT_EQ(doc.params[2].type, "");

    ASSERT_TRUE(doc.returns.has_value());
    EXPECT_EQ(doc.returns->type, "dict");
    EXPECT_EQ(doc.returns->description, "A mapping of keys to rows.");

    ASSERT_EQ(doc.raises.size(), 1u);
    EXPECT_EQ(doc.raises[0].type, "IOError");
    EXPECT_EQ(doc.raises[0].description, "An error occurred accessing the table.");
}

TEST_F(DocstringParserTest, GoogleReturnsWithoutType) {
    auto doc = parse_ok("Do it.\n\nReturns:\n    True if it worked: otherwise False.\n",
                        DocstringStyle::Google);
    ASSERT_TRUE(doc.returns.has_value());
    EXPECT_EQ(doc.returns->type, "");
    EXPECT_EQ(doc.returns->description, "True if it worked: otherwise False.");
}

TEST_F(DocstringParserTest, GoogleItemWithoutColonIsError) {
    auto err = parse_err("Summary.\n\nArgs:\n    x (int) the x\n", DocstringStyle::Google);
    EXPECT_EQ(err.line, 4u);
    EXPECT_NE(err.message.find("':'"), std::string::npos);

    err = parse_err("Summary.\n\nRaises:\n    ValueError\n", DocstringStyle::Google);
    EXPECT_EQ(err.line, 4u);
}

// ============================================================================
// NumPy
// ============================================================================

TEST_F(DocstringParserTest, Numpy) {
    auto doc = parse_ok(NUMPY_DOC, DocstringStyle::Numpy);

    EXPECT_EQ(doc.summary, "Compute things.");
    ASSERT_EQ(doc.params.size(), 2u);
    EXPECT_EQ(doc.params[0].name, "x");
    EXPECT_EQ(doc.params[0].type, "int");
    EXPECT_EQ(doc.params[0].description, "The x value.");
    EXPECT_EQ(doc.params[1].name, "y");
    EXPECT_EQ(doc.params[1].type, "str");
    EXPECT_TRUE(doc.params[1].is_optional);

    ASSERT_TRUE(doc.returns.has_value());
    EXPECT_EQ(doc.returns->type, "int");
    EXPECT_EQ(doc.returns->description, "The result.");

    ASSERT_EQ(doc.raises.size(), 1u);
    EXPECT_EQ(doc.raises[0].type, "ValueError");
    EXPECT_EQ(doc.raises[0].description, "If x is negative.");
}

// ============================================================================
// Sphinx and Epydoc
// ============================================================================

TEST_F(DocstringParserTest, Sphinx) {
    auto doc = parse_ok(SPHINX_DOC, DocstringStyle::Sphinx);

    EXPECT_EQ(doc.summary, "Open a file.");
    ASSERT_EQ(doc.params.size(), 2u);
    EXPECT_EQ(doc.params[0].name, "path");
    EXPECT_EQ(doc.params[0].type, "str");
    EXPECT_EQ(doc.params[0].description, "File to read.");
    EXPECT_EQ(doc.params[1].name, "mode");
    EXPECT_EQ(doc.params[1].type, "str");
    EXPECT_TRUE(doc.params[1].is_optional);
    EXPECT_EQ(doc.params[1].description, "Open mode,\ncontinued here.");

    ASSERT_TRUE(doc.returns.has_value());
    EXPECT_EQ(doc.returns->type, "bytes");
    EXPECT_EQ(doc.returns->description, "The contents.");

    ASSERT_EQ(doc.raises.size(), 1u);
    EXPECT_EQ(doc.raises[0].type, "IOError");
}

TEST_F(DocstringParserTest, SphinxFieldWithoutClosingColonIsError) {
    auto err = parse_err("Summary.\n\n:param x the x\n", DocstringStyle::Sphinx);
    EXPECT_EQ(err.line, 3u);
    EXPECT_NE(err.message.find("closing ':'"), std::string::npos);
}

TEST_F(DocstringParserTest, Epydoc) {
    auto doc = parse_ok(EPYDOC_DOC, DocstringStyle::Epydoc);

    ASSERT_EQ(doc.params.size(), 2u);
    EXPECT_EQ(doc.params[0].name, "a");
    EXPECT_EQ(doc.params[0].type, "int");
    EXPECT_EQ(doc.params[1].description, "Second operand.");
    ASSERT_TRUE(doc.returns.has_value());
    EXPECT_EQ(doc.returns->type, "int");
    EXPECT_EQ(doc.returns->description, "The sum.");
    ASSERT_EQ(doc.raises.size(), 1u);
    EXPECT_EQ(doc.raises[0].type, "ValueError");
}

TEST_F(DocstringParserTest, EpydocTagWithoutColonIsError) {
    auto err = parse_err("Summary.\n@param a the a\n", DocstringStyle::Epydoc);
    EXPECT_EQ(err.line, 2u);
}

// ============================================================================
// Auto
// ============================================================================

TEST_F(DocstringParserTest, AutoPicksConventionWithMostEntries) {
    EXPECT_EQ(parse_ok(GOOGLE_DOC, DocstringStyle::Auto).style, DocstringStyle::Google);
    EXPECT_EQ(parse_ok(NUMPY_DOC, DocstringStyle::Auto).style, DocstringStyle::Numpy);
    EXPECT_EQ(parse_ok(SPHINX_DOC, DocstringStyle::Auto).style, DocstringStyle::Sphinx);
    EXPECT_EQ(parse_ok(EPYDOC_DOC, DocstringStyle::Auto).style, DocstringStyle::Epydoc);
}

TEST_F(DocstringParserTest, AutoTieGoesToEarliestConvention) {
    auto doc = parse_ok("Just a summary.\n\nAnd some prose.", DocstringStyle::Auto);
    EXPECT_EQ(doc.style, DocstringStyle::Sphinx);
    EXPECT_EQ(doc.summary, "Just a summary.");
    EXPECT_EQ(doc.description, "And some prose.");
    EXPECT_EQ(doc.entry_count(), 0u);
}

TEST_F(DocstringParserTest, AutoSkipsFailingConventions) {
    // Google rejects the Args item; the Sphinx field is still found.
    auto doc = parse_ok("Summary.\n\nArgs:\n    broken item\n:param x: the x value\n",
                        DocstringStyle::Auto);
    EXPECT_EQ(doc.style, DocstringStyle::Sphinx);
    ASSERT_EQ(doc.params.size(), 1u);
    EXPECT_EQ(doc.params[0].name, "x");
}

TEST_F(DocstringParserTest, EmptyDocstring) {
    auto doc = parse_ok("", DocstringStyle::Auto);
    EXPECT_TRUE(doc.summary.empty());
    EXPECT_EQ(doc.entry_count(), 0u);
}
