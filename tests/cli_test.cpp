//! # CLI Command Tests
//!
//! Drives the command handlers with in-memory streams.

#include "commands/cmd_doc.hpp"
#include "commands/cmd_normalize.hpp"
#include "commands/cmd_params.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace sigdoc;
using namespace sigdoc::cli;
namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
    std::vector<std::string> storage;
    std::vector<char*> argv;

    /// Builds an argv of the form {"sigdoc", <command>, args...}.
    auto make_argv(std::vector<std::string> args) -> char** {
        storage = std::move(args);
        storage.insert(storage.begin(), "sigdoc");
        argv.clear();
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return argv.data();
    }

    auto argc() const -> int {
        return static_cast<int>(storage.size());
    }
};

// ============================================================================
// normalize
// ============================================================================

TEST_F(CliTest, NormalizeArguments) {
    auto** args = make_argv({"normalize", "typing.List[mod.A]", "<class 'int'>"});
    auto options = parse_normalize_args(argc(), args, 2);
    ASSERT_EQ(options.expressions.size(), 2u);
    EXPECT_TRUE(options.color.empty());

    std::istringstream in;
    std::ostringstream out;
    EXPECT_EQ(run_normalize(options, in, out), 0);
    EXPECT_EQ(out.str(), "List[A]\nint\n");
}

TEST_F(CliTest, NormalizeColorOptions) {
    auto** args = make_argv({"normalize", "--color", "int"});
    EXPECT_EQ(parse_normalize_args(argc(), args, 2).color, "cyan");

    args = make_argv({"normalize", "--color=red", "-v", "int"});
    auto options = parse_normalize_args(argc(), args, 2);
    EXPECT_EQ(options.color, "red");
    ASSERT_EQ(options.expressions.size(), 1u);

    std::istringstream in;
    std::ostringstream out;
    run_normalize(options, in, out);
    EXPECT_EQ(out.str(), "<fg=red>(int)</>\n");
}

TEST_F(CliTest, NormalizeReadsStdin) {
    NormalizeOptions options;
    std::istringstream in("outer.T\r\nUnion[a, b]\n");
    std::ostringstream out;
    EXPECT_EQ(run_normalize(options, in, out), 0);
    EXPECT_EQ(out.str(), "T\na | b\n");
}

TEST_F(CliTest, NormalizeDoubleDash) {
    auto** args = make_argv({"normalize", "--", "--weird"});
    auto options = parse_normalize_args(argc(), args, 2);
    ASSERT_EQ(options.expressions.size(), 1u);
    EXPECT_EQ(options.expressions[0], "--weird");
}

// ============================================================================
// params
// ============================================================================

TEST_F(CliTest, ParamsArguments) {
    auto** args = make_argv({"params", "--style=NumPy", "--format=json", "doc.txt"});
    auto options = parse_params_args(argc(), args, 2);
    ASSERT_TRUE(is_ok(options));
    EXPECT_EQ(unwrap(options).style, docstring::DocstringStyle::Numpy);
    EXPECT_EQ(unwrap(options).format, ParamsFormat::Json);
    EXPECT_EQ(unwrap(options).input_file, "doc.txt");
}

TEST_F(CliTest, ParamsUnknownStyleIsUsageError) {
    auto** args = make_argv({"params", "--style=javadoc"});
    auto options = parse_params_args(argc(), args, 2);
    ASSERT_TRUE(is_err(options));
    EXPECT_NE(unwrap_err(options).message.find("javadoc"), std::string::npos);
}

TEST_F(CliTest, ParamsTextOutput) {
    ParamsOptions options;
    std::istringstream in(":param b: second\n:param a: first\n");
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_params(options, in, out, err), 0);
    EXPECT_EQ(out.str(), "a: first\nb: second\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, ParamsJsonOutput) {
    ParamsOptions options;
    options.format = ParamsFormat::Json;
    std::istringstream in(":param q: say \"hi\"\n");
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_params(options, in, out, err), 0);
    EXPECT_EQ(out.str(), "{\n  \"q\": \"say \\\"hi\\\"\"\n}\n");
}

TEST_F(CliTest, ParamsJsonEmpty) {
    ParamsOptions options;
    options.format = ParamsFormat::Json;
    std::istringstream in("");
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_params(options, in, out, err), 0);
    EXPECT_EQ(out.str(), "{}\n");
}

TEST_F(CliTest, ParamsMissingFile) {
    ParamsOptions options;
    options.input_file = (fs::temp_directory_path() / "sigdoc_no_such_file.txt").string();
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_params(options, in, out, err), 1);
    EXPECT_NE(err.str().find("cannot open file"), std::string::npos);
}

TEST_F(CliTest, ParamsReadsFile) {
    auto path = fs::temp_directory_path() / "sigdoc_params_test.txt";
    {
        std::ofstream file(path);
        file << "Summary.\n\nArgs:\n    x (int): The x.\n";
    }

    ParamsOptions options;
    options.input_file = path.string();
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_params(options, in, out, err), 0);
    EXPECT_EQ(out.str(), "x: The x.\n");

    fs::remove(path);
}

// ============================================================================
// doc
// ============================================================================

TEST_F(CliTest, DocPrintsStructuredParse) {
    DocOptions options;
    std::istringstream in("Greet someone.\n"
                          "\n"
                          "Args:\n"
                          "    name (str, optional): Who.\n"
                          "\n"
                          "Returns:\n"
                          "    str: The greeting.\n");
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_doc(options, in, out, err), 0);
    EXPECT_EQ(out.str(), "style: google\n"
                         "summary: Greet someone.\n"
                         "params:\n"
                         "  name (str, optional): Who.\n"
                         "returns: str: The greeting.\n");
}

TEST_F(CliTest, DocReportsParseError) {
    DocOptions options;
    options.style = docstring::DocstringStyle::Sphinx;
    std::istringstream in("Summary.\n:param x\n");
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_doc(options, in, out, err), 1);
    EXPECT_NE(err.str().find("line 2"), std::string::npos);
}

TEST_F(CliTest, DocRejectsSecondInput) {
    auto** args = make_argv({"doc", "a.txt", "b.txt"});
    EXPECT_TRUE(is_err(parse_doc_args(argc(), args, 2)));
}

// ============================================================================
// utils
// ============================================================================

TEST(CliUtilsTest, JsonEscape) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}
