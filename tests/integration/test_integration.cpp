#include "wrapindent/application/wrapindent_app.hpp"
#include "wrapindent/core/line_wrap_verifier.hpp"
#include "wrapindent/io/file_system.hpp"
#include "wrapindent/parsers/tree_dump_parser.hpp"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

namespace wrapindent {

// Mock implementations for testing
class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<std::string>, read_file, (const std::string& path), (override));
    MOCK_METHOD(bool, file_exists, (const std::string& path), (override));
};

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_filesystem_ = std::make_unique<MockFileSystem>();

        // Store raw pointer for expectations
        filesystem_ptr_ = mock_filesystem_.get();
    }

    auto run_with_dump(const std::string& dump, const Config& config) -> int
    {
        EXPECT_CALL(*filesystem_ptr_, file_exists(config.input_file))
            .WillOnce(testing::Return(true));
        EXPECT_CALL(*filesystem_ptr_, read_file(config.input_file))
            .WillOnce(testing::Return(std::optional<std::string>{dump}));

        WrapIndentApp app(std::move(mock_filesystem_), std::make_unique<TreeDumpParser>());

        std::streambuf* orig = std::cout.rdbuf();
        std::cout.rdbuf(output_.rdbuf());
        int result = app.run(config);
        std::cout.rdbuf(orig);
        return result;
    }

    auto check_dump(const std::string& dump, const std::string& header_type,
                    const WrapConfig& config) -> std::vector<Diagnostic>
    {
        TreeDumpParser parser;
        auto result = parser.parse_tree(dump);
        EXPECT_TRUE(result.ok()) << result.error_message;
        if (!result.ok()) {
            return {};
        }

        CollectingSink sink;
        for (auto root : find_nodes(*result.tree, {header_type})) {
            LineWrapVerifier verifier(*result.tree, root, config);
            verifier.check_indentation(sink);
        }
        return sink.diagnostics();
    }

    std::unique_ptr<MockFileSystem> mock_filesystem_;
    MockFileSystem* filesystem_ptr_;
    std::ostringstream output_;

    // class Sample {
    //     @Deprecated
    //     @SuppressWarnings(
    //       "unchecked")
    //     public void process(int first,
    //       int second)
    //         throws Exception {
    //     }
    // }
    std::string annotated_method_dump_ = R"(
CLASS_DEF -> CLASS_DEF [1:0]
|--MODIFIERS -> MODIFIERS [1:0]
|--LITERAL_CLASS -> class [1:0]
|--IDENT -> Sample [1:6]
`--OBJBLOCK -> OBJBLOCK [1:13]
    |--LCURLY -> { [1:13]
    |--METHOD_DEF -> METHOD_DEF [2:4]
    |   |--MODIFIERS -> MODIFIERS [2:4]
    |   |   |--ANNOTATION -> ANNOTATION [2:4]
    |   |   |   |--AT -> @ [2:4]
    |   |   |   `--IDENT -> Deprecated [2:5]
    |   |   |--ANNOTATION -> ANNOTATION [3:4]
    |   |   |   |--AT -> @ [3:4]
    |   |   |   |--IDENT -> SuppressWarnings [3:5]
    |   |   |   |--LPAREN -> ( [3:21]
    |   |   |   |--EXPR -> EXPR [4:6]
    |   |   |   |   `--STRING_LITERAL -> "unchecked" [4:6]
    |   |   |   `--RPAREN -> ) [4:17]
    |   |   `--LITERAL_PUBLIC -> public [5:4]
    |   |--TYPE -> TYPE [5:11]
    |   |   `--LITERAL_VOID -> void [5:11]
    |   |--IDENT -> process [5:16]
    |   |--LPAREN -> ( [5:23]
    |   |--PARAMETERS -> PARAMETERS [5:24]
    |   |   |--PARAMETER_DEF -> PARAMETER_DEF [5:24]
    |   |   |   |--MODIFIERS -> MODIFIERS [5:24]
    |   |   |   |--TYPE -> TYPE [5:24]
    |   |   |   |   `--LITERAL_INT -> int [5:24]
    |   |   |   `--IDENT -> first [5:28]
    |   |   |--COMMA -> , [5:33]
    |   |   `--PARAMETER_DEF -> PARAMETER_DEF [6:6]
    |   |       |--MODIFIERS -> MODIFIERS [6:6]
    |   |       |--TYPE -> TYPE [6:6]
    |   |       |   `--LITERAL_INT -> int [6:6]
    |   |       `--IDENT -> second [6:10]
    |   |--RPAREN -> ) [6:16]
    |   |--LITERAL_THROWS -> throws [7:8]
    |   |   `--IDENT -> Exception [7:15]
    |   `--SLIST -> { [7:25]
    |       `--RCURLY -> } [8:4]
    `--RCURLY -> } [9:0]
)";
};

TEST_F(IntegrationTest, AnnotatedMethodMinimumMode)
{
    auto diagnostics = check_dump(annotated_method_dump_, "METHOD_DEF",
                                  WrapConfig{.wrap_indent_width = 4, .strict_mode = false});

    // "unchecked" (6) and "int second" (6) fall short of 4 + 4
    ASSERT_EQ(diagnostics.size(), 2);
    EXPECT_EQ(diagnostics[0], (Diagnostic{.line = 4,
                                           .actual_column = 6,
                                           .required_column = 8,
                                           .token_text = "\"unchecked\"",
                                           .message_key = "indentation.error"}));
    EXPECT_EQ(diagnostics[1].line, 6);
    EXPECT_EQ(diagnostics[1].token_text, "int");
    EXPECT_EQ(diagnostics[1].required_column, 8);
}

TEST_F(IntegrationTest, AnnotatedMethodNarrowWrap)
{
    auto diagnostics = check_dump(annotated_method_dump_, "METHOD_DEF",
                                  WrapConfig{.wrap_indent_width = 2, .strict_mode = false});

    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(IntegrationTest, AnnotatedMethodStrictMode)
{
    auto diagnostics = check_dump(annotated_method_dump_, "METHOD_DEF",
                                  WrapConfig{.wrap_indent_width = 4, .strict_mode = true});

    // "throws" follows the last header token and is left to the caller's own rule
    ASSERT_EQ(diagnostics.size(), 2);
    EXPECT_EQ(diagnostics[0].line, 4);
    EXPECT_EQ(diagnostics[1].line, 6);
}

TEST_F(IntegrationTest, ClassHeaderStopsBeforeBody)
{
    // The class body is the last child; its members are never part of the header
    auto diagnostics = check_dump(annotated_method_dump_, "CLASS_DEF",
                                  WrapConfig{.wrap_indent_width = 4, .strict_mode = true});

    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(IntegrationTest, CascadedElseIfAgainstClosingBrace)
{
    // if (a) {
    //     run();
    // } else if (b
    //   && c) {
    // }
    std::string dump = R"(
LITERAL_IF -> if [1:0]
|--LPAREN -> ( [1:3]
|--EXPR -> EXPR [1:4]
|   `--IDENT -> a [1:4]
|--RPAREN -> ) [1:5]
|--SLIST -> { [1:7]
|   |--EXPR -> EXPR [2:7]
|   |   `--METHOD_CALL -> ( [2:7]
|   |       |--IDENT -> run [2:4]
|   |       |--ELIST -> ELIST [2:8]
|   |       `--RPAREN -> ) [2:8]
|   |--SEMI -> ; [2:9]
|   `--RCURLY -> } [3:0]
`--LITERAL_ELSE -> else [3:2]
    `--LITERAL_IF -> if [3:7]
        |--LPAREN -> ( [3:10]
        |--EXPR -> EXPR [4:2]
        |   `--LAND -> && [4:2]
        |       |--IDENT -> b [3:11]
        |       `--IDENT -> c [4:5]
        |--RPAREN -> ) [4:6]
        `--SLIST -> { [4:8]
            `--RCURLY -> } [5:0]
)";

    auto diagnostics = check_dump(dump, "LITERAL_IF",
                                  WrapConfig{.wrap_indent_width = 4, .strict_mode = false});

    // Only the inner "if" spans two header lines; it is anchored to "}" at column 0
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].line, 4);
    EXPECT_EQ(diagnostics[0].actual_column, 2);
    EXPECT_EQ(diagnostics[0].required_column, 4);
}

TEST_F(IntegrationTest, AppReportsDumpViolations)
{
    Config config{.input_file = "Sample.ast",
                  .wrap = WrapConfig{.wrap_indent_width = 4, .strict_mode = false},
                  .header_types = {"CLASS_DEF", "METHOD_DEF"}};

    int result = run_with_dump(annotated_method_dump_, config);

    EXPECT_EQ(result, EXIT_VIOLATIONS);
    std::string output_str = output_.str();
    EXPECT_THAT(output_str, testing::HasSubstr("Found 2 headers"));
    EXPECT_THAT(output_str, testing::HasSubstr("4: '\"unchecked\"' has incorrect indentation"));
    EXPECT_THAT(output_str, testing::HasSubstr("6: 'int' has incorrect indentation level 6"));
    EXPECT_THAT(output_str, testing::HasSubstr("Checked 2 headers, found 2 indentation errors."));
}

TEST_F(IntegrationTest, OverlappingHeadersKeepDistinctFindings)
{
    // void f(final
    //   String... s) {}
    // Both the method (column 0) and its parameter (column 7) see "String" at column 2
    std::string dump = R"(
METHOD_DEF -> METHOD_DEF [1:0]
|--TYPE -> TYPE [1:0]
|   `--LITERAL_VOID -> void [1:0]
|--IDENT -> f [1:5]
|--LPAREN -> ( [1:6]
|--PARAMETERS -> PARAMETERS [1:7]
|   `--PARAMETER_DEF -> PARAMETER_DEF [1:7]
|       |--MODIFIERS -> MODIFIERS [1:7]
|       |   `--FINAL -> final [1:7]
|       |--TYPE -> TYPE [2:2]
|       |   `--IDENT -> String [2:2]
|       |--ELLIPSIS -> ... [2:8]
|       `--IDENT -> s [2:12]
|--RPAREN -> ) [2:13]
`--SLIST -> { [2:15]
    `--RCURLY -> } [2:16]
)";
    Config config{.input_file = "f.ast",
                  .wrap = WrapConfig{},
                  .header_types = {"METHOD_DEF", "PARAMETER_DEF"}};

    int result = run_with_dump(dump, config);

    EXPECT_EQ(result, EXIT_VIOLATIONS);
    EXPECT_THAT(output_.str(), testing::HasSubstr("found 2 indentation errors"));
    EXPECT_THAT(output_.str(), testing::HasSubstr(
                                   "2: 'String' has incorrect indentation level 2, expected "
                                   "level should be 4."));
    EXPECT_THAT(output_.str(), testing::HasSubstr(
                                   "2: 'String' has incorrect indentation level 2, expected "
                                   "level should be 11."));
}

TEST(FileSystemTest, ReadsExistingFile)
{
    auto path = std::filesystem::temp_directory_path() / "wrapindent_filesystem_test.ast";
    {
        std::ofstream out(path);
        out << "CLASS_DEF -> CLASS_DEF [1:0]\n";
    }

    FileSystem filesystem;
    EXPECT_TRUE(filesystem.file_exists(path.string()));

    auto content = filesystem.read_file(path.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "CLASS_DEF -> CLASS_DEF [1:0]\n");

    std::filesystem::remove(path);
}

TEST(FileSystemTest, MissingFile)
{
    FileSystem filesystem;
    std::string path = "/nonexistent/wrapindent/input.ast";

    EXPECT_FALSE(filesystem.file_exists(path));
    EXPECT_FALSE(filesystem.read_file(path).has_value());
}

} // namespace wrapindent
