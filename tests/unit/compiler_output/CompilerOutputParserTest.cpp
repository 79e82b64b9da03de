#include <gtest/gtest.h>

#include "compiler_output_parser.hpp"
#include "support/temporary_directory.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace escapelint::compiler_output
{
namespace
{
    using testsupport::makeTemporaryRoot;
    using testsupport::ScopedDirectory;

    CompilerOutputParseResult parseText(const std::string& text, const std::filesystem::path& base = "/work")
    {
        std::istringstream stream{text};
        return parseCompilerOutput(stream, base);
    }

    TEST(CompilerOutputParserTest, RecognisesEveryHintPhrase)
    {
        const std::string output = R"(
main.go:10: moved to heap: main
main.go:15: escapes to heap: main
main.go:20: stays on stack: main
main.go:25: inlining call: main
main.go:30: Found IsInBounds
)";

        auto result = parseText(output);
        ASSERT_FALSE(result.hasError) << result.errorMessage;

        HintIndex expected{
            {{"/work/main.go", 10}, {CompilerHint::MovedToHeap}},
            {{"/work/main.go", 15}, {CompilerHint::EscapesToHeap}},
            {{"/work/main.go", 20}, {CompilerHint::StaysOnStack}},
            {{"/work/main.go", 25}, {CompilerHint::Inlined}},
            {{"/work/main.go", 30}, {CompilerHint::FoundIsInBounds}},
        };
        EXPECT_EQ(result.hints, expected);
        EXPECT_EQ(result.linesRead, 6u);
    }

    TEST(CompilerOutputParserTest, FirstPhraseInPriorityOrderWins)
    {
        EXPECT_EQ(classifyLine("a.go:1:2: x escapes to heap, moved to heap"), CompilerHint::EscapesToHeap);
        EXPECT_EQ(classifyLine("a.go:1:2: moved to heap after inlining call"), CompilerHint::MovedToHeap);
        EXPECT_EQ(classifyLine("a.go:1:2: inlining call to f; Found IsInBounds"), CompilerHint::Inlined);
        EXPECT_FALSE(classifyLine("a.go:1:2: can inline f with cost 4").has_value());
        EXPECT_FALSE(classifyLine("a.go:1:2: found isinbounds").has_value());

        auto result = parseText("a.go:7:3: stays on stack but inlining call too\n");
        ASSERT_FALSE(result.hasError);
        ASSERT_EQ(result.hints.size(), 1u);
        EXPECT_EQ(result.hints.begin()->second, std::vector<CompilerHint>{CompilerHint::StaysOnStack});
    }

    TEST(CompilerOutputParserTest, KeepsEveryHintForTheSamePositionInOrder)
    {
        const std::string output =
            "./main.go:7:6: moved to heap: buf\n"
            "./main.go:7:13: inlining call to strings.Clone\n"
            "./main.go:7:6: moved to heap: buf\n";

        auto result = parseText(output);
        ASSERT_FALSE(result.hasError);
        ASSERT_EQ(result.hints.size(), 1u);

        const Position key{"/work/main.go", 7};
        ASSERT_EQ(result.hints.count(key), 1u);
        const std::vector<CompilerHint> expected{
            CompilerHint::MovedToHeap, CompilerHint::Inlined, CompilerHint::MovedToHeap};
        EXPECT_EQ(result.hints.at(key), expected);
    }

    TEST(CompilerOutputParserTest, IgnoresUnrecognisedAndLocationlessLines)
    {
        const std::string output =
            "# example.com/demo\n"
            "./main.go:3:6: can inline helper with cost 4\n"
            "\n"
            "moved to heap\n"
            "   ./pkg/util.go:12:9: leaking param: p escapes to heap\n";

        auto result = parseText(output, "build");
        ASSERT_FALSE(result.hasError);
        ASSERT_EQ(result.hints.size(), 1u);
        EXPECT_EQ(result.hints.begin()->first, (Position{"build/pkg/util.go", 12}));
        EXPECT_EQ(result.linesRead, 5u);
    }

    TEST(CompilerOutputParserTest, StripsCarriageReturns)
    {
        auto result = parseText("main.go:4:2: moved to heap: x\r\nmain.go:5: Found IsInBounds\r\n");
        ASSERT_FALSE(result.hasError) << result.errorMessage;
        EXPECT_EQ(result.hints.size(), 2u);
        EXPECT_EQ(result.hints.count(Position{"/work/main.go", 5}), 1u);
    }

    TEST(CompilerOutputParserTest, MalformedLineNumberAbortsWithLineOrdinal)
    {
        const std::string output =
            "main.go:10: moved to heap: main\n"
            "main.go:11: nothing to see here\n"
            "main.go:abc: escapes to heap\n"
            "main.go:12: stays on stack: y\n";

        auto result = parseText(output);
        EXPECT_TRUE(result.hasError);
        EXPECT_TRUE(result.hints.empty());
        EXPECT_NE(result.errorMessage.find("at 3"), std::string::npos) << result.errorMessage;
        EXPECT_NE(result.errorMessage.find("'abc'"), std::string::npos) << result.errorMessage;
    }

    TEST(CompilerOutputParserTest, EmptyOrTrailingJunkLineNumberIsRejected)
    {
        EXPECT_TRUE(parseText("main.go:: moved to heap: x\n").hasError);
        EXPECT_TRUE(parseText("main.go: moved to heap: x\n").hasError);
        EXPECT_TRUE(parseText("main.go:12a:4: moved to heap: x\n").hasError);
        EXPECT_TRUE(parseText("main.go:0: moved to heap: x\n").hasError);
        EXPECT_FALSE(parseText("main.go:12:4: moved to heap: x\n").hasError);
    }

    TEST(CompilerOutputParserTest, ResolvesReferencesAgainstTheDocumentDirectory)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("escl-output-")};
        const auto outputPath = cleanup.path / "build" / "compiler_output.txt";
        std::filesystem::create_directories(outputPath.parent_path());
        {
            std::ofstream stream(outputPath);
            stream << "../main.go:10:2: moved to heap: main\n";
            stream << "main.go:25:9: inlining call to helper\n";
        }

        auto result = parseCompilerOutputFile(outputPath);
        ASSERT_FALSE(result.hasError) << result.errorMessage;

        const Position parent{(cleanup.path / "main.go").lexically_normal().generic_string(), 10};
        const Position sibling{(cleanup.path / "build" / "main.go").lexically_normal().generic_string(), 25};
        EXPECT_EQ(result.hints.count(parent), 1u);
        EXPECT_EQ(result.hints.count(sibling), 1u);
    }

    TEST(CompilerOutputParserTest, MissingDocumentIsAnError)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("escl-output-missing-")};
        auto result = parseCompilerOutputFile(cleanup.path / "absent.txt");
        EXPECT_TRUE(result.hasError);
        EXPECT_NE(result.errorMessage.find("failed to open file"), std::string::npos);
    }

    TEST(CompilerOutputParserTest, RepeatedParsesAreIdentical)
    {
        const std::string output =
            "b.go:2: moved to heap: x\n"
            "a.go:9: inlining call to f\n"
            "a.go:1: Found IsInBounds\n";

        auto first = parseText(output);
        auto second = parseText(output);
        EXPECT_EQ(first.hints, second.hints);
        ASSERT_EQ(first.hints.size(), 3u);
        EXPECT_EQ(first.hints.begin()->first, (Position{"/work/a.go", 1}));
    }
}
} // namespace escapelint::compiler_output
