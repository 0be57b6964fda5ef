#include <gtest/gtest.h>
#include "diff/DiffEngine.hpp"

#include <string>

using namespace px::diff;

namespace {

std::string numbered(const int from, const int to) {
    std::string out;
    for (int i = from; i <= to; ++i) out += "line " + std::to_string(i) + "\n";
    return out;
}

}

TEST(DiffEngineTest, IdenticalContentHasNoHunks) {
    EXPECT_TRUE(createPatch("a\nb\n", "a\nb\n", "f.txt").empty());
}

TEST(DiffEngineTest, FinalNewlineOnlyIsEmpty) {
    EXPECT_TRUE(createPatch("a\nb\n", "a\nb", "f.txt").empty());
    EXPECT_TRUE(createPatch("a\nb", "a\nb\n", "f.txt").empty());
}

TEST(DiffEngineTest, HeaderNamesBothSnapshots) {
    const auto text = createPatch("foo\n", "foo\nbar\n", "a.txt").str();
    EXPECT_NE(text.find("Index: a.txt\n"), std::string::npos);
    EXPECT_NE(text.find("--- a.txt\tprevious\n"), std::string::npos);
    EXPECT_NE(text.find("+++ a.txt\tcurrent\n"), std::string::npos);
    EXPECT_NE(text.find("@@ -1,1 +1,2 @@\n"), std::string::npos);
    EXPECT_NE(text.find("+bar\n"), std::string::npos);
}

TEST(DiffEngineTest, SingleLineChangeKeepsTwoLinesOfContext) {
    const auto prev = numbered(1, 10);
    auto cur = prev;
    cur.replace(cur.find("line 5\n"), 7, "LINE 5\n");

    const auto patch = createPatch(prev, cur, "f.txt");
    ASSERT_EQ(patch.hunks.size(), 1u);
    const auto& h = patch.hunks.front();
    EXPECT_EQ(h.oldStart, 3u);
    EXPECT_EQ(h.oldLines, 5u);
    EXPECT_EQ(h.newLines, 5u);

    const auto s = summarize(patch);
    EXPECT_EQ(s.added, 1u);
    EXPECT_EQ(s.removed, 1u);
}

TEST(DiffEngineTest, DistantChangesProduceSeparateHunks) {
    const auto prev = numbered(1, 30);
    auto cur = prev;
    cur.replace(cur.find("line 2\n"), 7, "two\n");
    cur.replace(cur.find("line 28\n"), 8, "twenty-eight\n");

    const auto patch = createPatch(prev, cur, "f.txt");
    EXPECT_EQ(patch.hunks.size(), 2u);
    EXPECT_EQ(applyPatch(prev, patch), cur);
}

TEST(DiffEngineTest, ParsedPatchAppliesExactly) {
    const std::string prev = "a\nb\nc\nd\n";
    const std::string cur = "a\nc\nd\ne\nf";

    const auto text = createPatch(prev, cur, "f.txt").str();
    EXPECT_NE(text.find(NO_NEWLINE_MARKER), std::string::npos);
    EXPECT_EQ(applyPatch(prev, parsePatch(text)), cur);
}

TEST(DiffEngineTest, EmptyPreviousAddsEverything) {
    const auto patch = createPatch("", "x\ny\n", "f.txt");
    ASSERT_EQ(patch.hunks.size(), 1u);
    EXPECT_EQ(patch.hunks.front().header(), "@@ -0,0 +1,2 @@");
    EXPECT_EQ(applyPatch("", patch), "x\ny\n");
}

TEST(DiffEngineTest, LargeRewriteStillRoundTrips) {
    std::string prev, cur;
    for (int i = 0; i < 3000; ++i) {
        prev += "old " + std::to_string(i) + "\n";
        cur += "new " + std::to_string(i) + "\n";
    }
    const auto patch = createPatch(prev, cur, "big.txt");
    EXPECT_EQ(applyPatch(prev, parsePatch(patch.str())), cur);
}

TEST(DiffEngineTest, ApplyRejectsMismatchedSource) {
    const auto patch = createPatch("a\nb\nc\n", "a\nB\nc\n", "f.txt");
    EXPECT_THROW((void)applyPatch("x\ny\nz\n", patch), std::runtime_error);
}
