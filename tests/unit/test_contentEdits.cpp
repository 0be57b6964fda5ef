#include <gtest/gtest.h>
#include "util/contentEdits.hpp"

using namespace px::util;

TEST(ContentEditsTest, InsertAfterFirstAnchor) {
    EXPECT_EQ(applyInsert("a\nb\na\n", "a\n", "x\n"), "a\nx\nb\na\n");
}

TEST(ContentEditsTest, EmptyAnchorPrepends) {
    EXPECT_EQ(applyInsert("body\n", "", "head\n"), "head\nbody\n");
}

TEST(ContentEditsTest, MissingAnchorThrows) {
    EXPECT_THROW((void)applyInsert("abc", "zzz", "x"), std::runtime_error);
}

TEST(ContentEditsTest, ReplaceFirstOccurrenceOnly) {
    EXPECT_EQ(applyReplace("foo foo", "foo", "bar"), "bar foo");
    EXPECT_EQ(applyReplace("keep this", "this", ""), "keep ");
}

TEST(ContentEditsTest, ReplaceRejectsEmptyOrMissingFind) {
    EXPECT_THROW((void)applyReplace("abc", "", "x"), std::runtime_error);
    EXPECT_THROW((void)applyReplace("abc", "d", "x"), std::runtime_error);
}
