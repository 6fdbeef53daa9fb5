#include "TestTree.hpp"
#include "common/file_comparator.hpp"

class FileComparatorTest : public TestTree {};

TEST_F(FileComparatorTest, IdenticalContents) {
    writeFile(scratch / "a.txt", "hello");
    writeFile(scratch / "b.txt", "hello");
    FileComparator comparator(logger);
    EXPECT_TRUE(comparator.filesAreEqual((scratch / "a.txt").string(), (scratch / "b.txt").string()));
}

TEST_F(FileComparatorTest, SameLengthDifferentBytes) {
    writeFile(scratch / "a.txt", "hello");
    writeFile(scratch / "b.txt", "jello");
    FileComparator comparator(logger);
    EXPECT_FALSE(comparator.filesAreEqual((scratch / "a.txt").string(), (scratch / "b.txt").string()));
}

TEST_F(FileComparatorTest, DifferentLength) {
    writeFile(scratch / "a.txt", "hello");
    writeFile(scratch / "b.txt", "hello!");
    FileComparator comparator(logger);
    EXPECT_FALSE(comparator.filesAreEqual((scratch / "a.txt").string(), (scratch / "b.txt").string()));
}

TEST_F(FileComparatorTest, EmptyFilesAreEqual) {
    writeFile(scratch / "a", "");
    writeFile(scratch / "b", "");
    FileComparator comparator(logger);
    EXPECT_TRUE(comparator.filesAreEqual((scratch / "a").string(), (scratch / "b").string()));
}

TEST_F(FileComparatorTest, UnreadableSideCountsAsDifferent) {
    writeFile(scratch / "a.txt", "hello");
    auto a = (scratch / "a.txt").string();
    auto missing = (scratch / "gone.txt").string();
    FileComparator comparator(logger);

    EXPECT_FALSE(comparator.filesAreEqual(a, missing));
    EXPECT_FALSE(comparator.filesAreEqual(missing, a));
    EXPECT_NE(log().find("Error comparing files " + a + " and " + missing), std::string::npos);
    EXPECT_NE(log().find("Error comparing files " + missing + " and " + a), std::string::npos);
}
