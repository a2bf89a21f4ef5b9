#include <gtest/gtest.h>

#include "selfupdate/util/path_utils.hpp"

namespace selfupdate {
namespace {

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(NormalizeArchivePath("./delta"), "delta");
    EXPECT_EQ(NormalizeArchivePath("/bin//delta///"), "bin/delta");
    EXPECT_EQ(NormalizeArchivePath("././a//b"), "a/b");
    EXPECT_EQ(NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, BaseNameHandlesBothSeparators) {
    EXPECT_EQ(BaseName("dist/linux/delta"), "delta");
    EXPECT_EQ(BaseName("dist\\windows\\delta.exe"), "delta.exe");
    EXPECT_EQ(BaseName("delta"), "delta");
    EXPECT_EQ(BaseName("dir/"), "");
}

TEST(PathUtilsTest, CaseAndAffixHelpers) {
    EXPECT_EQ(ToLower("Delta_Linux_AMD64"), "delta_linux_amd64");
    EXPECT_TRUE(StartsWith("v1.2.3", "v"));
    EXPECT_FALSE(StartsWith("", "v"));
    EXPECT_TRUE(EndsWith("delta.tar.gz", ".tar.gz"));
    EXPECT_FALSE(EndsWith("gz", ".tar.gz"));
}

} // namespace
} // namespace selfupdate
