#include <gtest/gtest.h>

#include "selfupdate/update/artifact_extractor.hpp"
#include "testing.hpp"

#include <filesystem>
#include <sys/stat.h>

namespace selfupdate {
namespace {

class ArtifactExtractorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory temp_dir;

    std::string OutDir() {
        const std::string out = temp_dir.Sub("out");
        std::filesystem::create_directories(out);
        return out;
    }

    ArtifactExtractor MakeExtractor(std::string os = "linux") {
        ArtifactExtractor::Options opt;
        opt.product_name = "delta";
        opt.os = std::move(os);
        return ArtifactExtractor(opt);
    }
};

TEST(ArtifactKindTest, DetectsByExtension) {
    EXPECT_EQ(DetectArtifactKind("delta_linux_amd64.tar.gz"), ArtifactKind::kTarGz);
    EXPECT_EQ(DetectArtifactKind("/tmp/DELTA.TGZ"), ArtifactKind::kTarGz);
    EXPECT_EQ(DetectArtifactKind("delta_windows_amd64.zip"), ArtifactKind::kZip);
    EXPECT_EQ(DetectArtifactKind("delta_linux_amd64.gz"), ArtifactKind::kGzip);
    EXPECT_EQ(DetectArtifactKind("delta_linux_amd64"), ArtifactKind::kRaw);
}

TEST(ArtifactPredicateTest, DefaultRules) {
    EXPECT_TRUE(IsExpectedArtifact("delta", "delta", "linux"));
    EXPECT_TRUE(IsExpectedArtifact("Delta-CLI.sh", "delta", "linux"));
    EXPECT_TRUE(IsExpectedArtifact("tool", "delta", "linux"));
    EXPECT_FALSE(IsExpectedArtifact("README.md", "delta", "linux"));
    EXPECT_TRUE(IsExpectedArtifact("tool.exe", "delta", "windows"));
    EXPECT_FALSE(IsExpectedArtifact("tool", "delta", "windows"));
    EXPECT_FALSE(IsExpectedArtifact("", "delta", "linux"));

    EXPECT_EQ(ExecutableFileName("delta", "windows"), "delta.exe");
    EXPECT_EQ(ExecutableFileName("delta", "linux"), "delta");
}

TEST_F(ArtifactExtractorTest, ExtractsBinaryFromTarGz) {
    const std::string artifact = temp_dir.Sub("delta_linux_amd64.tar.gz");
    testutil::WriteFile(artifact, testutil::BuildArchive({
        {"delta_linux_amd64/", "", AE_IFDIR, 0755},
        {"delta_linux_amd64/README.md", "docs", AE_IFREG, 0644},
        {"delta_linux_amd64/LICENSE", "mit", AE_IFREG, 0644},
        {"delta_linux_amd64/delta", "#!/bin/sh\nexit 0\n", AE_IFREG, 0755},
    }));

    std::string binary;
    auto r = MakeExtractor().Extract(artifact, OutDir(), binary);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(binary, temp_dir.Sub("out/delta_linux_amd64/delta"));
    EXPECT_EQ(testutil::ReadFile(binary), "#!/bin/sh\nexit 0\n");
}

TEST_F(ArtifactExtractorTest, ExtractsBinaryFromZip) {
    const std::string artifact = temp_dir.Sub("delta_windows_amd64.zip");
    testutil::WriteFile(artifact, testutil::BuildArchive({
        {"README.txt", "docs", AE_IFREG, 0644},
        {"delta.exe", "MZ", AE_IFREG, 0755},
    }, testutil::ArchiveFormat::kZip));

    std::string binary;
    auto r = MakeExtractor("windows").Extract(artifact, OutDir(), binary);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(binary, temp_dir.Sub("out/delta.exe"));
}

TEST_F(ArtifactExtractorTest, CustomPredicateSelectsBinary) {
    const std::string artifact = temp_dir.Sub("bundle.tar.gz");
    testutil::WriteFile(artifact, testutil::BuildArchive({
        {"bin/shell-helper", "x", AE_IFREG, 0755},
        {"bin/runner.bin", "y", AE_IFREG, 0755},
    }));

    ArtifactExtractor::Options opt;
    opt.product_name = "delta";
    opt.os = "linux";
    opt.is_binary = [](std::string_view name, std::string_view) { return name == "runner.bin"; };

    std::string binary;
    auto r = ArtifactExtractor(opt).Extract(artifact, OutDir(), binary);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(binary, temp_dir.Sub("out/bin/runner.bin"));
}

TEST_F(ArtifactExtractorTest, FailsWhenNoBinaryInArchive) {
    const std::string artifact = temp_dir.Sub("docs.tar.gz");
    testutil::WriteFile(artifact, testutil::BuildArchive({
        {"README.md", "docs", AE_IFREG, 0644},
        {"CHANGELOG.md", "changes", AE_IFREG, 0644},
    }));

    std::string binary;
    auto r = MakeExtractor().Extract(artifact, OutDir(), binary);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("binary not found in archive"), std::string::npos);
}

TEST_F(ArtifactExtractorTest, RejectsPathTraversal) {
    const std::string artifact = temp_dir.Sub("evil.tar.gz");
    testutil::WriteFile(artifact, testutil::BuildArchive({
        {"../delta", "x", AE_IFREG, 0755},
    }));

    std::string binary;
    auto r = MakeExtractor().Extract(artifact, OutDir(), binary);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("Unsafe path in archive"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(temp_dir.Sub("delta")));
}

TEST_F(ArtifactExtractorTest, CorruptArchiveFails) {
    const std::string artifact = temp_dir.Sub("delta_linux_amd64.tar.gz");
    testutil::WriteFile(artifact, std::string(512, 'z'));

    std::string binary;
    auto r = MakeExtractor().Extract(artifact, OutDir(), binary);
    EXPECT_FALSE(r.is_ok());
    EXPECT_TRUE(binary.empty());
}

TEST_F(ArtifactExtractorTest, InflatesSingleGzipBinary) {
    const std::string artifact = temp_dir.Sub("delta_linux_amd64.gz");
    testutil::WriteFile(artifact, testutil::GzipCompress("#!/bin/sh\nexit 0\n"));

    std::string binary;
    auto r = MakeExtractor().Extract(artifact, OutDir(), binary);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(binary, temp_dir.Sub("out/delta"));
    EXPECT_EQ(testutil::ReadFile(binary), "#!/bin/sh\nexit 0\n");

    struct stat st{};
    ASSERT_EQ(::stat(binary.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);
}

TEST_F(ArtifactExtractorTest, CopiesRawBinaryUnderProductName) {
    const std::string artifact = temp_dir.Sub("delta_linux_amd64");
    testutil::WriteFile(artifact, "ELF", 0755);

    std::string binary;
    auto r = MakeExtractor().Extract(artifact, OutDir(), binary);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(binary, temp_dir.Sub("out/delta"));
    EXPECT_EQ(testutil::ReadFile(binary), "ELF");
}

TEST_F(ArtifactExtractorTest, MissingArtifactFails) {
    std::string binary;
    auto r = MakeExtractor().Extract(temp_dir.Sub("nope.tar.gz"), OutDir(), binary);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
}

} // namespace
} // namespace selfupdate
