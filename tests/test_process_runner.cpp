#include <gtest/gtest.h>

#include "selfupdate/system/process_runner.hpp"
#include "selfupdate/update/binary_validator.hpp"
#include "testing.hpp"

#include <sys/stat.h>

namespace selfupdate {
namespace {

using std::chrono::milliseconds;

TEST(ProcessRunnerTest, ReportsExitCode) {
    testutil::TemporaryDirectory dir;
    const std::string script = dir.Sub("exit3");
    testutil::WriteScript(script, "#!/bin/sh\nexit 3\n");

    int code = -1;
    auto r = DefaultProcessRunner()->Run({script}, milliseconds(5000), code);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(code, 3);
}

TEST(ProcessRunnerTest, PassesArguments) {
    testutil::TemporaryDirectory dir;
    const std::string script = dir.Sub("args");
    testutil::WriteScript(script, "#!/bin/sh\n[ \"$1\" = \"--version\" ] && exit 0\nexit 1\n");

    int code = -1;
    ASSERT_TRUE(DefaultProcessRunner()->Run({script, "--version"}, milliseconds(5000), code).is_ok());
    EXPECT_EQ(code, 0);
    ASSERT_TRUE(DefaultProcessRunner()->Run({script, "--help"}, milliseconds(5000), code).is_ok());
    EXPECT_EQ(code, 1);
}

TEST(ProcessRunnerTest, KillsChildOnTimeout) {
    testutil::TemporaryDirectory dir;
    const std::string script = dir.Sub("hang");
    testutil::WriteScript(script, "#!/bin/sh\nexec sleep 30\n");

    const auto started = std::chrono::steady_clock::now();
    int code = -1;
    auto r = DefaultProcessRunner()->Run({script}, milliseconds(200), code);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ETIMEDOUT);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessRunnerTest, UnstartableProgramExits127) {
    int code = -1;
    auto r = DefaultProcessRunner()->Run({"/nonexistent/selfupdate-binary"}, milliseconds(5000), code);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(code, 127);
}

TEST(BinaryValidatorTest, AcceptsBinaryAnsweringVersion) {
    testutil::TemporaryDirectory dir;
    const std::string bin = dir.Sub("delta");
    testutil::WriteScript(bin, testutil::FakeBinary("1.0.0"));

    auto r = BinaryValidator().Validate(bin);
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(BinaryValidatorTest, FallsBackToVersionSubcommand) {
    testutil::TemporaryDirectory dir;
    const std::string bin = dir.Sub("delta");
    testutil::WriteScript(bin, "#!/bin/sh\n[ \"$1\" = \"version\" ] && exit 0\nexit 2\n");

    auto r = BinaryValidator().Validate(bin);
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(BinaryValidatorTest, MakesFileExecutableBeforeProbing) {
    testutil::TemporaryDirectory dir;
    const std::string bin = dir.Sub("delta");
    testutil::WriteFile(bin, testutil::FakeBinary("1.0.0"), 0644);

    auto r = BinaryValidator().Validate(bin);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    struct stat st{};
    ASSERT_EQ(::stat(bin.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0111, 0111u);
}

TEST(BinaryValidatorTest, RejectsFailingBinary) {
    testutil::TemporaryDirectory dir;
    const std::string bin = dir.Sub("delta");
    testutil::WriteScript(bin, "#!/bin/sh\nexit 1\n");

    auto r = BinaryValidator().Validate(bin);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("exit code 1"), std::string::npos);
}

TEST(BinaryValidatorTest, RejectsDirectoriesAndMissingFiles) {
    testutil::TemporaryDirectory dir;
    EXPECT_FALSE(BinaryValidator().Validate(dir.Path()).is_ok());
    EXPECT_FALSE(BinaryValidator().Validate(dir.Sub("missing")).is_ok());
}

TEST(BinaryValidatorTest, HangingBinaryTimesOut) {
    testutil::TemporaryDirectory dir;
    const std::string bin = dir.Sub("delta");
    testutil::WriteScript(bin, "#!/bin/sh\nexec sleep 30\n");

    BinaryValidator::Options opt;
    opt.timeout = milliseconds(200);
    BinaryValidator validator(nullptr, opt);

    const auto started = std::chrono::steady_clock::now();
    auto r = validator.Validate(bin);
    ASSERT_FALSE(r.is_ok());
    // A timed-out probe is not followed by the second one.
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

} // namespace
} // namespace selfupdate
