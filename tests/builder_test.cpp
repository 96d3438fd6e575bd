// fwdeploy-Prod headers
#include "core/ArtifactBuilder.hpp"
#include "core/Errors.hpp"
#include "core/ResultReporter.hpp"

// fwdeploy-Fake headers
#include "FakeProcessRunner.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>

namespace fwdeploy::test {

  using core::ArtifactBuilder;
  using core::BuildError;
  using core::BuildMode;
  using core::DeployConfig;
  using testing::ElementsAre;
  using testing::HasSubstr;

  class ArtifactBuilderTest : public ::testing::Test {
  protected:
    void SetUp() override {
      cfg.projectDir = dir.str();
      cfg.hexPath = "app.hex";
      builder = std::make_unique<ArtifactBuilder>(cfg, runner);
    }

    // cargo build side effect: the ELF shows up under target/
    FakeProcessRunner::SideEffect compiles(const std::string& target, BuildMode mode) {
      std::string elf = builder->binaryPathFor(target, mode);
      return [elf](const io::Command&) { TempDir::touch(elf, "\x7f" "ELF"); };
    }

    // cargo objcopy side effect: last argument is the hex path
    static void writesHex(const io::Command& cmd) { TempDir::touch(cmd.args.back(), ":00000001FF\n"); }

    std::string hexPath() const { return dir.file("app.hex"); }

    TempDir dir;
    DeployConfig cfg;
    FakeProcessRunner runner;
    std::unique_ptr<ArtifactBuilder> builder;
  };

  TEST_F(ArtifactBuilderTest, CompilesThenConvertsToIntelHex) {
    runner.push(0, "Finished release", compiles("app", BuildMode::Release));
    runner.push(0, {}, writesHex);

    auto artifact = builder->build("app");

    EXPECT_EQ(artifact.target, "app");
    EXPECT_EQ(artifact.mode, BuildMode::Release);
    EXPECT_EQ(artifact.hexPath, hexPath());
    EXPECT_EQ(artifact.binaryPath,
              dir.file("target/thumbv7em-none-eabihf/release/app"));
    EXPECT_TRUE(std::filesystem::exists(hexPath()));

    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[0].program, "cargo");
    EXPECT_THAT(runner.calls[0].args, ElementsAre("build", "--bin", "app", "--release"));
    EXPECT_EQ(runner.calls[0].workingDir, dir.str());
    EXPECT_THAT(runner.calls[1].args,
                ElementsAre("objcopy", "--bin", "app", "--release", "--", "-O", "ihex", hexPath()));
  }

  TEST_F(ArtifactBuilderTest, MissingSourceFailsAndLeavesNoHex) {
    TempDir::touch(hexPath(), "stale image");
    runner.push(101, "error: couldn't read src/bin/app.rs: No such file or directory");

    try {
      builder->build("app");
      FAIL() << "expected BuildError";
    } catch (const BuildError& e) {
      EXPECT_THAT(e.toolOutput(), HasSubstr("couldn't read src/bin/app.rs"));
      EXPECT_EQ(core::ResultReporter::exitCodeFor(e.kind()), 1);
    }

    EXPECT_FALSE(std::filesystem::exists(hexPath()));
    EXPECT_EQ(runner.calls.size(), 1u); // objcopy never attempted
  }

  TEST_F(ArtifactBuilderTest, StaleHexIsGoneBeforeCompilerStarts) {
    TempDir::touch(hexPath(), "stale image");
    bool hexPresentDuringBuild = true;
    std::string hex = hexPath();
    runner.push(0, {}, [&](const io::Command& cmd) {
      hexPresentDuringBuild = std::filesystem::exists(hex);
      compiles("app", BuildMode::Release)(cmd);
    });
    runner.push(0, {}, writesHex);

    builder->build("app");
    EXPECT_FALSE(hexPresentDuringBuild);
  }

  TEST_F(ArtifactBuilderTest, BuildWithoutAnyPreviousHexSucceeds) {
    ASSERT_FALSE(std::filesystem::exists(hexPath()));
    runner.push(0, {}, compiles("app", BuildMode::Release));
    runner.push(0, {}, writesHex);
    EXPECT_NO_THROW(builder->build("app"));
  }

  TEST_F(ArtifactBuilderTest, ConversionWithoutCompiledBinaryFails) {
    runner.push(0, "Finished"); // compiler claims success but produced nothing

    EXPECT_THROW(builder->build("app"), BuildError);
    EXPECT_EQ(runner.calls.size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(hexPath()));
  }

  TEST_F(ArtifactBuilderTest, FailedConversionRemovesPartialHex) {
    runner.push(0, {}, compiles("app", BuildMode::Release));
    runner.push(1, "objcopy: out of space",
                [](const io::Command& cmd) { TempDir::touch(cmd.args.back(), ":1000"); });

    EXPECT_THROW(builder->build("app"), BuildError);
    EXPECT_FALSE(std::filesystem::exists(hexPath()));
  }

  TEST_F(ArtifactBuilderTest, ConfiguredDebugTargetOmitsReleaseFlag) {
    cfg.build.targets["rtic"] = BuildMode::Debug;
    runner.push(0, {}, compiles("rtic", BuildMode::Debug));
    runner.push(0, {}, writesHex);

    auto artifact = builder->build("rtic");

    EXPECT_EQ(artifact.mode, BuildMode::Debug);
    EXPECT_THAT(artifact.binaryPath, HasSubstr("/debug/rtic"));
    EXPECT_THAT(runner.calls[0].args, ElementsAre("build", "--bin", "rtic"));
  }

  TEST_F(ArtifactBuilderTest, ExplicitModeOverridesConfiguration) {
    cfg.build.targets["rtic"] = BuildMode::Debug;
    runner.push(0, {}, compiles("rtic", BuildMode::Release));
    runner.push(0, {}, writesHex);

    auto artifact = builder->build("rtic", BuildMode::Release);
    EXPECT_EQ(artifact.mode, BuildMode::Release);
    EXPECT_THAT(runner.calls[0].args, ElementsAre("build", "--bin", "rtic", "--release"));
  }

  TEST_F(ArtifactBuilderTest, EmptyTripleUsesHostTargetLayout) {
    cfg.build.targetTriple.clear();
    EXPECT_EQ(builder->binaryPathFor("app", BuildMode::Debug), dir.file("target/debug/app"));
  }

} // namespace fwdeploy::test
