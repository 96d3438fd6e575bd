// fwdeploy-Prod headers
#include "core/ArtifactBuilder.hpp"
#include "core/DeviceProgrammer.hpp"
#include "core/Errors.hpp"
#include "core/FlashSession.hpp"
#include "core/ResultReporter.hpp"
#include "core/TransportSelector.hpp"
#include "io/SessionLog.hpp"

// fwdeploy-Fake headers
#include "FakeProcessRunner.hpp"
#include "MockHostAccess.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fwdeploy::test {

  using core::BuildMode;
  using core::FlashSession;
  using core::TransportMode;
  using State = core::FlashSession::State;
  using testing::ElementsAre;
  using testing::HasSubstr;
  using testing::NiceMock;
  using testing::Return;

  class FlashSessionTest : public ::testing::Test {
  protected:
    void SetUp() override {
      cfg.projectDir = dir.str();
      cfg.lockDir = dir.str();
      builder = std::make_unique<core::ArtifactBuilder>(cfg, runner);
      selector = std::make_unique<core::TransportSelector>(cfg.flasher);
      programmer = std::make_unique<core::DeviceProgrammer>(cfg, runner, host);
      session = std::make_unique<FlashSession>(*builder, *selector, *programmer);
    }

    void scriptSuccessfulBuild(const std::string& target) {
      std::string elf = builder->binaryPathFor(target, BuildMode::Release);
      runner.push(0, "Finished", [elf](const io::Command&) { TempDir::touch(elf); });
      runner.push(0, {}, [](const io::Command& cmd) { TempDir::touch(cmd.args.back(), ":00000001FF\n"); });
    }

    TempDir dir;
    core::DeployConfig cfg;
    FakeProcessRunner runner;
    NiceMock<MockHostAccess> host;
    std::unique_ptr<core::ArtifactBuilder> builder;
    std::unique_ptr<core::TransportSelector> selector;
    std::unique_ptr<core::DeviceProgrammer> programmer;
    std::unique_ptr<FlashSession> session;
  };

  TEST_F(FlashSessionTest, BuildFailureNeverReachesTheProgrammer) {
    runner.push(101, "error[E0583]: file not found for module");

    EXPECT_THROW(session->flash("app", TransportMode::DebugProbe), core::BuildError);
    EXPECT_EQ(runner.countProgram("rfp-cli"), 0u);
    EXPECT_EQ(session->state(), State::Failed);
    EXPECT_THAT(session->history(), ElementsAre(State::Idle, State::Building, State::Failed));
  }

  TEST_F(FlashSessionTest, DebugProbeFlashVisitsEveryStage) {
    scriptSuccessfulBuild("app");

    auto result = session->flash("app", TransportMode::DebugProbe);

    EXPECT_TRUE(result.resetPerformed);
    EXPECT_EQ(runner.countProgram("cargo"), 2u);
    EXPECT_EQ(runner.countProgram("rfp-cli"), 2u);
    EXPECT_THAT(session->history(), ElementsAre(State::Idle, State::Building, State::Programming,
                                                State::Resetting, State::Done));
  }

  TEST_F(FlashSessionTest, UsbFlashWithAbsentPortIsDeviceNotFound) {
    scriptSuccessfulBuild("app");
    EXPECT_CALL(host, deviceExists("/dev/ttyACM0")).WillRepeatedly(Return(false));

    try {
      session->flash("app", TransportMode::Usb);
      FAIL() << "expected DeviceNotFoundError";
    } catch (const core::DeviceNotFoundError& e) {
      EXPECT_EQ(core::ResultReporter::exitCodeFor(e.kind()), 2);
    }
    EXPECT_EQ(runner.countProgram("rfp-cli"), 0u);
    EXPECT_EQ(session->state(), State::Failed);
  }

  TEST_F(FlashSessionTest, UsbFlashSkipsResetting) {
    scriptSuccessfulBuild("app");

    session->flash("app", TransportMode::Usb);
    EXPECT_THAT(session->history(),
                ElementsAre(State::Idle, State::Building, State::Programming, State::Done));
  }

  TEST_F(FlashSessionTest, BuildOnlyStopsAfterBuilding) {
    scriptSuccessfulBuild("app");

    auto artifact = session->build("app");
    EXPECT_TRUE(std::filesystem::exists(artifact.hexPath));
    EXPECT_EQ(runner.countProgram("rfp-cli"), 0u);
    EXPECT_THAT(session->history(), ElementsAre(State::Idle, State::Building, State::Done));
  }

  TEST_F(FlashSessionTest, BootloaderFlashSkipsBuilding) {
    TempDir::touch(dir.file("dfu_minima.hex"));

    auto result = session->flashBootloader(TransportMode::Usb, cfg.flasher.bootloaderImage);

    EXPECT_FALSE(result.artifact.has_value());
    EXPECT_EQ(runner.countProgram("cargo"), 0u);
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].args.back(), dir.file("dfu_minima.hex"));
    EXPECT_THAT(session->history(), ElementsAre(State::Idle, State::Programming, State::Done));
  }

  TEST_F(FlashSessionTest, BootloaderOverProbeRestartsTargetOnce) {
    TempDir::touch(dir.file("dfu_minima.hex"));

    auto result = session->flashBootloader(TransportMode::DebugProbe, cfg.flasher.bootloaderImage);

    EXPECT_TRUE(result.resetPerformed);
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_THAT(runner.calls[0].args, ElementsAre("-device", "ra", "-t", "e2l", "-if", "swd", "-p",
                                                  dir.file("dfu_minima.hex"), "-run"));
    EXPECT_THAT(runner.calls[1].args, ElementsAre("-device", "ra", "-t", "e2l", "-if", "swd", "-run"));
    EXPECT_THAT(session->history(),
                ElementsAre(State::Idle, State::Programming, State::Resetting, State::Done));
  }

  TEST_F(FlashSessionTest, SessionIsSingleUse) {
    scriptSuccessfulBuild("app");
    session->build("app");
    EXPECT_THROW(session->build("app"), std::logic_error);
  }

  TEST_F(FlashSessionTest, TranscriptRowsCarryTheStage) {
    io::SessionLog log;
    ASSERT_TRUE(log.open(dir.file("session.csv")));
    io::RecordingProcessRunner recording(runner, log);
    core::ArtifactBuilder recBuilder(cfg, recording);
    core::DeviceProgrammer recProgrammer(cfg, recording, host);
    FlashSession recSession(recBuilder, *selector, recProgrammer, &log);
    scriptSuccessfulBuild("app");

    recSession.flash("app", TransportMode::DebugProbe);
    log.close();

    std::ifstream in(dir.file("session.csv"));
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string csv = ss.str();
    EXPECT_THAT(csv, HasSubstr(",Building,cargo build --bin app --release,0,5"));
    EXPECT_THAT(csv, HasSubstr(",Programming,rfp-cli -device ra -t e2l -if swd -p "));
    EXPECT_THAT(csv, HasSubstr(",Resetting,rfp-cli -device ra -t e2l -if swd -run,0,5"));
  }

} // namespace fwdeploy::test
