// fwdeploy-Prod headers
#include "core/AdapterTools.hpp"
#include "core/Errors.hpp"

// fwdeploy-Fake headers
#include "FakeProcessRunner.hpp"
#include "MockHostAccess.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace fwdeploy::test {

  using core::AdapterTools;
  using testing::ElementsAre;
  using testing::NiceMock;
  using testing::Return;

  class AdapterToolsTest : public ::testing::Test {
  protected:
    core::DeployConfig cfg;
    FakeProcessRunner runner;
    NiceMock<MockHostAccess> host;
    AdapterTools tools{ cfg, runner, host };
  };

  TEST_F(AdapterToolsTest, SerialConsoleRunsTioInteractively) {
    tools.openSerialConsole();

    ASSERT_EQ(runner.calls.size(), 1u);
    const auto& cmd = runner.calls[0];
    EXPECT_EQ(cmd.program, "tio");
    EXPECT_TRUE(cmd.interactive);
    EXPECT_THAT(cmd.args, ElementsAre("-b", "115200", "/dev/ttyUSB0", "--input-mode", "line", "-et",
                                      "--map", "ICRNL,INLCRNL"));
  }

  TEST_F(AdapterToolsTest, SerialConsoleNeedsThePort) {
    EXPECT_CALL(host, deviceExists("/dev/ttyUSB0")).WillOnce(Return(false));
    EXPECT_THROW(tools.openSerialConsole(), core::DeviceNotFoundError);
    EXPECT_TRUE(runner.calls.empty());
  }

  TEST_F(AdapterToolsTest, CanUpRunsSlcandThenIpLink) {
    tools.bringUpCan(1);

    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[0].program, "slcand");
    EXPECT_THAT(runner.calls[0].args, ElementsAre("-o", "-c", "-s8", "/dev/ttyACM1", "can0"));
    EXPECT_THAT(runner.calls[1].args, ElementsAre("link", "set", "can0", "up"));
    EXPECT_THAT(runner.calls[2].args, ElementsAre("link", "set", "can0", "txqueuelen", "1000"));
  }

  TEST_F(AdapterToolsTest, CanUpStopsAtFirstFailure) {
    runner.push(0);
    runner.push(2, "RTNETLINK answers: Operation not permitted");

    try {
      tools.bringUpCan(0);
      FAIL() << "expected FlashError";
    } catch (const core::FlashError& e) {
      EXPECT_EQ(e.exitCode(), 2);
    }
    EXPECT_EQ(runner.calls.size(), 2u);
  }

  TEST_F(AdapterToolsTest, CanUpRequiresRoot) {
    EXPECT_CALL(host, isPrivileged()).WillOnce(Return(false));
    EXPECT_THROW(tools.bringUpCan(0), core::PermissionError);
    EXPECT_TRUE(runner.calls.empty());
  }

} // namespace fwdeploy::test
