#include <gtest/gtest.h>

#include "FakeWheels.h"
#include "PreciseTurn.h"

class PreciseTurnTest : public ::testing::Test {
protected:
  PreciseTurnTest() : turn(drive, slot) { drive.begin(&wheels); }

  PreciseTurn::TickReport tick(float yawDeg) { return turn.tick(deg(yawDeg), nowMs); }

  // Reach the current leg at yawDeg, then sit out the hold.
  void reachAndHold(float yawDeg) {
    ASSERT_TRUE(tick(yawDeg).legReached);
    EXPECT_EQ(wheels.current(), cmd(0, 0, 0));
    const uint8_t leg = turn.leg();

    nowMs += 1999;
    tick(yawDeg);
    EXPECT_TRUE(turn.holding());
    EXPECT_EQ(turn.leg(), leg);

    nowMs += 1;
    tick(yawDeg);
    EXPECT_FALSE(turn.holding());
    nowMs += 20;
  }

  FakeWheels wheels;
  TrikeDrive drive;
  TestPhaseSlot slot;
  PreciseTurn turn;
  uint32_t nowMs = 0;
};

TEST_F(PreciseTurnTest, IdleUntilButton) {
  const PreciseTurn::TickReport r = tick(0);
  EXPECT_FALSE(r.running);
  EXPECT_EQ(wheels.current(), cmd(0, 0, 0));
}

TEST_F(PreciseTurnTest, RunsFourLegsThenWaits) {
  slot.request(MissionPhase::ApproachObstacle);

  // leg 0: left to -90
  EXPECT_TRUE(tick(0).running);
  EXPECT_EQ(wheels.current(), cmd(0, -5, 5));
  EXPECT_FALSE(tick(-89).legReached);
  reachAndHold(-90.5f);
  EXPECT_EQ(turn.leg(), 1);

  // leg 1: left to -179
  tick(-91);
  EXPECT_EQ(wheels.current(), cmd(0, -5, 5));
  EXPECT_FALSE(tick(-178).legReached);
  reachAndHold(-179.5f);
  EXPECT_EQ(turn.leg(), 2);

  // leg 2: right back to -90
  tick(-179.5f);
  EXPECT_EQ(wheels.current(), cmd(0, 5, -5));
  EXPECT_FALSE(tick(-100).legReached);
  reachAndHold(-89.5f);
  EXPECT_EQ(turn.leg(), 3);

  // leg 3: right to -1, then done
  tick(-89.5f);
  EXPECT_EQ(wheels.current(), cmd(0, 5, -5));
  EXPECT_FALSE(tick(-2).legReached);
  ASSERT_TRUE(tick(-0.5f).legReached);

  nowMs += 2000;
  const PreciseTurn::TickReport r = tick(-0.5f);
  EXPECT_TRUE(r.finished);
  EXPECT_FALSE(r.running);
  EXPECT_EQ(slot.current(), MissionPhase::WaitForStart);
  EXPECT_EQ(turn.leg(), 0);
  EXPECT_EQ(wheels.current(), cmd(0, 0, 0));
}

TEST_F(PreciseTurnTest, TargetsAreRelativeToStartHeading) {
  slot.request(MissionPhase::ApproachObstacle);
  tick(30);
  EXPECT_FALSE(tick(-59).legReached);
  EXPECT_TRUE(tick(-60.5f).legReached);
}

TEST_F(PreciseTurnTest, OvershootPastHalfTurnCounts) {
  slot.request(MissionPhase::ApproachObstacle);
  tick(0);
  reachAndHold(-90.5f);

  // -179 was skipped between ticks; yaw wrapped to the positive side
  tick(-170);
  EXPECT_TRUE(tick(179.5f).legReached);
}

TEST_F(PreciseTurnTest, ButtonDuringRunRestarts) {
  slot.request(MissionPhase::ApproachObstacle);
  tick(0);
  reachAndHold(-90.5f);
  ASSERT_EQ(turn.leg(), 1);

  slot.request(MissionPhase::WaitForStart);
  EXPECT_FALSE(tick(-100).running);
  EXPECT_EQ(wheels.current(), cmd(0, 0, 0));

  slot.request(MissionPhase::ApproachObstacle);
  tick(-100);
  EXPECT_EQ(turn.leg(), 0);
  EXPECT_EQ(wheels.current(), cmd(0, -5, 5));
}

TEST_F(PreciseTurnTest, FailedStopDoesNotStartHold) {
  slot.request(MissionPhase::ApproachObstacle);
  tick(0);
  wheels.fail = true;

  const PreciseTurn::TickReport r = tick(-95);
  EXPECT_EQ(r.driveError, DriveError::WheelsNotConfigured);
  EXPECT_FALSE(r.legReached);
  EXPECT_FALSE(turn.holding());
}
