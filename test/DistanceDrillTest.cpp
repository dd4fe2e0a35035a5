#include <gtest/gtest.h>

#include "DistanceDrill.h"
#include "FakeWheels.h"

class DistanceDrillTest : public ::testing::Test {
protected:
  DistanceDrillTest() : drill(drive, slot) { drive.begin(&wheels); }

  FakeWheels wheels;
  TrikeDrive drive;
  TestPhaseSlot slot;
  DistanceDrill drill;
};

TEST_F(DistanceDrillTest, IdleUntilButton) {
  const DistanceDrill::TickReport r = drill.tick(deg(0), 3000);
  EXPECT_FALSE(r.running);
  EXPECT_EQ(wheels.current(), cmd(0, 0, 0));
  EXPECT_EQ(drill.targetMm(), 2095);
}

TEST_F(DistanceDrillTest, DrivesUntilStepTargetThenWaits) {
  slot.request(MissionPhase::ApproachObstacle);

  DistanceDrill::TickReport r = drill.tick(deg(0), 3000);
  EXPECT_TRUE(r.running);
  EXPECT_EQ(wheels.current(), cmd(100, 100, 100));

  r = drill.tick(deg(0), 2096);
  EXPECT_FALSE(r.stepDone);

  r = drill.tick(deg(0), 2095);
  EXPECT_TRUE(r.stepDone);
  EXPECT_FALSE(r.running);
  EXPECT_EQ(wheels.current(), cmd(0, 0, 0));
  EXPECT_EQ(slot.current(), MissionPhase::WaitForStart);
  EXPECT_EQ(drill.step(), 1);
  EXPECT_EQ(drill.targetMm(), 1595);

  // nothing moves until the next press
  r = drill.tick(deg(0), 3000);
  EXPECT_FALSE(r.running);
  EXPECT_EQ(wheels.current(), cmd(0, 0, 0));
}

TEST_F(DistanceDrillTest, NoReadingNeverStops) {
  slot.request(MissionPhase::ApproachObstacle);
  const DistanceDrill::TickReport r = drill.tick(deg(0), 0);
  EXPECT_TRUE(r.running);
  EXPECT_FALSE(r.stepDone);
}

TEST_F(DistanceDrillTest, HoldsTheStartingHeading) {
  slot.request(MissionPhase::ApproachObstacle);
  drill.tick(deg(10), 3000);
  EXPECT_EQ(wheels.current(), cmd(100, 100, 100));

  // drifted 10 deg clockwise -> slow the left side
  drill.tick(deg(20), 3000);
  EXPECT_EQ(wheels.current(), cmd(100, 15, 100));
}

TEST_F(DistanceDrillTest, StepsCycle) {
  const int32_t targets[] = {2095, 1595, 1095, 595, 2095};
  for (int i = 0; i < 5; i++) {
    EXPECT_EQ(drill.targetMm(), targets[i]);
    slot.request(MissionPhase::ApproachObstacle);
    drill.tick(deg(0), 5000);
    ASSERT_TRUE(drill.tick(deg(0), 100).stepDone);
  }
}

TEST_F(DistanceDrillTest, DriveErrorKeepsStepRunning) {
  slot.request(MissionPhase::ApproachObstacle);
  wheels.fail = true;
  const DistanceDrill::TickReport r = drill.tick(deg(0), 100);
  EXPECT_EQ(r.driveError, DriveError::WheelsNotConfigured);
  EXPECT_FALSE(r.stepDone);
  EXPECT_EQ(drill.step(), 0);
  EXPECT_EQ(slot.current(), MissionPhase::ApproachObstacle);
}
