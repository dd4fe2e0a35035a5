#include <gtest/gtest.h>

#include "HeadingPID.h"

TEST(HeadingPID, ProportionalOnly) {
  HeadingPID pid(1.5f, 0.0f, 0.0f, 0.02f);
  EXPECT_FLOAT_EQ(pid.update(4.0f), 6.0f);
  EXPECT_FLOAT_EQ(pid.update(-2.0f), -3.0f);
}

TEST(HeadingPID, OutputIsClamped) {
  HeadingPID pid(2.0f, 0.0f, 0.0f, 0.02f);
  pid.setOutputLimit(-25.0f);  // sign ignored
  EXPECT_FLOAT_EQ(pid.update(100.0f), 25.0f);
  EXPECT_FLOAT_EQ(pid.update(-100.0f), -25.0f);
}

TEST(HeadingPID, IntegralIsClampedAndReset) {
  HeadingPID pid(0.0f, 1.0f, 0.0f, 1.0f);
  pid.setIntegralLimit(10.0f);
  pid.setOutputLimit(100.0f);

  for (int i = 0; i < 5; i++) pid.update(5.0f);
  EXPECT_FLOAT_EQ(pid.integral(), 10.0f);

  pid.reset();
  EXPECT_FLOAT_EQ(pid.integral(), 0.0f);
}

TEST(HeadingPID, NoDerivativeKickOnFirstSample) {
  HeadingPID pid(0.0f, 0.0f, 1.0f, 0.1f);
  pid.setOutputLimit(1000.0f);

  EXPECT_FLOAT_EQ(pid.update(20.0f), 0.0f);
  EXPECT_NEAR(pid.update(21.0f), 10.0f, 1e-3f);

  pid.reset();
  EXPECT_FLOAT_EQ(pid.update(-50.0f), 0.0f);
}

TEST(HeadingPID, DtHasAFloor) {
  HeadingPID pid;
  pid.setDt(0.0f);
  EXPECT_GT(pid.getDt(), 0.0f);
}
