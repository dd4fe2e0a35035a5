#include <gtest/gtest.h>

#include "DebounceTimer.h"

TEST(DebounceTimer, FirstConfirmOnlyArms) {
  DebounceTimer t;
  EXPECT_FALSE(t.confirm(1000, 200));
  EXPECT_TRUE(t.armed);
  EXPECT_EQ(t.startMs, 1000u);
}

TEST(DebounceTimer, FiresOnceAfterWindow) {
  DebounceTimer t;
  EXPECT_FALSE(t.confirm(1000, 200));
  EXPECT_FALSE(t.confirm(1100, 200));
  EXPECT_FALSE(t.confirm(1199, 200));
  EXPECT_TRUE(t.confirm(1200, 200));
  EXPECT_FALSE(t.armed);

  // re-arms on the next call
  EXPECT_FALSE(t.confirm(1201, 200));
  EXPECT_TRUE(t.armed);
}

TEST(DebounceTimer, CancelDropsPendingEvent) {
  DebounceTimer t;
  t.confirm(0, 100);
  t.cancel();
  EXPECT_FALSE(t.armed);
  EXPECT_EQ(t.elapsed(500), 0u);

  // a fresh window starts on the next confirm
  EXPECT_FALSE(t.confirm(500, 100));
  EXPECT_FALSE(t.confirm(550, 100));
  EXPECT_TRUE(t.confirm(600, 100));
}

TEST(DebounceTimer, SurvivesMillisWrap) {
  DebounceTimer t;
  const uint32_t start = 0xFFFFFF00u;
  EXPECT_FALSE(t.confirm(start, 300));
  EXPECT_EQ(t.elapsed(start + 0x80u), 0x80u);
  EXPECT_FALSE(t.confirm(start + 0x100u, 300));  // wrapped to 0
  EXPECT_TRUE(t.confirm(start + 300u, 300));
}
