#include <gtest/gtest.h>
#include "Errors.hpp"
#include "ZoneTime.hpp"

#include <cstdlib>

namespace {
const std::string kEastern = "America/New_York";

TimePoint Utc(int year, int month, int day, int hour, int minute = 0) {
  return zonetime::FromZoned({year, month, day, hour, minute, 0}, "UTC");
}
}  // namespace

TEST(ZoneTimeTest, ConvertsIntoEasternTime) {
  SCOPED_TRACE("UTC instants map onto New York wall-clock time.");
  RecordProperty("description",
                 "03:00Z on 2026-01-04 is 22:00 on 2026-01-03 in EST.");

  const ZonedParts p = zonetime::ToZoned(Utc(2026, 1, 4, 3), kEastern);
  EXPECT_EQ(p.year, 2026);
  EXPECT_EQ(p.month, 1);
  EXPECT_EQ(p.day, 3);
  EXPECT_EQ(p.hour, 22);
  EXPECT_EQ(zonetime::DateKey(Utc(2026, 1, 4, 3), kEastern), "2026-01-03");
  EXPECT_EQ(zonetime::LocalHour(Utc(2026, 1, 4, 3), kEastern), 22);
}

TEST(ZoneTimeTest, NextMidnightLandsOnLocalMidnight) {
  SCOPED_TRACE("From 22:00 ET the next run is 00:00 ET, two hours later.");
  RecordProperty("description",
                 "The returned instant is 05:00Z and reads as hour 0, "
                 "minute 0 in New York.");

  const TimePoint next = zonetime::NextMidnight(Utc(2026, 1, 4, 3), kEastern);
  EXPECT_EQ(next, Utc(2026, 1, 4, 5));
  const ZonedParts p = zonetime::ToZoned(next, kEastern);
  EXPECT_EQ(p.hour, 0);
  EXPECT_EQ(p.minute, 0);
  EXPECT_EQ(p.day, 4);
}

TEST(ZoneTimeTest, NextMidnightIsStrictlyLater) {
  SCOPED_TRACE("Exactly at midnight the next run is a day away.");
  RecordProperty("description",
                 "From 00:00 ET and from 01:00 ET the next midnight is "
                 "2026-01-05T05:00Z.");

  EXPECT_EQ(zonetime::NextMidnight(Utc(2026, 1, 4, 5), kEastern),
            Utc(2026, 1, 5, 5));
  EXPECT_EQ(zonetime::NextMidnight(Utc(2026, 1, 4, 6), kEastern),
            Utc(2026, 1, 5, 5));
}

TEST(ZoneTimeTest, FollowsDaylightSavingChanges) {
  SCOPED_TRACE("Local midnight moves by an hour across DST changes.");
  RecordProperty("description",
                 "Midnight after the March change is 04:00Z (EDT); after the "
                 "November change it is 05:00Z again (EST).");

  // 2026-03-08 is the spring-forward day in the US
  EXPECT_EQ(zonetime::NextMidnight(Utc(2026, 3, 8, 12), kEastern),
            Utc(2026, 3, 9, 4));
  // 2026-11-01 is the fall-back day; that day lasts 25 hours
  EXPECT_EQ(zonetime::NextMidnight(Utc(2026, 11, 1, 12), kEastern),
            Utc(2026, 11, 2, 5));
}

TEST(ZoneTimeTest, RollsOverYearEnd) {
  SCOPED_TRACE("Day arithmetic crosses month and year boundaries.");
  RecordProperty("description",
                 "From the evening of 2026-12-31 ET the next midnight is "
                 "2027-01-01 00:00 ET.");

  const TimePoint next = zonetime::NextMidnight(Utc(2027, 1, 1, 2), kEastern);
  EXPECT_EQ(next, Utc(2027, 1, 1, 5));
  EXPECT_EQ(zonetime::DateKey(next, kEastern), "2027-01-01");
}

TEST(ZoneTimeTest, LeavesTzEnvironmentAlone) {
  SCOPED_TRACE("Conversions restore the process TZ setting.");
  RecordProperty("description",
                 "TZ set before a conversion has the same value afterwards.");

  ::setenv("TZ", "Europe/Berlin", 1);
  zonetime::ToZoned(Utc(2026, 6, 1, 12), kEastern);
  const char* tz = std::getenv("TZ");
  ASSERT_NE(tz, nullptr);
  EXPECT_STREQ(tz, "Europe/Berlin");
  ::unsetenv("TZ");
}

TEST(ZoneTimeTest, KnowsInstalledZones) {
  SCOPED_TRACE("Zone names are checked against the tz database.");
  RecordProperty("description",
                 "America/New_York and UTC are known; made-up names and "
                 "path tricks are not.");

  EXPECT_TRUE(zonetime::IsKnownZone(kEastern));
  EXPECT_TRUE(zonetime::IsKnownZone("UTC"));
  EXPECT_FALSE(zonetime::IsKnownZone("Mars/Olympus_Mons"));
  EXPECT_FALSE(zonetime::IsKnownZone("../etc/passwd"));
  EXPECT_FALSE(zonetime::IsKnownZone(""));
}
