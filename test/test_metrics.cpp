#include <gtest/gtest.h>
#include "CalendarScheduler.hpp"
#include "Errors.hpp"
#include "FakeTransport.hpp"
#include "Metrics.hpp"
#include "ScrapingClient.hpp"

#include <stdexcept>

TEST(MetricsTest, SeriesAreKeyedBySortedTags) {
  SCOPED_TRACE("Tag order and empty values do not split a series.");
  RecordProperty("description",
                 "Increments with the same tags in any order, plus an empty "
                 "tag, land on one counter.");

  MemoryMetrics metrics;
  metrics.Increment("rpg.fetch", {{"status", "ok"}, {"method", "GET"}});
  metrics.Increment("rpg.fetch",
                    {{"method", "GET"}, {"status", "ok"}, {"extra", ""}}, 2);
  metrics.Increment("", {{"status", "ok"}});

  EXPECT_EQ(SeriesKey("rpg.fetch", {{"status", "ok"}, {"method", "GET"}}),
            "rpg.fetch{method=GET,status=ok}");
  EXPECT_EQ(metrics.Get("rpg.fetch", {{"method", "GET"}, {"status", "ok"}}),
            3);
  EXPECT_EQ(metrics.Snapshot().size(), 1u);
}

TEST(MetricsTest, PrometheusCountersAreCollected) {
  SCOPED_TRACE("Counters reach the prometheus registry under export names.");
  RecordProperty("description",
                 "Two scheduler runs for one job produce a scheduler_run_total "
                 "family with a single series of value 2.");

  PrometheusMetrics metrics;
  metrics.IncrementSchedulerRun("ssanne:daily", "ok");
  metrics.IncrementSchedulerRun("ssanne:daily", "ok");

  EXPECT_EQ(PrometheusMetrics::ExportName("external.fetch"),
            "external_fetch_total");

  auto families = metrics.GetRegistry()->Collect();
  ASSERT_EQ(families.size(), 1u);
  EXPECT_EQ(families[0].name, "scheduler_run_total");
  ASSERT_EQ(families[0].metric.size(), 1u);
  EXPECT_DOUBLE_EQ(families[0].metric[0].counter.value, 2.0);
}

TEST(MetricsTest, ClientCountsEachExchange) {
  SCOPED_TRACE("Every exchange is counted as ok or error.");
  RecordProperty("description",
                 "A login plus a page fetch count two ok exchanges; a "
                 "network failure counts one error and still propagates.");

  ManualClock clock{FromEpochMillis(1767225600000)};
  FakeTransport transport;
  MemoryMetrics metrics;
  bool network_down = false;
  transport.SetHandler([&network_down](const HttpRequest& r) {
    if (r.method == "POST")
      return LoggedIn();
    if (network_down)
      throw TransportError("connection reset");
    return Page("OK");
  });
  ScrapingClient client(Credentials{"ash", "secret"}, SessionOptions{},
                        transport, clock, &metrics);

  EXPECT_EQ(client.FetchPage("/page.php"), "OK");
  network_down = true;
  EXPECT_THROW(client.FetchPage("/page.php"), TransportError);

  // the login exchange goes through the session manager, not the client
  EXPECT_EQ(metrics.Get("rpg.fetch", {{"method", "GET"}, {"status", "ok"}}),
            1);
  EXPECT_EQ(metrics.Get("rpg.fetch", {{"method", "GET"}, {"status", "error"}}),
            1);
  EXPECT_EQ(metrics.Get("external.fetch", {{"source", "rpg"}, {"status", "ok"}}),
            1);
  EXPECT_EQ(
    metrics.Get("external.fetch", {{"source", "rpg"}, {"status", "error"}}), 1);
}

TEST(MetricsTest, SchedulerCountsRuns) {
  SCOPED_TRACE("Each job action is counted by outcome.");
  RecordProperty("description",
                 "A ticker that succeeds and one that throws are counted as "
                 "scheduler.run ok and error.");

  ManualClock clock{FromEpochMillis(1767225600000)};
  CalendarScheduler scheduler(clock);
  MemoryMetrics metrics;
  scheduler.SetMetrics(&metrics);
  scheduler.Register("good", [] {});
  scheduler.Register("bad", [] { throw std::runtime_error("boom"); });

  scheduler.Tick();
  scheduler.Tick();

  EXPECT_EQ(metrics.Get("scheduler.run", {{"name", "good"}, {"status", "ok"}}),
            2);
  EXPECT_EQ(metrics.Get("scheduler.run", {{"name", "bad"}, {"status", "error"}}),
            2);
  EXPECT_EQ(metrics.Get("scheduler.run", {{"name", "bad"}, {"status", "ok"}}),
            0);
}
