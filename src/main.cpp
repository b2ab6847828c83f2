#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "CalendarScheduler.hpp"
#include "Config.hpp"
#include "Credentials.hpp"
#include "CurlTransport.hpp"
#include "Duration.hpp"
#include "Errors.hpp"
#include "FeedRefresher.hpp"
#include "FileStore.hpp"
#include "FreshnessCache.hpp"
#include "KeyValueStore.hpp"
#include "Logger.hpp"
#include "Metrics.hpp"
#include "ScrapingClient.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
  g_stop = true;
}

void print_entry(const CacheEntry& entry, const Clock& clock) {
  const auto age = std::chrono::duration_cast<std::chrono::seconds>(
    clock.Now() - entry.updated_at);
  std::cout << entry.key << " (updated " << DescribeAge(age) << ")\n"
            << entry.payload.dump(2) << std::endl;
}

int run_once(const Config& conf, FeedRefresher& feeds, const Clock& clock,
             const std::vector<std::string>& keys) {
  int failures = 0;
  for (const auto& key : keys) {
    try {
      print_entry(feeds.Get(conf.GetFeed(key)), clock);
    } catch (const ScrapeError& e) {
      logr::error << "[main] " << key << ": " << e.what();
      ++failures;
    }
  }
  return failures == 0 ? 0 : 1;
}

int run_scheduler(const Config& conf, FeedRefresher& feeds,
                  const Clock& clock, Metrics& metrics) {
  CalendarScheduler scheduler(clock, conf.GetTickInterval());
  scheduler.SetMetrics(&metrics);
  size_t jobs = 0;
  for (const auto& feed : conf.GetFeeds())
    jobs += feeds.Schedule(feed, scheduler, conf.GetTimeZone());

  if (jobs == 0) {
    logr::warning << "[main] no feed has a daily or midnight schedule";
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  scheduler.Start();
  using namespace std::chrono_literals;
  while (!g_stop)
    std::this_thread::sleep_for(250ms);
  logr::info << "[main] shutting down";
  scheduler.Stop();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> keys(argv + 1, argv + argc);

  try {
    Config conf;
    logr::info << "    config: " << conf.GetConfigFile();
    logr::info << "  base url: " << conf.GetSessionOptions().base_url;
    logr::info << " store dir: "
               << (conf.GetStoreDir().empty() ? std::string{"(memory)"}
                                              : conf.GetStoreDir().string());
    logr::info << "script dir: " << conf.GetScriptsDir();

    const Credentials creds = Credentials::Require(
      keys.empty() ? "scheduler" : "refresh", conf.GetUsernameVar(),
      conf.GetPasswordVar());

    SystemClock clock;
    PrometheusMetrics metrics;
    if (!conf.GetMetricsListen().empty())
      metrics.Expose(conf.GetMetricsListen());
    CurlTransport transport(conf.GetUserAgent(), conf.GetTimeout());

    std::unique_ptr<KeyValueStore> store;
    if (conf.GetStoreDir().empty())
      store = std::make_unique<MemoryStore>();
    else
      store = std::make_unique<FileStore>(conf.GetStoreDir());

    FreshnessCache cache(*store, clock);
    ScrapingClient client(creds, conf.GetSessionOptions(), transport, clock,
                          &metrics);
    FeedRefresher feeds(client, cache);
    for (const auto& feed : conf.GetFeeds())
      feeds.LoadScript(conf.GetScriptsDir(), feed.key);

    if (!keys.empty())
      return run_once(conf, feeds, clock, keys);
    return run_scheduler(conf, feeds, clock, metrics);
  } catch (const ScrapeError& e) {
    logr::error << "[main] " << e.what();
  } catch (const std::exception& e) {
    logr::error << "[main] unexpected: " << e.what();
  }
  return 1;
}
