#include "FeedRefresher.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

FeedRefresher::FeedRefresher(ScrapingClient& client, FreshnessCache& cache)
    : client_{client}, cache_{cache} {
}

void FeedRefresher::SetParser(const std::string& feed_key,
                              PageParser parser) {
  std::lock_guard<std::mutex> lk(m_);
  parsers_[feed_key] = std::move(parser);
}

void FeedRefresher::LoadScript(const std::filesystem::path& scripts_dir,
                               const std::string& feed_key) {
  auto script = std::make_shared<LuaParser>(scripts_dir, feed_key);
  if (!script->HasScript()) {
    throw ConfigError("no parse() script for feed " + feed_key + " under " +
                      scripts_dir.string());
  }
  std::lock_guard<std::mutex> lk(m_);
  scripts_.push_back(script);
  parsers_[feed_key] = [script](const std::string& content,
                                const std::string& url) {
    return script->Parse(content, url);
  };
}

PageParser FeedRefresher::ParserFor(const std::string& feed_key) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = parsers_.find(feed_key);
  if (it == parsers_.end()) {
    throw ConfigError("no parser for feed " + feed_key);
  }
  return it->second;
}

nlohmann::json FeedRefresher::FetchAndParse(const Feed& feed) {
  const PageParser parse = ParserFor(feed.key);
  logr::info << "[FeedRefresher] fetching " << feed.key << " from "
             << feed.path;
  const std::string content = client_.FetchPage(feed.path);
  return parse(content, feed.path);
}

CacheEntry FeedRefresher::Get(const Feed& feed) {
  PayloadValidator validate;
  if (!feed.require.empty())
    validate = RequireNonEmpty(feed.require);
  return cache_.GetOrRefresh(
    feed.key, feed.ttl, [&] { return FetchAndParse(feed); }, validate);
}

CacheEntry FeedRefresher::Refresh(const Feed& feed) {
  return cache_.Refresh(feed.key, [&] { return FetchAndParse(feed); });
}

size_t FeedRefresher::Schedule(const Feed& feed,
                               CalendarScheduler& scheduler,
                               const std::string& zone) {
  size_t added = 0;
  if (feed.daily) {
    DailyJob job;
    job.id = feed.key + ":daily";
    job.zone = zone;
    job.not_before_hour = feed.daily->after_hour;
    job.policy = feed.daily->policy;
    // a still-fresh entry satisfies the daily run
    job.action = [this, feed] { Get(feed); };
    scheduler.RegisterDaily(std::move(job));
    ++added;
  }
  if (feed.midnight) {
    MidnightJob job;
    job.id = feed.key + ":midnight";
    job.zone = zone;
    job.action = [this, feed] { Refresh(feed); };
    scheduler.RegisterMidnight(std::move(job));
    ++added;
  }
  if (added == 0) {
    logr::debug << "[FeedRefresher] " << feed.key << " has no schedule";
  }
  return added;
}
