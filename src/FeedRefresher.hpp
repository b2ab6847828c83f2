#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "CalendarScheduler.hpp"
#include "Feed.hpp"
#include "FreshnessCache.hpp"
#include "LuaParser.hpp"
#include "ScrapingClient.hpp"

/// Turns page content into a payload; `url` is the page the content came
/// from. Throws ParseError.
using PageParser =
  std::function<nlohmann::json(const std::string& content,
                               const std::string& url)>;

/// Fetch, parse and cache for a set of feeds
class FeedRefresher {
 public:
  FeedRefresher(ScrapingClient& client, FreshnessCache& cache);
  FeedRefresher(const FeedRefresher&) = delete;

  /// Uses `parser` for `feed_key` in place of a Lua script
  void SetParser(const std::string& feed_key, PageParser parser);

  /// Loads `<scripts_dir>/<feed_key>/init.lua`; throws ConfigError when
  /// the feed has no usable script
  void LoadScript(const std::filesystem::path& scripts_dir,
                  const std::string& feed_key);

  /// Cached payload when fresh, otherwise fetch + parse + store
  CacheEntry Get(const Feed& feed);

  /// Fetch + parse + store regardless of freshness
  CacheEntry Refresh(const Feed& feed);

  /// Registers the feed's daily and midnight jobs, named
  /// "<key>:daily" and "<key>:midnight"; returns how many were added
  size_t Schedule(const Feed& feed, CalendarScheduler& scheduler,
                  const std::string& zone);

 private:
  nlohmann::json FetchAndParse(const Feed& feed);
  PageParser ParserFor(const std::string& feed_key) const;

  ScrapingClient& client_;
  FreshnessCache& cache_;

  mutable std::mutex m_;
  std::map<std::string, PageParser> parsers_;
  std::vector<std::shared_ptr<LuaParser>> scripts_;
};
