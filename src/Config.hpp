#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "Feed.hpp"
#include "SessionManager.hpp"

class Config {
 public:
  static constexpr const char* kDefaultUserAgent =
    "Mozilla/5.0 (compatible; SpectreonBot/1.0; +https://www.tppcrpg.net/)";

  /// Searches $RPGCRAWLER_CONFIG, ~/.config/rpgcrawler, ./rpgcrawler and
  /// /etc/rpgcrawler for conf.json
  Config();
  explicit Config(const std::filesystem::path& conf_file);
  explicit Config(const nlohmann::json& j);

  Config(const Config& conf) = default;

  const std::filesystem::path& GetConfigFile() const {
    return config_file_;
  }

  SessionOptions GetSessionOptions() const;

  const std::string& GetUserAgent() const;

  std::chrono::milliseconds GetTimeout() const;

  /// Empty: keep entries in memory only
  const std::filesystem::path& GetStoreDir() const;

  const std::filesystem::path& GetScriptsDir() const;

  const std::string& GetTimeZone() const;

  std::chrono::seconds GetTickInterval() const;

  const std::string& GetUsernameVar() const;
  const std::string& GetPasswordVar() const;

  /// "host:port" for the Prometheus endpoint; empty when disabled
  const std::string& GetMetricsListen() const;

  const std::vector<Feed>& GetFeeds() const;

  /// Throws ConfigError for an unknown key
  const Feed& GetFeed(const std::string& key) const;

 private:
  void Load(const nlohmann::json& j);

  std::filesystem::path config_file_;
  SessionOptions session_;
  std::string user_agent_{kDefaultUserAgent};
  std::chrono::milliseconds timeout_{30000};
  std::filesystem::path store_dir_;
  std::filesystem::path scripts_dir_;
  std::string time_zone_{"America/New_York"};
  std::chrono::seconds tick_interval_{std::chrono::minutes{10}};
  std::string username_var_{"RPG_USERNAME"};
  std::string password_var_{"RPG_PASSWORD"};
  std::string metrics_listen_;
  std::vector<Feed> feeds_;
};
