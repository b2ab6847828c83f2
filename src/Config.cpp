#include "Config.hpp"
#include "Duration.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <cstdlib>  // for std::getenv
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace {

std::chrono::seconds duration_value(const json& j, const std::string& name) {
  if (j.is_number_unsigned() || j.is_number_integer()) {
    const long long n = j.get<long long>();
    if (n < 0)
      throw ConfigError(name + ": negative duration");
    return std::chrono::seconds{n};
  }
  if (j.is_string()) {
    if (auto d = ParseDuration(j.get<std::string>()))
      return *d;
  }
  throw ConfigError(name + ": not a duration: " + j.dump());
}

std::string string_value(const json& j, const std::string& key,
                         const std::string& fallback) {
  if (!j.contains(key) || j.at(key).is_null())
    return fallback;
  if (!j.at(key).is_string())
    throw ConfigError(key + ": expected a string");
  return j.at(key).get<std::string>();
}

FailurePolicy policy_value(const std::string& s, const std::string& name) {
  if (s.empty() || s == "fire_once")
    return FailurePolicy::FireOnce;
  if (s == "retry_until_success")
    return FailurePolicy::RetryUntilSuccess;
  throw ConfigError(name + ": unknown policy '" + s + "'");
}

Feed feed_value(const json& j) {
  if (!j.is_object())
    throw ConfigError("feeds: each entry must be an object");

  Feed feed;
  feed.key = string_value(j, "key", "");
  feed.path = string_value(j, "path", "");
  if (feed.key.empty() || feed.path.empty())
    throw ConfigError("feeds: key and path are required");

  const std::string name = "feeds." + feed.key;
  if (j.contains("ttl") && !j.at("ttl").is_null()) {
    const auto& ttl = j.at("ttl");
    if (!(ttl.is_string() && ttl.get<std::string>() == "none"))
      feed.ttl = duration_value(ttl, name + ".ttl");
  }
  feed.require = string_value(j, "require", "");

  if (j.contains("daily") && !j.at("daily").is_null()) {
    const auto& d = j.at("daily");
    if (!d.is_object())
      throw ConfigError(name + ".daily: expected an object");
    DailySchedule daily;
    if (d.contains("after_hour")) {
      if (!d.at("after_hour").is_number_integer())
        throw ConfigError(name + ".daily.after_hour: expected an integer");
      daily.after_hour = d.at("after_hour").get<int>();
    }
    if (daily.after_hour < 0 || daily.after_hour > 23)
      throw ConfigError(name + ".daily.after_hour: out of range");
    daily.policy =
      policy_value(string_value(d, "policy", ""), name + ".daily.policy");
    feed.daily = daily;
  }
  if (j.contains("midnight")) {
    if (!j.at("midnight").is_boolean())
      throw ConfigError(name + ".midnight: expected true or false");
    feed.midnight = j.at("midnight").get<bool>();
  }
  return feed;
}

}  // namespace

Config::Config()
    : Config([&]() {
        // 1) Build the list of candidate files
        std::vector<std::filesystem::path> files;
        if (const char* c = std::getenv("RPGCRAWLER_CONFIG")) {
          if (*c)
            return std::filesystem::path{c};
        }
        if (const char* h = std::getenv("HOME")) {
          files.push_back(std::filesystem::path{h} / ".config" /
                          "rpgcrawler" / "conf.json");
        }
        files.push_back(std::filesystem::current_path() / "rpgcrawler" /
                        "conf.json");
        files.push_back(std::filesystem::path{"/etc"} / "rpgcrawler" /
                        "conf.json");

        // 2) Take the first one that exists
        for (auto const& file : files) {
          if (std::filesystem::exists(file))
            return file;
        }

        return std::filesystem::path{};
      }()) {
}

Config::Config(const std::filesystem::path& config_file)
    : config_file_{config_file} {
  if (config_file_.empty() || !std::filesystem::exists(config_file_)) {
    throw ConfigError("rpgcrawler conf.json not found");
  }

  std::ifstream in{config_file_};
  if (!in.is_open()) {
    throw ConfigError("Failed to open " + config_file_.string());
  }

  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    throw ConfigError("Error parsing " + config_file_.string());
  }
  Load(j);

  // relative directories are relative to the config file
  const auto base = config_file_.parent_path();
  if (!store_dir_.empty() && store_dir_.is_relative())
    store_dir_ = base / store_dir_;
  if (!scripts_dir_.empty() && scripts_dir_.is_relative())
    scripts_dir_ = base / scripts_dir_;

  logr::debug << "[Config] loaded " << config_file_;
}

Config::Config(const json& j) {
  Load(j);
}

void Config::Load(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("config: expected a JSON object");
  }

  session_.base_url = string_value(j, "base_url", session_.base_url);
  session_.login_path = string_value(j, "login_path", session_.login_path);
  session_.login_marker =
    string_value(j, "login_marker", session_.login_marker);
  session_.user_field =
    string_value(j, "login_user_field", session_.user_field);
  session_.pass_field =
    string_value(j, "login_pass_field", session_.pass_field);
  if (j.contains("session_window"))
    session_.revalidate_window =
      duration_value(j.at("session_window"), "session_window");

  user_agent_ = string_value(j, "user_agent", user_agent_);
  if (j.contains("timeout_ms")) {
    const auto& t = j.at("timeout_ms");
    if (!t.is_number_integer() || t.get<long long>() <= 0)
      throw ConfigError("timeout_ms: expected a positive integer");
    timeout_ = std::chrono::milliseconds{t.get<long long>()};
  }

  store_dir_ = string_value(j, "store_dir", "");
  scripts_dir_ = string_value(j, "scripts_dir", "");
  time_zone_ = string_value(j, "time_zone", time_zone_);
  if (j.contains("tick_interval")) {
    tick_interval_ = duration_value(j.at("tick_interval"), "tick_interval");
    if (tick_interval_.count() <= 0)
      throw ConfigError("tick_interval: must be positive");
  }
  username_var_ = string_value(j, "username_env", username_var_);
  password_var_ = string_value(j, "password_env", password_var_);
  metrics_listen_ = string_value(j, "metrics_listen", "");

  if (!j.contains("feeds") || !j.at("feeds").is_array()) {
    throw ConfigError("config: feeds must be an array");
  }
  feeds_.clear();
  std::set<std::string> seen;
  for (const auto& f : j.at("feeds")) {
    Feed feed = feed_value(f);
    if (!seen.insert(feed.key).second)
      throw ConfigError("feeds: duplicate key " + feed.key);
    feeds_.push_back(std::move(feed));
  }
}

SessionOptions Config::GetSessionOptions() const {
  return session_;
}

const std::string& Config::GetUserAgent() const {
  return user_agent_;
}

std::chrono::milliseconds Config::GetTimeout() const {
  return timeout_;
}

const std::filesystem::path& Config::GetStoreDir() const {
  return store_dir_;
}

const std::filesystem::path& Config::GetScriptsDir() const {
  return scripts_dir_;
}

const std::string& Config::GetTimeZone() const {
  return time_zone_;
}

std::chrono::seconds Config::GetTickInterval() const {
  return tick_interval_;
}

const std::string& Config::GetUsernameVar() const {
  return username_var_;
}

const std::string& Config::GetPasswordVar() const {
  return password_var_;
}

const std::string& Config::GetMetricsListen() const {
  return metrics_listen_;
}

const std::vector<Feed>& Config::GetFeeds() const {
  return feeds_;
}

const Feed& Config::GetFeed(const std::string& key) const {
  for (const auto& feed : feeds_) {
    if (feed.key == key)
      return feed;
  }
  throw ConfigError("unknown feed: " + key);
}
