#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sol/sol.hpp>
#include <string>

/// Turns a scraped page into JSON rows by running the feed's Lua script,
/// `<scripts_dir>/<feed>/init.lua`, which must define
/// `parse(content, url) -> table`. Shared helpers under `<scripts_dir>` are
/// reachable with `require`, e.g. `require "common"`.
class LuaParser {
 public:
  LuaParser(const std::filesystem::path& scripts_dir, const std::string& feed);
  LuaParser(const LuaParser&) = delete;

  bool HasScript() const;

  /// Throws ParseError when there is no script, the script fails, or it
  /// does not return a table
  nlohmann::json Parse(const std::string& content,
                       const std::string& url) const;

  const std::string& GetFeed() const {
    return feed_;
  }

 private:
  void InitLua();
  std::optional<std::filesystem::path> FindScript() const;
  bool LoadScript();
  static nlohmann::json LuaTableToJson(const sol::table& tbl);
  static nlohmann::json LuaTableToJson(const sol::object& obj);

  std::filesystem::path scripts_dir_;
  std::string feed_;
  mutable std::mutex m_;  // a sol::state is not thread-safe
  sol::state lua_;
  sol::environment env_;
  sol::protected_function func_;
};
