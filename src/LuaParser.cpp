#include "LuaParser.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <cmath>

LuaParser::LuaParser(const std::filesystem::path& scripts_dir,
                     const std::string& feed)
    : scripts_dir_{scripts_dir}, feed_{feed} {
  InitLua();
  LoadScript();
}

void LuaParser::InitLua() {
  // only open what we need
  lua_.open_libraries(sol::lib::base, sol::lib::package, sol::lib::string,
                      sol::lib::table, sol::lib::math);
  const std::string common = (scripts_dir_ / "?.lua").string() + ";" +
                             (scripts_dir_ / "?" / "init.lua").string();
  lua_["package"]["path"] = common;
  IF_DEBUG {
    lua_["DEBUG"] = true;
  }
}

std::optional<std::filesystem::path> LuaParser::FindScript() const {
  std::filesystem::path entry = scripts_dir_ / feed_ / "init.lua";
  if (std::filesystem::exists(entry)) {
    return {entry};
  }
  logr::debug << "[LuaParser] No such file: " << feed_ << "/init.lua";
  return std::nullopt;
}

bool LuaParser::LoadScript() {
  auto init_script = FindScript();
  if (!init_script.has_value())
    return false;

  logr::debug << "[LuaParser] Loading " << *init_script;

  sol::environment env(lua_, sol::create, lua_.globals());
  auto loaded = lua_.safe_script_file(init_script->string(), env,
                                      sol::script_pass_on_error);
  if (!loaded.valid()) {
    sol::error err = loaded;
    logr::error << "[LuaParser] " << *init_script << ": " << err.what();
    return false;
  }

  sol::protected_function func = env["parse"];
  if (!func.valid()) {
    logr::warning << "[LuaParser] " << *init_script << " defines no parse()";
    return false;
  }

  env_ = std::move(env);
  func_ = std::move(func);
  return true;
}

bool LuaParser::HasScript() const {
  return func_.valid();
}

nlohmann::json LuaParser::Parse(const std::string& content,
                                const std::string& url) const {
  if (!HasScript()) {
    throw ParseError("no parser script for feed " + feed_);
  }

  std::lock_guard<std::mutex> lk(m_);
  sol::protected_function_result result = func_(content, url);

  if (!result.valid()) {
    sol::error err = result;
    logr::warning << "[LuaParser] " << feed_ << " error: " << err.what();
    throw ParseError("parser for " + feed_ + " failed: " + err.what());
  }

  if (result.return_count() < 1 || result.get_type() != sol::type::table) {
    logr::warning << "[LuaParser] " << feed_
                  << " parse() did not return a table";
    throw ParseError("parser for " + feed_ + " did not return a table");
  }

  nlohmann::json result_j = LuaTableToJson(sol::table{result});

  IF_DEBUG {
    logr::debug << "[LuaParser] " << feed_ << ": " << result_j.dump(2);
  }

  return result_j;
}

namespace {
bool is_array_like(const sol::table& tbl) {
  std::size_t i = 1;
  for (auto& pair : tbl) {
    if (!pair.first.is<int>() || pair.first.as<int>() != static_cast<int>(i)) {
      return false;
    }
    ++i;
  }
  return true;
}
}  // namespace

nlohmann::json LuaParser::LuaTableToJson(const sol::table& tbl) {
  if (is_array_like(tbl)) {
    // an empty table is an empty list, not null
    nlohmann::json arr_j = nlohmann::json::array();
    for (std::size_t i = 1; i <= tbl.size(); ++i) {
      arr_j.push_back(LuaTableToJson(sol::object(tbl[i])));
    }
    return arr_j;
  }

  nlohmann::json obj_j = nlohmann::json::object();
  for (auto& pair : tbl) {
    const sol::object& key = pair.first;
    const sol::object& val = pair.second;

    std::string key_s;
    if (key.is<std::string>()) {
      key_s = key.as<std::string>();
    } else if (key.is<int>()) {
      key_s = std::to_string(key.as<int>());
    } else {
      key_s = "<unsupported key>";
    }

    obj_j[key_s] = LuaTableToJson(val);
  }
  return obj_j;
}

nlohmann::json LuaParser::LuaTableToJson(const sol::object& obj) {
  switch (obj.get_type()) {
    case sol::type::lua_nil:
      return nullptr;
    case sol::type::boolean:
      return obj.as<bool>();
    case sol::type::number: {
      const double d = obj.as<double>();
      double whole;
      if (std::modf(d, &whole) == 0.0 && std::fabs(d) < 9.0e15)
        return static_cast<std::int64_t>(d);
      return d;
    }
    case sol::type::string:
      return obj.as<std::string>();
    case sol::type::table:
      return LuaTableToJson(obj.as<sol::table>());
    default:
      return "<unsupported value>";
  }
}
