#pragma once

#include <optional>
#include <string>

struct Credentials {
  std::string username;
  std::string password;

  /// Both variables set and non-empty, or std::nullopt
  static std::optional<Credentials> FromEnvironment(
    const std::string& username_var = "RPG_USERNAME",
    const std::string& password_var = "RPG_PASSWORD");

  /// Like FromEnvironment() but throws ConfigError("credentials not
  /// configured") naming `label` (the command or job that needed them)
  static Credentials Require(const std::string& label,
                             const std::string& username_var = "RPG_USERNAME",
                             const std::string& password_var = "RPG_PASSWORD");
};
