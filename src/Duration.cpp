#include "Duration.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

std::optional<std::chrono::seconds> ParseDuration(const std::string& text) {
  std::string s = text;
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) {
            return !std::isspace(c);
          }));
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char c) { return !std::isspace(c); })
            .base(),
          s.end());
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  static const std::regex kPattern(
    R"(^(\d+)\s*(s|sec|secs|second|seconds|m|min|mins|minute|minutes|h|hr|hrs|hour|hours)?$)");
  std::smatch m;
  if (!std::regex_match(s, m, kPattern))
    return std::nullopt;

  long long v = 0;
  try {
    v = std::stoll(m[1].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }

  const std::string unit = m[2].matched ? m[2].str() : "s";
  long long per_unit = 1;
  switch (unit[0]) {
    case 's':
      break;
    case 'm':
      per_unit = 60;
      break;
    case 'h':
      per_unit = 3600;
      break;
    default:
      return std::nullopt;
  }
  // must fit in seconds
  if (v > std::chrono::seconds::max().count() / per_unit)
    return std::nullopt;
  return std::chrono::seconds{v * per_unit};
}

std::string FormatDuration(std::chrono::seconds d) {
  return d.count() ? std::to_string(d.count()) + "s" : "NONE";
}

std::string DescribeAge(std::chrono::seconds age) {
  const auto s = std::max<long long>(0, age.count());
  if (s < 60)
    return "just now";
  if (s < 3600) {
    const auto m = s / 60;
    return std::to_string(m) + (m == 1 ? " minute ago" : " minutes ago");
  }
  if (s < 86400) {
    const auto h = s / 3600;
    return std::to_string(h) + (h == 1 ? " hour ago" : " hours ago");
  }
  const auto d = s / 86400;
  return std::to_string(d) + (d == 1 ? " day ago" : " days ago");
}
