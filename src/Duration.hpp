#pragma once

#include <chrono>
#include <optional>
#include <string>

/// Parses "30", "10s", "10sec", "5m", "5min", "2h", "2hours", ...
/// Returns std::nullopt when the text is not a duration.
std::optional<std::chrono::seconds> ParseDuration(const std::string& text);

/// "90s", or "NONE" for a zero duration
std::string FormatDuration(std::chrono::seconds d);

/// Human "N minutes ago" style age, for display only
std::string DescribeAge(std::chrono::seconds age);
