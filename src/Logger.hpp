#pragma once

#include <cctype>
#include <chrono>
#include <cstdio>  // for fileno()
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <unistd.h>  // for isatty()

namespace logr {

enum class Level { Debug = 0, Info, Warning, Error, None };

enum class Format { Text, Json };

inline Level ParseLevel(const std::string& s, Level fallback) {
  if (s == "debug")
    return Level::Debug;
  if (s == "info")
    return Level::Info;
  if (s == "warning" || s == "warn")
    return Level::Warning;
  if (s == "error")
    return Level::Error;
  return fallback;
}

inline Level CurrentLevel() {
  static Level lvl = [] {
    Level base = Level::Info;
    if (auto* home = std::getenv("HOME")) {
      std::ifstream in{std::string(home) + "/.logging.json"};
      if (in) {
        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded()) {
          std::cerr << "[logr] ignoring malformed ~/.logging.json" << std::endl;
        } else if (auto it = j.find("level");
                   it != j.end() && it->is_string()) {
          base = ParseLevel(it->get<std::string>(), base);
        }
      }
    }
    if (auto* dbg = std::getenv("DEBUG")) {
      std::string d{dbg};
      if (d == "1")
        base = Level::Debug;
      else if (d == "2")
        base = Level::Info;
      else if (d == "3")
        base = Level::Warning;
      else if (!d.empty())
        base = Level::Error;
    }
    if (auto* env = std::getenv("LOG_LEVEL")) {
      std::string s{env};
      for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      base = ParseLevel(s, base);
    }
    return base;
  }();
  return lvl;
}

inline Format CurrentFormat() {
  static Format fmt = [] {
    auto* env = std::getenv("LOG_FORMAT");
    return (env && std::string(env) == "json") ? Format::Json : Format::Text;
  }();
  return fmt;
}

// returns true if a message at level `msg` should be suppressed
inline bool ShouldMute(Level msg) {
  if (msg == Level::None)
    return true;
  return static_cast<int>(msg) < static_cast<int>(CurrentLevel());
}

inline bool is_tty() {
  return ::isatty(::fileno(stderr)) != 0;
}

// ANSI escape sequences
static constexpr char const* RESET = "\033[0m";
static constexpr char const* CYAN = "\033[36m";
static constexpr char const* GREEN = "\033[32m";
static constexpr char const* YELLOW = "\033[33m";
static constexpr char const* RED = "\033[31m";

inline constexpr char const* colorCode(Level L) {
  switch (L) {
    case Level::Debug:
      return CYAN;
    case Level::Info:
      return GREEN;
    case Level::Warning:
      return YELLOW;
    case Level::Error:
      return RED;
    default:
      return RESET;
  }
}

inline constexpr char const* levelName(Level L) {
  switch (L) {
    case Level::Debug:
      return "debug";
    case Level::Info:
      return "info";
    case Level::Warning:
      return "warning";
    case Level::Error:
      return "error";
    default:
      return "none";
  }
}

// ISO-8601 UTC with milliseconds, e.g. 2026-01-04T03:00:00.000Z
inline std::string Timestamp() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf,
                static_cast<int>(ms.count()));
  return out;
}

// Collects one message and writes it as a single line when destroyed.
class LogEntry {
 public:
  explicit LogEntry(Level L) : lvl(L), muted(ShouldMute(L)) {
  }

  ~LogEntry() {
    if (muted)
      return;
    std::lock_guard<std::mutex> lock(log_mutex());
    if (CurrentFormat() == Format::Json) {
      nlohmann::json line_j = {{"ts", Timestamp()},
                               {"level", levelName(lvl)},
                               {"message", buf.str()}};
      std::cerr << line_j.dump(-1, ' ', false,
                              nlohmann::json::error_handler_t::replace)
                << std::endl;
      return;
    }
    const bool tty = is_tty();
    if (tty)
      std::cerr << colorCode(lvl);
    std::cerr << '[' << Timestamp() << "] " << buf.str();
    if (tty)
      std::cerr << RESET;
    std::cerr << std::endl;
  }

  LogEntry(LogEntry&& other) noexcept
      : lvl(other.lvl), muted(other.muted), buf(std::move(other.buf)) {
    other.muted = true;
  }
  LogEntry& operator=(LogEntry&&) = delete;

  LogEntry(const LogEntry&) = delete;
  LogEntry& operator=(const LogEntry&) = delete;

  template <typename T>
  LogEntry& operator<<(T const& v) {
    if (!muted) {
      buf << v;
    }
    return *this;
  }

  LogEntry& operator<<(std::ostream& (*m)(std::ostream&)) {
    if (!muted) {
      m(buf);
    }
    return *this;
  }

 private:
  Level lvl;
  bool muted;
  std::ostringstream buf;

  // one mutex for all entries, to prevent interleaving
  static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
  }
};

struct Logger {
  Level lvl;
  constexpr Logger(Level L) : lvl(L) {
  }

  // the first << on a Logger starts a LogEntry
  template <typename T>
  LogEntry operator<<(T const& v) const {
    LogEntry e(lvl);
    e << v;
    return e;
  }

  LogEntry operator<<(std::ostream& (*m)(std::ostream&)) const {
    LogEntry e(lvl);
    e << m;
    return e;
  }
};

inline constexpr Logger debug{Level::Debug};
inline constexpr Logger info{Level::Info};
inline constexpr Logger warning{Level::Warning};
inline constexpr Logger error{Level::Error};
}  // namespace logr

// Guard whole blocks:
//   IF_DEBUG {
//     logr::debug << "expensive: " << expensive_function();
//   }

#define IF_DEBUG if (logr::CurrentLevel() <= logr::Level::Debug)
#define IF_INFO if (logr::CurrentLevel() <= logr::Level::Info)
#define IF_WARNING if (logr::CurrentLevel() <= logr::Level::Warning)
#define IF_ERROR if (logr::CurrentLevel() <= logr::Level::Error)
