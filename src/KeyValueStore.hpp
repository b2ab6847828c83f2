#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "Clock.hpp"

struct CacheEntry {
  std::string key;
  nlohmann::json payload;
  TimePoint updated_at;
};

/// Minimal persistence contract used by the freshness cache: one entry per
/// key, last write wins.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;
  virtual void Upsert(const CacheEntry& entry) = 0;
  virtual std::optional<CacheEntry> Get(const std::string& key) const = 0;
};

class MemoryStore : public KeyValueStore {
 public:
  void Upsert(const CacheEntry& entry) override;
  std::optional<CacheEntry> Get(const std::string& key) const override;

  size_t Size() const;

 private:
  mutable std::mutex m_;
  std::unordered_map<std::string, CacheEntry> entries_;
};
