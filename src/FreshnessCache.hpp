#pragma once

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "Clock.hpp"
#include "KeyValueStore.hpp"

/// Produces a new payload for a key; may throw, in which case the stored
/// entry is left untouched.
using RefreshFn = std::function<nlohmann::json()>;

/// False when a payload is present but structurally incomplete
using PayloadValidator = std::function<bool(const nlohmann::json&)>;

/// std::nullopt: no age limit, refresh only when absent or invalid
using Ttl = std::optional<std::chrono::seconds>;

/// Decides per key whether the stored payload can be served or must be
/// refreshed. Callers never judge freshness from updated_at themselves.
class FreshnessCache {
 public:
  FreshnessCache(KeyValueStore& store, const Clock& clock)
      : store_{store}, clock_{clock} {
  }
  FreshnessCache(const FreshnessCache&) = delete;

  /// Stored entry when fresh (no refresh, no write); otherwise refresh(),
  /// upsert with a newer timestamp, and return the new entry.
  CacheEntry GetOrRefresh(const std::string& key, Ttl ttl,
                          const RefreshFn& refresh,
                          const PayloadValidator& validate = {});

  /// Unconditional refresh and upsert
  CacheEntry Refresh(const std::string& key, const RefreshFn& refresh);

  bool IsStale(const std::string& key, Ttl ttl,
               const PayloadValidator& validate = {}) const;

  bool IsStale(const std::optional<CacheEntry>& entry, Ttl ttl,
               const PayloadValidator& validate = {}) const;

  /// Read-only view for display ("updated N minutes ago"); no freshness
  /// decision is made
  std::optional<CacheEntry> Peek(const std::string& key) const;

 private:
  CacheEntry Store(const std::string& key, nlohmann::json payload,
                   const std::optional<CacheEntry>& previous);

  KeyValueStore& store_;
  const Clock& clock_;
};

/// Validator requiring payload[field] to exist and be non-empty
PayloadValidator RequireNonEmpty(const std::string& field);
