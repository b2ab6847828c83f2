#include "FreshnessCache.hpp"
#include "Logger.hpp"

CacheEntry FreshnessCache::GetOrRefresh(const std::string& key, Ttl ttl,
                                        const RefreshFn& refresh,
                                        const PayloadValidator& validate) {
  auto entry = store_.Get(key);
  if (!IsStale(entry, ttl, validate)) {
    logr::debug << "[FreshnessCache] hit: " << key;
    return *entry;
  }

  logr::debug << "[FreshnessCache] " << (entry ? "stale" : "miss") << ": "
              << key;
  nlohmann::json payload = refresh();
  return Store(key, std::move(payload), entry);
}

CacheEntry FreshnessCache::Refresh(const std::string& key,
                                   const RefreshFn& refresh) {
  auto previous = store_.Get(key);
  nlohmann::json payload = refresh();
  return Store(key, std::move(payload), previous);
}

bool FreshnessCache::IsStale(const std::string& key, Ttl ttl,
                             const PayloadValidator& validate) const {
  return IsStale(store_.Get(key), ttl, validate);
}

bool FreshnessCache::IsStale(const std::optional<CacheEntry>& entry, Ttl ttl,
                             const PayloadValidator& validate) const {
  if (!entry)
    return true;
  if (ttl && clock_.Now() - entry->updated_at > *ttl)
    return true;
  if (validate && !validate(entry->payload))
    return true;
  return false;
}

std::optional<CacheEntry> FreshnessCache::Peek(const std::string& key) const {
  return store_.Get(key);
}

CacheEntry FreshnessCache::Store(const std::string& key,
                                 nlohmann::json payload,
                                 const std::optional<CacheEntry>& previous) {
  // stores keep whole milliseconds, so compare at that resolution
  CacheEntry fresh{key, std::move(payload),
                   std::chrono::time_point_cast<std::chrono::milliseconds>(
                     clock_.Now())};

  // updated_at must move forward on every overwrite
  if (previous && fresh.updated_at <= previous->updated_at) {
    logr::warning << "[FreshnessCache] clock did not advance for " << key
                  << "; bumping timestamp";
    fresh.updated_at = previous->updated_at + std::chrono::milliseconds{1};
  }

  store_.Upsert(fresh);
  logr::info << "[FreshnessCache] refreshed " << key;
  return fresh;
}

PayloadValidator RequireNonEmpty(const std::string& field) {
  return [field](const nlohmann::json& payload) {
    if (!payload.is_object())
      return false;
    auto it = payload.find(field);
    if (it == payload.end() || it->is_null())
      return false;
    if (it->is_array() || it->is_object() || it->is_string())
      return !it->empty();
    return true;
  };
}
