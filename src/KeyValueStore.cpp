#include "KeyValueStore.hpp"

void MemoryStore::Upsert(const CacheEntry& entry) {
  std::lock_guard<std::mutex> lk(m_);
  entries_[entry.key] = entry;
}

std::optional<CacheEntry> MemoryStore::Get(const std::string& key) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

size_t MemoryStore::Size() const {
  std::lock_guard<std::mutex> lk(m_);
  return entries_.size();
}
