#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "KeyValueStore.hpp"

/// Durable KeyValueStore: one JSON document per key under `dir`, named by
/// the SHA-256 of the key. Writes go to a temp file and are renamed into
/// place, so a reader never sees a half-written entry.
class FileStore : public KeyValueStore {
 public:
  explicit FileStore(const std::filesystem::path& dir);
  FileStore(const FileStore&) = delete;

  void Upsert(const CacheEntry& entry) override;

  /// A missing document is std::nullopt; so is an unreadable one (logged)
  std::optional<CacheEntry> Get(const std::string& key) const override;

  std::filesystem::path PathFor(const std::string& key) const;

  static std::string Sha256Hex(const std::string& data);

 private:
  std::filesystem::path dir_;
  mutable std::mutex m_;
};
