#include "FileStore.hpp"
#include "Logger.hpp"

#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

FileStore::FileStore(const std::filesystem::path& dir) : dir_{dir} {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec || !std::filesystem::is_directory(dir_)) {
    throw std::runtime_error("FileStore: cannot use directory " +
                             dir_.string() + ": " + ec.message());
  }
}

std::string FileStore::Sha256Hex(const std::string& data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash);
  std::ostringstream oss;
  for (auto byte : hash) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(byte);
  }
  return oss.str();
}

std::filesystem::path FileStore::PathFor(const std::string& key) const {
  return dir_ / (Sha256Hex(key) + ".json");
}

void FileStore::Upsert(const CacheEntry& entry) {
  nlohmann::json doc = {{"key", entry.key},
                        {"payload", entry.payload},
                        {"updated_at_ms", ToEpochMillis(entry.updated_at)}};
  // scraped text is not guaranteed to be valid UTF-8
  const std::string dumped =
    doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lk(m_);
  const std::filesystem::path filename = PathFor(entry.key);
  std::filesystem::path tmp = filename;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(dumped.data(), static_cast<std::streamsize>(dumped.size()));
    out.put('\n');
    out.flush();
    if (!out) {
      throw std::runtime_error("FileStore: failed to write " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, filename, ec);
  if (ec) {
    throw std::runtime_error("FileStore: failed to replace " +
                             filename.string() + ": " + ec.message());
  }
  logr::debug << "[FileStore] stored " << entry.key << " -> "
              << filename.filename();
}

std::optional<CacheEntry> FileStore::Get(const std::string& key) const {
  std::lock_guard<std::mutex> lk(m_);
  const std::filesystem::path p = PathFor(key);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec))
    return std::nullopt;

  std::ifstream in(p, std::ios::binary);
  if (!in) {
    logr::warning << "[FileStore] cannot open " << p;
    return std::nullopt;
  }

  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object() ||
      !doc.contains("updated_at_ms") ||
      !doc["updated_at_ms"].is_number_integer()) {
    logr::warning << "[FileStore] unreadable entry for " << key << " in "
                  << p;
    return std::nullopt;
  }
  if (doc.value("key", std::string{}) != key) {
    logr::warning << "[FileStore] key mismatch in " << p;
    return std::nullopt;
  }

  CacheEntry entry;
  entry.key = key;
  entry.payload = doc.contains("payload") ? doc["payload"] : nlohmann::json{};
  entry.updated_at = FromEpochMillis(doc["updated_at_ms"].get<std::int64_t>());
  return entry;
}
