#include "Metrics.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>

MetricTags NormalizeTags(const MetricTags& tags) {
  MetricTags out;
  for (const auto& [k, v] : tags) {
    if (!k.empty() && !v.empty())
      out.emplace(k, v);
  }
  return out;
}

std::string SeriesKey(const std::string& name, const MetricTags& tags) {
  std::string key = name + "{";
  bool first = true;
  for (const auto& [k, v] : NormalizeTags(tags)) {
    if (!first)
      key += ",";
    key += k + "=" + v;
    first = false;
  }
  return key + "}";
}

void MemoryMetrics::Increment(const std::string& name, const MetricTags& tags,
                              double count) {
  if (name.empty())
    return;
  std::lock_guard<std::mutex> lk(m_);
  counts_[SeriesKey(name, tags)] += count;
}

double MemoryMetrics::Get(const std::string& name,
                          const MetricTags& tags) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = counts_.find(SeriesKey(name, tags));
  return it == counts_.end() ? 0 : it->second;
}

std::map<std::string, double> MemoryMetrics::Snapshot() const {
  std::lock_guard<std::mutex> lk(m_);
  return counts_;
}

PrometheusMetrics::PrometheusMetrics()
    : registry_{std::make_shared<prometheus::Registry>()} {
}

void PrometheusMetrics::Expose(const std::string& bind_address) {
  exposer_ = std::make_unique<prometheus::Exposer>(bind_address);
  exposer_->RegisterCollectable(registry_);
  logr::info << "[Metrics] serving http://" << bind_address << "/metrics";
}

std::string PrometheusMetrics::ExportName(const std::string& name) {
  std::string out = name;
  std::replace_if(
    out.begin(), out.end(),
    [](unsigned char c) { return !std::isalnum(c) && c != '_'; }, '_');
  return out + "_total";
}

void PrometheusMetrics::Increment(const std::string& name,
                                  const MetricTags& tags, double count) {
  if (name.empty())
    return;
  std::lock_guard<std::mutex> lk(m_);
  auto it = families_.find(name);
  if (it == families_.end()) {
    auto& family = prometheus::BuildCounter()
                     .Name(ExportName(name))
                     .Help("rpgcrawler " + name + " count")
                     .Register(*registry_);
    it = families_.emplace(name, &family).first;
  }
  it->second->Add(NormalizeTags(tags)).Increment(count);
}
