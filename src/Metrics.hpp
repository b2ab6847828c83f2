#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>

/// Tags of one counter series, ordered by name
using MetricTags = std::map<std::string, std::string>;

/// Drops tags whose value is empty
MetricTags NormalizeTags(const MetricTags& tags);

/// "rpg.fetch{method=GET,status=ok}"
std::string SeriesKey(const std::string& name, const MetricTags& tags);

/// Counters keyed by name and tags. Fetches and scheduler runs are counted
/// as "ok" or "error".
class Metrics {
 public:
  virtual ~Metrics() = default;

  virtual void Increment(const std::string& name, const MetricTags& tags,
                         double count = 1) = 0;

  void IncrementExternalFetch(const std::string& source,
                              const std::string& status) {
    Increment("external.fetch", {{"source", source}, {"status", status}});
  }

  void IncrementSchedulerRun(const std::string& job,
                             const std::string& status) {
    Increment("scheduler.run", {{"name", job}, {"status", status}});
  }
};

/// Keeps counts in memory, e.g. for tests and one-shot runs
class MemoryMetrics : public Metrics {
 public:
  void Increment(const std::string& name, const MetricTags& tags,
                 double count = 1) override;

  double Get(const std::string& name, const MetricTags& tags) const;
  std::map<std::string, double> Snapshot() const;

 private:
  mutable std::mutex m_;
  std::map<std::string, double> counts_;
};

/// prometheus-cpp counters. "rpg.fetch" is exported as "rpg_fetch_total".
class PrometheusMetrics : public Metrics {
 public:
  PrometheusMetrics();

  /// Serves the registry at http://<bind_address>/metrics
  void Expose(const std::string& bind_address);

  void Increment(const std::string& name, const MetricTags& tags,
                 double count = 1) override;

  std::shared_ptr<prometheus::Registry> GetRegistry() const {
    return registry_;
  }

  static std::string ExportName(const std::string& name);

 private:
  std::mutex m_;
  std::shared_ptr<prometheus::Registry> registry_;
  std::unique_ptr<prometheus::Exposer> exposer_;
  std::unordered_map<std::string, prometheus::Family<prometheus::Counter>*>
    families_;
};
