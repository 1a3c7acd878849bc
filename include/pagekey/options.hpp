#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pagekey {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., jobs enqueued, migrations applied). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., job latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., queue depth).
   *  Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/**
 * Options shared by the pagekey components.
 *
 * The defaults reproduce the stock behavior: the migration pipeline runs the
 * dotted-key merge followed by table spacing, and every job queue holds at most
 * ten pending jobs.
 */
struct Options {
  // ---------------------------------------------------------------------------
  // Job queues
  // ---------------------------------------------------------------------------

  // Pending jobs a single named queue accepts before EnqueueJob returns Busy.
  size_t queue_capacity = 10;

  // ---------------------------------------------------------------------------
  // Rolling migrations
  // ---------------------------------------------------------------------------

  // Convert YAML frontmatter to TOML before any TOML migration runs.
  bool convert_yaml_frontmatter = false;

  // Rewrite a non-canonical `identifier` field in TOML frontmatter.
  bool munge_identifier_field = false;

  // Rewrite a non-canonical `inventory.container` field in TOML frontmatter.
  bool munge_inventory_container = false;

  // ---------------------------------------------------------------------------
  // Storage
  // ---------------------------------------------------------------------------

  // Directory (file store) or key prefix root (RocksDB store) that receives
  // soft-deleted pages.
  std::string deleted_area_name = "__deleted__";

  // RocksDB page store tuning
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;
  int lock_timeout_ms = 2000;
  int max_retries = 16;

  // Observability hooks (optional)
  std::shared_ptr<MetricsSink> metrics;
};

}  // namespace pagekey
