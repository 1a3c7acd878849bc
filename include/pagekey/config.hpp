#pragma once

#include <pagekey/options.hpp>

#include <string>
#include <vector>

namespace pagekey {

/**
 * Tool configuration.
 *
 * Config file format (YAML-like, one level of sections):
 *
 *   data_dir: /var/lib/wiki/pages
 *   store: file            # file | rocksdb
 *   log_level: info        # debug | info | warn | error
 *   queue:
 *     capacity: 10
 *   migrations:
 *     convert_yaml_frontmatter: true
 *     munge_identifier_field: false
 *     munge_inventory_container: false
 *   storage:
 *     deleted_area_name: __deleted__
 *     block_cache_bytes: 67108864
 *     bloom_bits_per_key: 10
 *     lock_timeout_ms: 2000
 *     max_retries: 16
 */
struct Config {
  std::string data_dir;
  std::string store_backend = "file";
  std::string log_level = "info";
  Options options;

  // Non-flag command-line arguments, in order (subcommand first)
  std::vector<std::string> positional;
  bool show_help = false;

  /**
   * Load configuration from a config file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments. Values given on the
   * command line override those of a `--config` file.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

/** Usage text for the command-line tool. */
std::string UsageText(const std::string& argv0);

/** Set trantor's global log level from `config.log_level`. */
void ApplyLogLevel(const Config& config);

}  // namespace pagekey
