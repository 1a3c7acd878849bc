#include <pagekey/config.hpp>

#include <pagekey/internal.hpp>
#include <pagekey/version.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <trantor/utils/Logger.h>

namespace pagekey {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  return std::string(internal::TrimView(s));
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
}

int ParseInt(const std::string& key, const std::string& value) {
  const uint64_t v = ParseUnsigned(key, value);
  if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
  return static_cast<int>(v);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

std::string RequireValue(int argc, char** argv, int* i, const std::string& flag,
                         const std::string& what) {
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string raw;
  int line_no = 0;

  while (std::getline(file, raw)) {
    ++line_no;
    const bool indented = !raw.empty() && (raw[0] == ' ' || raw[0] == '\t');
    std::string line = raw;
    const size_t hash = line.find(" #");
    if (hash != std::string::npos) line.erase(hash);
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected key: value");
    }

    const std::string key = Trim(line.substr(0, colon_pos));
    const std::string value = Unquote(Trim(line.substr(colon_pos + 1)));

    // A key without a value opens a section
    if (value.empty()) {
      current_section = key;
      continue;
    }
    if (!indented) current_section.clear();

    Options& opt = config.options;
    if (current_section.empty()) {
      if (key == "data_dir") {
        config.data_dir = value;
      } else if (key == "store") {
        config.store_backend = value;
      } else if (key == "log_level") {
        config.log_level = value;
      }
    } else if (current_section == "queue") {
      if (key == "capacity") {
        opt.queue_capacity = static_cast<size_t>(ParseUnsigned("queue.capacity", value));
      }
    } else if (current_section == "migrations") {
      if (key == "convert_yaml_frontmatter") {
        opt.convert_yaml_frontmatter = ParseBool(key, value);
      } else if (key == "munge_identifier_field") {
        opt.munge_identifier_field = ParseBool(key, value);
      } else if (key == "munge_inventory_container") {
        opt.munge_inventory_container = ParseBool(key, value);
      }
    } else if (current_section == "storage") {
      if (key == "deleted_area_name") {
        opt.deleted_area_name = value;
      } else if (key == "block_cache_bytes") {
        opt.block_cache_bytes = static_cast<size_t>(ParseUnsigned(key, value));
      } else if (key == "bloom_bits_per_key") {
        opt.bloom_bits_per_key = ParseInt(key, value);
      } else if (key == "lock_timeout_ms") {
        opt.lock_timeout_ms = ParseInt(key, value);
      } else if (key == "max_retries") {
        opt.max_retries = ParseInt(key, value);
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;
  std::string config_file;

  // Flags given explicitly, so a file can fill in the rest
  bool have_data_dir = false;
  bool have_store = false;
  bool have_log_level = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--config" || arg == "-c") {
      config_file = RequireValue(argc, argv, &i, arg, "a path argument");
    } else if (arg == "--data-dir") {
      config.data_dir = RequireValue(argc, argv, &i, arg, "a path");
      have_data_dir = true;
    } else if (arg == "--store") {
      config.store_backend = RequireValue(argc, argv, &i, arg, "file or rocksdb");
      have_store = true;
    } else if (arg == "--log-level") {
      config.log_level = RequireValue(argc, argv, &i, arg, "a level");
      have_log_level = true;
    } else if (arg == "--queue-capacity") {
      config.options.queue_capacity =
          static_cast<size_t>(ParseUnsigned(arg, RequireValue(argc, argv, &i, arg, "a number")));
    } else if (arg == "--convert-yaml") {
      config.options.convert_yaml_frontmatter = true;
    } else if (arg == "--munge-identifier") {
      config.options.munge_identifier_field = true;
    } else if (arg == "--munge-inventory") {
      config.options.munge_inventory_container = true;
    } else if (arg == "--") {
      for (++i; i < argc; ++i) config.positional.emplace_back(argv[i]);
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      config.positional.push_back(arg);
    }
  }

  // If a config file was specified, load it first then override with CLI args
  if (!config_file.empty()) {
    Config file_config = LoadFromFile(config_file);

    if (!have_data_dir) config.data_dir = file_config.data_dir;
    if (!have_store) config.store_backend = file_config.store_backend;
    if (!have_log_level) config.log_level = file_config.log_level;

    const Options cli = config.options;
    const Options defaults;
    config.options = file_config.options;
    if (cli.queue_capacity != defaults.queue_capacity) {
      config.options.queue_capacity = cli.queue_capacity;
    }
    config.options.convert_yaml_frontmatter |= cli.convert_yaml_frontmatter;
    config.options.munge_identifier_field |= cli.munge_identifier_field;
    config.options.munge_inventory_container |= cli.munge_inventory_container;
  }

  return config;
}

void Config::Validate() const {
  if (data_dir.empty()) {
    throw std::runtime_error("data_dir is required (use --data-dir or config file)");
  }

  if (store_backend != "file" && store_backend != "rocksdb") {
    throw std::runtime_error("Invalid store: " + store_backend + " (must be file or rocksdb)");
  }

  if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
      log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (options.queue_capacity == 0) {
    throw std::runtime_error("queue.capacity must be at least 1");
  }

  if (options.deleted_area_name.empty() ||
      options.deleted_area_name.find('/') != std::string::npos) {
    throw std::runtime_error("Invalid deleted_area_name: " + options.deleted_area_name);
  }

  if (options.max_retries <= 0) {
    throw std::runtime_error("max_retries must be positive");
  }
}

std::string UsageText(const std::string& argv0) {
  std::ostringstream out;
  out << "Usage: " << argv0 << " [options] <command> [args]\n"
      << "\nCommands:\n"
      << "  normalize <identifier>...  Print canonical identifiers\n"
      << "  migrate <file>             Print the migrated content of a file\n"
      << "  keys                       List storage keys and their identifiers\n"
      << "  read <identifier>          Read a page, migrating it in place\n"
      << "  sweep                      Reconcile legacy pages, archive .json sidecars\n"
      << "\nOptions:\n"
      << "  --config, -c <path>        Path to config file\n"
      << "  --data-dir <path>          Page directory or database path\n"
      << "  --store <file|rocksdb>     Page store backend (default: file)\n"
      << "  --log-level <level>        Log level: debug, info, warn, error\n"
      << "  --queue-capacity <n>       Pending jobs per queue (default: 10)\n"
      << "  --convert-yaml             Convert YAML frontmatter to TOML\n"
      << "  --munge-identifier         Canonicalize the identifier field\n"
      << "  --munge-inventory          Canonicalize inventory.container\n"
      << "  --help, -h                 Show this help\n"
      << "\nExamples:\n"
      << "  " << argv0 << " normalize MyPage 'lab wallbins L3'\n"
      << "  " << argv0 << " --data-dir /srv/wiki/pages sweep\n"
      << "  " << argv0 << " --config /etc/pagekey.yaml read lab_wallbins_l3\n"
      << "\npagekey " << Version() << "\n";
  return out.str();
}

void ApplyLogLevel(const Config& config) {
  if (config.log_level == "debug") {
    trantor::Logger::setLogLevel(trantor::Logger::kDebug);
  } else if (config.log_level == "warn") {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
  } else if (config.log_level == "error") {
    trantor::Logger::setLogLevel(trantor::Logger::kError);
  } else {
    trantor::Logger::setLogLevel(trantor::Logger::kInfo);
  }
}

}  // namespace pagekey
