#include "pointer_cache/config.hpp"
#include "pointer_cache/policy.hpp"

#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace pointer_cache {
namespace {
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out, bool &malformed) {
  std::regex present("\"" + key + "\"\\s*:");
  if (!std::regex_search(text, present))
    return false;
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)\\s*[,}]");
  std::smatch m;
  if (!std::regex_search(text, m, re)) {
    malformed = true;
    return false;
  }
  try {
    out = std::stoll(m[1].str());
  } catch (const std::out_of_range &) {
    malformed = true;
    return false;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}
} // namespace

bool validate_config(const CacheConfig &cfg, std::string *err) {
  if (cfg.memory_limit_bytes == 0) {
    set_err(err, "invalid config: memory_limit_bytes is required");
    return false;
  }
  if (cfg.cleanup_interval.count() < 0) {
    set_err(err, "invalid config: cleanup_interval must not be negative");
    return false;
  }
  if (cfg.cleanup_interval.count() > kMaxDurationMs) {
    set_err(err, "invalid config: cleanup_interval out of range");
    return false;
  }
  if (!make_policy_by_name(cfg.eviction_policy)) {
    set_err(err, "unsupported eviction policy: " + cfg.eviction_policy);
    return false;
  }
  return true;
}

bool parse_config_json(const std::string &text, CacheConfig &out,
                       std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    set_err(err, "invalid config: expected a JSON object");
    return false;
  }

  CacheConfig cfg = out;
  std::int64_t v = 0;
  bool malformed = false;
  auto non_negative = [&](const char *key) {
    if (v < 0) {
      set_err(err, std::string("invalid config: ") + key +
                       " must not be negative");
      return false;
    }
    return true;
  };
  auto in_range = [&](const char *key) {
    if (v > kMaxDurationMs || v < -kMaxDurationMs) {
      set_err(err, std::string("invalid config: ") + key + " out of range");
      return false;
    }
    return true;
  };

  if (extract_i64(text, "memory_limit_bytes", v, malformed)) {
    if (!non_negative("memory_limit_bytes"))
      return false;
    cfg.memory_limit_bytes = static_cast<std::size_t>(v);
  }
  if (extract_i64(text, "capacity", v, malformed)) {
    if (!non_negative("capacity"))
      return false;
    cfg.capacity = static_cast<std::size_t>(v);
  }
  if (extract_i64(text, "cleanup_interval_ms", v, malformed)) {
    if (!non_negative("cleanup_interval_ms") ||
        !in_range("cleanup_interval_ms"))
      return false;
    cfg.cleanup_interval = std::chrono::milliseconds(v);
  }
  if (extract_i64(text, "default_expiration_ms", v, malformed)) {
    if (!in_range("default_expiration_ms"))
      return false;
    cfg.default_expiration = std::chrono::milliseconds(v);
  }
  if (malformed) {
    set_err(err, "invalid config: numeric field is malformed");
    return false;
  }
  std::string s;
  if (extract_string(text, "eviction_policy", s))
    cfg.eviction_policy = s;

  out = cfg;
  return true;
}

bool load_config_file(const std::string &path, CacheConfig &out,
                      std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    set_err(err, "invalid config: cannot open " + path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config_json(ss.str(), out, err);
}

std::string describe_config(const CacheConfig &cfg) {
  std::ostringstream os;
  os << "memory_limit_bytes:" << cfg.memory_limit_bytes << "\n";
  os << "capacity:" << cfg.capacity << "\n";
  os << "cleanup_interval_ms:" << cfg.cleanup_interval.count() << "\n";
  os << "default_expiration_ms:"
     << std::chrono::duration_cast<std::chrono::milliseconds>(
            cfg.default_expiration)
            .count()
     << "\n";
  os << "eviction_policy:"
     << (cfg.eviction_policy.empty() ? "fifo" : cfg.eviction_policy) << "\n";
  return os.str();
}

} // namespace pointer_cache
