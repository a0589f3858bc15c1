#include "pointer_cache/cache.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_i64(const std::string &s, long long &out) {
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> out;
  std::string word;
  while (in >> word)
    out.push_back(word);
  return out;
}

pointer_cache::Duration ttl_arg(const std::vector<std::string> &cmd,
                                std::size_t idx, bool &ok) {
  ok = true;
  if (cmd.size() <= idx)
    return pointer_cache::kDefaultExpiration;
  long long ms = 0;
  if (!parse_i64(cmd[idx], ms) || ms > pointer_cache::kMaxDurationMs) {
    ok = false;
    return pointer_cache::kDefaultExpiration;
  }
  if (ms < 0)
    return pointer_cache::kNoExpiration;
  return std::chrono::milliseconds(ms);
}

void usage() {
  std::cerr << "usage: pointer_cache_cli [--config path] [--memory bytes] "
               "[--capacity n] [--policy name] [--cleanup-ms ms] "
               "[--default-ttl-ms ms]\n"
               "commands: SET k v [ttl_ms] | ADD k v [ttl_ms] | "
               "REPLACE k v [ttl_ms] | GET k | TTL k | DEL k | SWEEP | CLEAR "
               "| SIZE | INFO | QUIT\n";
}

} // namespace

int main(int argc, char **argv) {
  pointer_cache::CacheConfig cfg;
  cfg.memory_limit_bytes = 64 * 1024 * 1024;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    long long v = 0;
    if (a == "--config" && i + 1 < argc) {
      std::string err;
      if (!pointer_cache::load_config_file(argv[++i], cfg, &err)) {
        std::cerr << err << "\n";
        return 1;
      }
    } else if (a == "--policy" && i + 1 < argc) {
      cfg.eviction_policy = argv[++i];
    } else if ((a == "--memory" || a == "--capacity") && i + 1 < argc &&
               parse_i64(argv[i + 1], v) && v >= 0) {
      ++i;
      if (a == "--memory")
        cfg.memory_limit_bytes = static_cast<std::size_t>(v);
      else
        cfg.capacity = static_cast<std::size_t>(v);
    } else if ((a == "--cleanup-ms" || a == "--default-ttl-ms") &&
               i + 1 < argc && parse_i64(argv[i + 1], v) && v >= 0 &&
               v <= pointer_cache::kMaxDurationMs) {
      ++i;
      if (a == "--cleanup-ms")
        cfg.cleanup_interval = std::chrono::milliseconds(v);
      else
        cfg.default_expiration = std::chrono::milliseconds(v);
    } else {
      usage();
      return 1;
    }
  }

  std::string err;
  auto cache = pointer_cache::Cache::create(cfg, &err);
  if (!cache) {
    std::cerr << err << "\n";
    return 1;
  }
  cache->on_evicted([](const std::string &key, const std::any &) {
    std::cout << "(evicted " << key << ")\n";
  });
  std::cout << pointer_cache::describe_config(cache->config());

  std::string line;
  while (std::getline(std::cin, line)) {
    auto cmd = split(line);
    if (cmd.empty())
      continue;
    const std::string op = upper(cmd[0]);
    if (op == "QUIT")
      break;

    if ((op == "SET" || op == "ADD" || op == "REPLACE") && cmd.size() >= 3) {
      bool ok = true;
      const auto ttl = ttl_arg(cmd, 3, ok);
      if (!ok) {
        std::cerr << "ERR invalid ttl\n";
        continue;
      }
      bool done = false;
      err.clear();
      if (op == "SET")
        done = cache->set(cmd[1], cmd[2], ttl, &err);
      else if (op == "ADD")
        done = cache->add(cmd[1], cmd[2], ttl, &err);
      else
        done = cache->replace(cmd[1], cmd[2], ttl, &err);
      if (done)
        std::cout << "OK\n";
      else
        std::cerr << "ERR " << err << "\n";
    } else if (op == "GET" && cmd.size() == 2) {
      auto v = cache->get_as<std::string>(cmd[1]);
      std::cout << (v ? *v : "(nil)") << "\n";
    } else if (op == "TTL" && cmd.size() == 2) {
      auto v = cache->get_with_expiration(cmd[1]);
      if (!v)
        std::cout << "-2\n";
      else if (!v->expires_at)
        std::cout << "-1\n";
      else
        std::cout << std::chrono::duration_cast<std::chrono::milliseconds>(
                         *v->expires_at - pointer_cache::Clock::now())
                         .count()
                  << "\n";
    } else if (op == "DEL" && cmd.size() == 2) {
      std::cout << (cache->remove(cmd[1]) ? 1 : 0) << "\n";
    } else if (op == "SWEEP") {
      std::cout << cache->erase_expired() << "\n";
    } else if (op == "CLEAR") {
      cache->clear();
      std::cout << "OK\n";
    } else if (op == "SIZE") {
      std::cout << cache->size() << " " << cache->memory_used() << "\n";
    } else if (op == "INFO") {
      std::cout << cache->info();
    } else {
      std::cerr << "ERR unknown command\n";
    }
  }
  cache->close();
  return 0;
}
