#include "pointer_cache/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>

using namespace pointer_cache;

TEST_CASE("Config validation rules", "[config]") {
  CacheConfig cfg;
  std::string err;
  CHECK_FALSE(validate_config(cfg, &err));
  CHECK(err.find("memory_limit_bytes") != std::string::npos);

  cfg.memory_limit_bytes = 1024;
  CHECK(validate_config(cfg, &err));
  cfg.eviction_policy = "";
  CHECK(validate_config(cfg));
  cfg.eviction_policy = "lfu";
  CHECK_FALSE(validate_config(cfg, &err));
  CHECK(err == "unsupported eviction policy: lfu");
}

TEST_CASE("Config JSON overrides present keys only", "[config]") {
  CacheConfig cfg;
  cfg.capacity = 7;
  std::string err;
  REQUIRE(parse_config_json(
      R"({"memory_limit_bytes": 4096, "cleanup_interval_ms": 250,
          "default_expiration_ms": -1, "eviction_policy": "queue"})",
      cfg, &err));
  CHECK(cfg.memory_limit_bytes == 4096);
  CHECK(cfg.capacity == 7);
  CHECK(cfg.cleanup_interval == std::chrono::milliseconds(250));
  CHECK(cfg.default_expiration == std::chrono::milliseconds(-1));
  CHECK(cfg.eviction_policy == "queue");
}

TEST_CASE("Malformed config is rejected atomically", "[config]") {
  CacheConfig cfg;
  cfg.memory_limit_bytes = 100;
  std::string err;

  CHECK_FALSE(parse_config_json("not-json", cfg, &err));
  CHECK(err.find("JSON object") != std::string::npos);

  CHECK_FALSE(parse_config_json(
      R"({"memory_limit_bytes": 5000, "capacity": "many"})", cfg, &err));
  CHECK(err.find("malformed") != std::string::npos);
  CHECK(cfg.memory_limit_bytes == 100);

  CHECK_FALSE(parse_config_json(R"({"capacity": -3})", cfg, &err));
  CHECK(err.find("capacity") != std::string::npos);
  CHECK(cfg.capacity == 0);
}

TEST_CASE("Config files load from disk", "[config]") {
  const char *path = "pointer_cache_config_test.json";
  std::ofstream out(path);
  out << R"({"memory_limit_bytes":2048,"capacity":16,"eviction_policy":"fifo"})";
  out.close();

  CacheConfig cfg;
  std::string err;
  REQUIRE(load_config_file(path, cfg, &err));
  CHECK(cfg.memory_limit_bytes == 2048);
  CHECK(cfg.capacity == 16);

  CHECK_FALSE(load_config_file("does_not_exist.json", cfg, &err));
  CHECK(err.find("cannot open") != std::string::npos);

  const auto text = describe_config(cfg);
  CHECK(text.find("memory_limit_bytes:2048\n") != std::string::npos);
  CHECK(text.find("eviction_policy:fifo\n") != std::string::npos);
}

TEST_CASE("Durations beyond the clock range are rejected", "[config]") {
  CacheConfig cfg;
  cfg.memory_limit_bytes = 4096;
  std::string err;

  CHECK_FALSE(parse_config_json(
      R"({"memory_limit_bytes":4096,"default_expiration_ms":9223372036854775807})",
      cfg, &err));
  CHECK(err == "invalid config: default_expiration_ms out of range");
  CHECK(cfg.default_expiration == Duration::zero());

  CHECK_FALSE(parse_config_json(
      R"({"cleanup_interval_ms":9223372036854775807})", cfg, &err));
  CHECK(err == "invalid config: cleanup_interval_ms out of range");
  CHECK(cfg.cleanup_interval == std::chrono::milliseconds(0));

  REQUIRE(parse_config_json("{\"default_expiration_ms\":" +
                                std::to_string(kMaxDurationMs) + "}",
                            cfg, &err));
  CHECK(cfg.default_expiration > Duration::zero());

  cfg.cleanup_interval = std::chrono::milliseconds(kMaxDurationMs + 1);
  CHECK_FALSE(validate_config(cfg, &err));
  CHECK(err.find("out of range") != std::string::npos);
}
