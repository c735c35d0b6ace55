#include "HostConfig.hpp"

#include "TestHeaders.hpp"

using namespace dx;

TEST_CASE("Empty config keeps defaults", "[HostConfig]") {
  auto config = HostConfig::parse("");
  REQUIRE(config.buffer.maxBufferSize == 8 * 1024 * 1024);
  REQUIRE(config.buffer.flushIntervalMs == 16);
  REQUIRE(config.defaultCols == 80);
  REQUIRE(config.defaultRows == 24);
  REQUIRE(config.timings.promptDelayMs == 500);
  REQUIRE(config.timings.killGraceMs == 5000);
  REQUIRE(config.reconnect.maxAttempts == 5);
  REQUIRE(config.duplicateWindowMs == 100);
  REQUIRE(config.maxDuplicates == 3);
  REQUIRE(config.shell.empty());
  REQUIRE(config.logsize == "20971520");
}

TEST_CASE("Config values are read per section", "[HostConfig]") {
  auto config = HostConfig::parse(
      "[Buffer]\n"
      "max_buffer_size = 1048576\n"
      "chunk_size = 4096\n"
      "max_chunks_per_flush = 10\n"
      "flush_interval_ms = 33\n"
      "drop_threshold = 0.5\n"
      "[Session]\n"
      "default_cols = 120\n"
      "default_rows = 40\n"
      "kill_grace_ms = 1000\n"
      "shell = /bin/sh\n"
      "[Channel]\n"
      "max_reconnect_attempts = 2\n"
      "base_backoff_ms = 500\n"
      "max_backoff_ms = 4000\n"
      "max_duplicates = 7\n"
      "[Monitor]\n"
      "interval_ms = 2000\n"
      "max_samples = 20\n"
      "latency_critical_ms = 250\n"
      "utilization_warning_percent = 60.5\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1024\n"
      "logdir = /var/log/dxterm\n");
  REQUIRE(config.buffer.maxBufferSize == 1048576);
  REQUIRE(config.buffer.chunkSize == 4096);
  REQUIRE(config.buffer.maxChunksPerFlush == 10);
  REQUIRE(config.buffer.flushIntervalMs == 33);
  REQUIRE(config.buffer.dropThreshold == Approx(0.5));
  REQUIRE(config.defaultCols == 120);
  REQUIRE(config.defaultRows == 40);
  REQUIRE(config.timings.killGraceMs == 1000);
  REQUIRE(config.shell == "/bin/sh");
  REQUIRE(config.reconnect.maxAttempts == 2);
  REQUIRE(config.reconnect.delayForAttempt(1) == 1000);
  REQUIRE(config.reconnect.delayForAttempt(5) == 4000);
  REQUIRE(config.maxDuplicates == 7);
  REQUIRE(config.monitor.intervalMs == 2000);
  REQUIRE(config.monitor.maxSamples == 20);
  REQUIRE(config.monitor.maxAlerts == 50);
  REQUIRE(config.monitor.latencyWarningMs == 50);
  REQUIRE(config.monitor.latencyCriticalMs == 250);
  REQUIRE(config.monitor.utilizationWarningPercent == Approx(60.5));
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.logsize == "1024");
  REQUIRE(config.logdir == "/var/log/dxterm");
}

TEST_CASE("Bad config values are rejected", "[HostConfig]") {
  REQUIRE_THROWS_AS(HostConfig::parse("[Buffer]\nchunk_size = lots\n"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(HostConfig::parse("[Buffer]\nchunk_size = -1\n"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(HostConfig::parse("[Buffer]\ndrop_threshold = 2\n"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(HostConfig::parse("[Session]\ndefault_cols = 0\n"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      HostConfig::parse("[Channel]\nbase_backoff_ms = 5000\nmax_backoff_ms = "
                        "1000\n"),
      std::invalid_argument);
  REQUIRE_THROWS_AS(HostConfig::parse("[Debug]\nverbose = 12\n"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(HostConfig::parse("[Monitor]\ninterval_ms = 0\n"),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      HostConfig::parse("[Monitor]\nlatency_warning_ms = 500\n"),
      std::invalid_argument);

  try {
    HostConfig::parse("[Session]\nkill_grace_ms = 5s\n");
    FAIL("Expected an invalid_argument");
  } catch (const std::invalid_argument& ex) {
    REQUIRE(string(ex.what()) == "Invalid integer for [Session] kill_grace_ms: 5s");
  }
}

TEST_CASE("Missing config files are reported", "[HostConfig]") {
  REQUIRE_THROWS_AS(HostConfig::load("/nonexistent/dxterm.ini"),
                    std::runtime_error);
  REQUIRE(HostConfig::defaultPath().find("/dxterm/dxterm.ini") !=
          string::npos);
}
