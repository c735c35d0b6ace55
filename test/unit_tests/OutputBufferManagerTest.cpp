#include "OutputBufferManager.hpp"

#include "FakeScheduler.hpp"
#include "TestHeaders.hpp"

using namespace dx;

namespace {
BufferConfig smallConfig() {
  BufferConfig config;
  config.maxBufferSize = 100;
  config.chunkSize = 10;
  config.maxChunksPerFlush = 5;
  config.flushIntervalMs = 16;
  config.dropThreshold = 0.5;
  return config;
}
}  // namespace

TEST_CASE("BufferConfig validation", "[OutputBufferManager]") {
  REQUIRE_NOTHROW(BufferConfig::sessionDefaults().validate());

  BufferConfig defaults = BufferConfig::sessionDefaults();
  REQUIRE(defaults.maxBufferSize == 8 * 1024 * 1024);
  REQUIRE(defaults.chunkSize == 32 * 1024);
  REQUIRE(defaults.maxChunksPerFlush == 50);
  REQUIRE(defaults.flushIntervalMs == 16);
  REQUIRE(defaults.dropThreshold == Approx(0.75));

  BufferConfig config = smallConfig();
  SECTION("zero chunk size") {
    config.chunkSize = 0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
  }
  SECTION("chunk larger than buffer") {
    config.chunkSize = 101;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
  }
  SECTION("non-positive interval") {
    config.flushIntervalMs = 0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
  }
  SECTION("threshold out of range") {
    config.dropThreshold = 1.0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    config.dropThreshold = 0.0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
  }
  SECTION("constructor rejects bad config") {
    config.maxChunksPerFlush = 0;
    auto scheduler = make_shared<FakeScheduler>();
    REQUIRE_THROWS_AS(OutputBufferManager(config, scheduler),
                      std::invalid_argument);
  }
}

TEST_CASE("Output is delivered on the flush timer", "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  OutputBufferManager manager(smallConfig(), scheduler);
  vector<string> delivered;
  manager.onDataReady([&](const string& data) { delivered.push_back(data); });

  manager.write("hello ");
  manager.write("world");
  REQUIRE(delivered.empty());
  REQUIRE(manager.getMetrics().pendingChunks == 2);

  scheduler->advance(16);
  REQUIRE(delivered.size() == 1);
  REQUIRE(delivered[0] == "hello world");

  auto metrics = manager.getMetrics();
  REQUIRE(metrics.totalWrites == 2);
  REQUIRE(metrics.totalBytes == 11);
  REQUIRE(metrics.chunksProcessed == 2);
  REQUIRE(metrics.averageChunkSize == Approx(5.5));
  REQUIRE(metrics.flushCount == 1);
  REQUIRE(metrics.pendingChunks == 0);
  REQUIRE(metrics.pendingBytes == 0);

  scheduler->advance(100);
  REQUIRE(delivered.size() == 1);
}

TEST_CASE("Large writes are split and flushed immediately",
          "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  OutputBufferManager manager(smallConfig(), scheduler);
  vector<string> delivered;
  manager.onDataReady([&](const string& data) { delivered.push_back(data); });

  string text;
  for (int a = 0; a < 7; a++) {
    text += string(10, char('a' + a));
  }
  manager.write(text);

  // Seven chunks reach the per-flush limit of five without waiting.
  REQUIRE(delivered.size() == 1);
  REQUIRE(delivered[0] == text.substr(0, 50));
  REQUIRE(manager.getMetrics().pendingChunks == 2);

  scheduler->advance(16);
  REQUIRE(delivered.size() == 2);
  REQUIRE(delivered[1] == text.substr(50));

  string joined;
  for (auto& piece : delivered) joined += piece;
  REQUIRE(joined == text);
}

TEST_CASE("Overflow drops the oldest chunks", "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  BufferConfig config = smallConfig();
  config.maxChunksPerFlush = 50;
  OutputBufferManager manager(config, scheduler);
  vector<DropReport> reports;
  vector<string> delivered;
  manager.onChunksDropped(
      [&](const DropReport& report) { reports.push_back(report); });
  manager.onDataReady([&](const string& data) { delivered.push_back(data); });

  string text;
  for (int a = 0; a < 11; a++) {
    text += string(10, char('a' + a));
  }
  manager.write(text);

  REQUIRE(reports.size() == 1);
  // 110 bytes pending against a cap of 100, unloaded down to 50.
  REQUIRE(reports[0].droppedCount == 6);
  REQUIRE(reports[0].droppedBytes == 60);
  REQUIRE(reports[0].remainingChunks == 5);

  auto metrics = manager.getMetrics();
  REQUIRE(metrics.droppedChunks == 6);
  REQUIRE(metrics.pendingBytes == 50);
  REQUIRE(metrics.pendingBytes <= int64_t(config.maxBufferSize));

  auto health = manager.getHealthStatus();
  REQUIRE_FALSE(health.isHealthy);
  REQUIRE(health.warnings.size() == 1);

  scheduler->advance(16);
  REQUIRE(delivered.size() == 1);
  REQUIRE(delivered[0] == text.substr(60));
}

TEST_CASE("Pause holds output until resume", "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  OutputBufferManager manager(smallConfig(), scheduler);
  vector<string> delivered;
  manager.onDataReady([&](const string& data) { delivered.push_back(data); });

  manager.pause();
  REQUIRE(manager.isPaused());
  manager.write(string(80, 'x').replace(0, 1, "y"));
  scheduler->advance(200);
  REQUIRE(delivered.empty());

  auto health = manager.getHealthStatus();
  REQUIRE_FALSE(health.isHealthy);
  REQUIRE(std::find(health.warnings.begin(), health.warnings.end(),
                    "Output delivery is paused") != health.warnings.end());

  // Eight chunks waiting, so resume delivers a batch right away.
  manager.resume();
  REQUIRE(delivered.size() == 1);
  REQUIRE(delivered[0].length() == 50);
  scheduler->advance(16);
  REQUIRE(delivered.size() == 2);
  REQUIRE(delivered[1].length() == 30);
}

TEST_CASE("Drain delivers everything even while paused",
          "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  OutputBufferManager manager(smallConfig(), scheduler);
  string received;
  manager.onDataReady([&](const string& data) { received += data; });

  manager.pause();
  manager.write("prompt$ ");
  manager.write(string(85, 'z').replace(40, 1, "q"));
  manager.drain();
  REQUIRE(received.length() == 93);
  REQUIRE(manager.getMetrics().pendingChunks == 0);
}

TEST_CASE("Destroy discards output and is idempotent",
          "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  OutputBufferManager manager(smallConfig(), scheduler);
  int deliveries = 0;
  manager.onDataReady([&](const string&) { deliveries++; });

  manager.write("pending");
  REQUIRE(scheduler->pendingTaskCount() == 1);
  manager.destroy();
  manager.destroy();
  REQUIRE(manager.isDestroyed());
  REQUIRE(scheduler->pendingTaskCount() == 0);

  manager.write("ignored");
  scheduler->advance(100);
  REQUIRE(deliveries == 0);
  REQUIRE(manager.getMetrics().pendingChunks == 0);
}

TEST_CASE("Health reflects pending load", "[OutputBufferManager]") {
  auto scheduler = make_shared<FakeScheduler>();
  OutputBufferManager manager(smallConfig(), scheduler);
  auto health = manager.getHealthStatus();
  REQUIRE(health.isHealthy);
  REQUIRE(health.warnings.empty());
  REQUIRE(health.backpressure == Approx(0.0));

  manager.write("abc");
  health = manager.getHealthStatus();
  REQUIRE(health.backpressure == Approx(0.03));
  REQUIRE(health.bufferUtilization == Approx(0.2));
  REQUIRE(health.isHealthy);
}
