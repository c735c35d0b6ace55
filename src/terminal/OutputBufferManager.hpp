#ifndef __DX_OUTPUT_BUFFER_MANAGER__
#define __DX_OUTPUT_BUFFER_MANAGER__

#include "EventSignal.hpp"
#include "Headers.hpp"
#include "Scheduler.hpp"

namespace dx {
enum OutputSource {
  OUTPUT_STDOUT = 0,
  OUTPUT_STDERR = 1,
};

/**
 * @brief Thresholds for one OutputBufferManager.
 */
struct BufferConfig {
  /** @brief Hard cap on pending bytes. */
  size_t maxBufferSize;
  /** @brief Writes longer than this are split into pieces of this size. */
  size_t chunkSize;
  /** @brief Upper bound on chunks concatenated into one delivery. */
  size_t maxChunksPerFlush;
  int64_t flushIntervalMs;
  /** @brief Fraction of maxBufferSize to unload down to after an overflow. */
  double dropThreshold;

  /** @brief 8 MiB, 32 KiB chunks, 50 chunks per flush, 16 ms, 0.75. */
  static BufferConfig sessionDefaults();

  /** @throws std::invalid_argument describing the first bad field. */
  void validate() const;
};

struct OutputChunk {
  string data;
  int64_t timestamp;
  OutputSource source;
  size_t size;
};

struct BufferMetrics {
  int64_t totalWrites;
  int64_t totalBytes;
  int64_t chunksProcessed;
  double averageChunkSize;
  int64_t flushCount;
  int64_t droppedChunks;
  int64_t pendingChunks;
  int64_t pendingBytes;
};

struct BufferHealth {
  bool isHealthy;
  double backpressure;
  double bufferUtilization;
  int64_t lastFlushMs;
  vector<string> warnings;
};

struct DropReport {
  size_t droppedCount;
  size_t droppedBytes;
  size_t remainingChunks;
};

/**
 * @brief Coalesces bursts of terminal output into paced deliveries.
 *
 * Pending bytes never exceed maxBufferSize once write() returns: the oldest
 * chunks are discarded and reported through the chunksDropped event.
 * Deliveries go out on a repeating flush timer, or right away once
 * maxChunksPerFlush chunks are waiting.
 */
class OutputBufferManager {
 public:
  typedef function<void(const string&)> DataReadyHandler;
  typedef function<void(const DropReport&)> ChunksDroppedHandler;

  /** @throws std::invalid_argument when @p _config is invalid. */
  OutputBufferManager(const BufferConfig& _config,
                      shared_ptr<Scheduler> _scheduler);
  ~OutputBufferManager();

  void write(const string& text, OutputSource source = OUTPUT_STDOUT);

  /** @brief Suspends delivery.  Writes and drops continue. */
  void pause();
  void resume();
  /** @brief Delivers everything pending, paused or not. */
  void drain();
  /** @brief Discards pending output, stops the timer, detaches listeners. */
  void destroy();

  bool isPaused() const { return paused; }
  bool isDestroyed() const { return destroyed; }
  const BufferConfig& getConfig() const { return config; }

  BufferMetrics getMetrics() const;
  BufferHealth getHealthStatus() const;

  void onDataReady(const DataReadyHandler& handler) {
    dataReadyEvent.connect(handler);
  }
  void onChunksDropped(const ChunksDroppedHandler& handler) {
    chunksDroppedEvent.connect(handler);
  }

 protected:
  void flush(bool force = false);
  void dropOldest();

  BufferConfig config;
  shared_ptr<Scheduler> scheduler;
  deque<OutputChunk> pending;
  size_t pendingBytes;
  bool paused;
  bool destroyed;
  DeferredTask flushTimer;
  int64_t lastFlushTime;

  int64_t totalWrites;
  int64_t totalBytes;
  int64_t chunksProcessed;
  int64_t bytesDelivered;
  int64_t flushCount;
  int64_t droppedChunks;

  EventSignal<const string&> dataReadyEvent;
  EventSignal<const DropReport&> chunksDroppedEvent;
};
}  // namespace dx

#endif  // __DX_OUTPUT_BUFFER_MANAGER__
