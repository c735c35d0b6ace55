#include "OutputBufferManager.hpp"

namespace dx {
BufferConfig BufferConfig::sessionDefaults() {
  BufferConfig config;
  config.maxBufferSize = 8 * 1024 * 1024;
  config.chunkSize = 32 * 1024;
  config.maxChunksPerFlush = 50;
  config.flushIntervalMs = 16;
  config.dropThreshold = 0.75;
  return config;
}

void BufferConfig::validate() const {
  if (maxBufferSize == 0) {
    throw std::invalid_argument("maxBufferSize must be positive");
  }
  if (chunkSize == 0) {
    throw std::invalid_argument("chunkSize must be positive");
  }
  if (chunkSize > maxBufferSize) {
    throw std::invalid_argument("chunkSize must not exceed maxBufferSize");
  }
  if (maxChunksPerFlush == 0) {
    throw std::invalid_argument("maxChunksPerFlush must be positive");
  }
  if (flushIntervalMs <= 0) {
    throw std::invalid_argument("flushInterval must be positive");
  }
  if (!(dropThreshold > 0.0 && dropThreshold < 1.0)) {
    throw std::invalid_argument("dropThreshold must be between 0 and 1");
  }
}

OutputBufferManager::OutputBufferManager(const BufferConfig& _config,
                                         shared_ptr<Scheduler> _scheduler)
    : config(_config),
      scheduler(_scheduler),
      pendingBytes(0),
      paused(false),
      destroyed(false),
      totalWrites(0),
      totalBytes(0),
      chunksProcessed(0),
      bytesDelivered(0),
      flushCount(0),
      droppedChunks(0) {
  if (!scheduler) {
    throw std::invalid_argument("OutputBufferManager needs a scheduler");
  }
  config.validate();
  lastFlushTime = scheduler->now();
  flushTimer = DeferredTask(
      scheduler,
      scheduler->scheduleRepeating(config.flushIntervalMs, [this]() { flush(); }));
  VLOG(1) << "Buffer manager ready: max " << config.maxBufferSize
          << " bytes, chunk " << config.chunkSize << ", "
          << config.maxChunksPerFlush << " chunks every "
          << config.flushIntervalMs << "ms";
}

OutputBufferManager::~OutputBufferManager() { destroy(); }

void OutputBufferManager::write(const string& text, OutputSource source) {
  if (destroyed || text.empty()) {
    return;
  }
  int64_t timestamp = scheduler->now();
  totalWrites++;
  totalBytes += text.length();
  for (size_t offset = 0; offset < text.length(); offset += config.chunkSize) {
    OutputChunk chunk;
    chunk.data = text.substr(offset, config.chunkSize);
    chunk.timestamp = timestamp;
    chunk.source = source;
    chunk.size = chunk.data.length();
    pendingBytes += chunk.size;
    pending.push_back(std::move(chunk));
  }

  if (pendingBytes > config.maxBufferSize) {
    dropOldest();
  }

  if (!paused && pending.size() >= config.maxChunksPerFlush) {
    flush();
  }
}

void OutputBufferManager::dropOldest() {
  size_t target = size_t(config.dropThreshold * double(config.maxBufferSize));
  DropReport report = {0, 0, 0};
  while (!pending.empty() && pendingBytes > target) {
    report.droppedBytes += pending.front().size;
    pendingBytes -= pending.front().size;
    pending.pop_front();
    report.droppedCount++;
  }
  report.remainingChunks = pending.size();
  droppedChunks += report.droppedCount;
  LOG(WARNING) << "Output buffer overflow: dropped " << report.droppedCount
               << " chunks (" << report.droppedBytes << " bytes), "
               << report.remainingChunks << " remain";
  chunksDroppedEvent.emit(report);
}

void OutputBufferManager::flush(bool force) {
  if (destroyed || (paused && !force) || pending.empty()) {
    return;
  }
  size_t count = std::min(pending.size(), config.maxChunksPerFlush);
  string payload;
  for (size_t a = 0; a < count; a++) {
    payload += pending.front().data;
    pendingBytes -= pending.front().size;
    pending.pop_front();
  }
  chunksProcessed += count;
  bytesDelivered += payload.length();
  flushCount++;
  lastFlushTime = scheduler->now();
  dataReadyEvent.emit(payload);
}

void OutputBufferManager::drain() {
  while (!destroyed && !pending.empty()) {
    flush(true);
  }
}

void OutputBufferManager::pause() {
  if (destroyed || paused) {
    return;
  }
  paused = true;
  VLOG(1) << "Output delivery paused with " << pending.size()
          << " chunks pending";
}

void OutputBufferManager::resume() {
  if (destroyed || !paused) {
    return;
  }
  paused = false;
  VLOG(1) << "Output delivery resumed";
  if (pending.size() >= config.maxChunksPerFlush) {
    flush();
  }
}

void OutputBufferManager::destroy() {
  if (destroyed) {
    return;
  }
  destroyed = true;
  flushTimer.cancel();
  pending.clear();
  pendingBytes = 0;
  dataReadyEvent.disconnectAll();
  chunksDroppedEvent.disconnectAll();
}

BufferMetrics OutputBufferManager::getMetrics() const {
  BufferMetrics metrics;
  metrics.totalWrites = totalWrites;
  metrics.totalBytes = totalBytes;
  metrics.chunksProcessed = chunksProcessed;
  metrics.averageChunkSize =
      chunksProcessed > 0 ? double(bytesDelivered) / double(chunksProcessed)
                          : 0.0;
  metrics.flushCount = flushCount;
  metrics.droppedChunks = droppedChunks;
  metrics.pendingChunks = pending.size();
  metrics.pendingBytes = pendingBytes;
  return metrics;
}

BufferHealth OutputBufferManager::getHealthStatus() const {
  BufferHealth health;
  health.backpressure = std::min(
      1.0, double(pendingBytes) / double(config.maxBufferSize));
  health.bufferUtilization = std::min(
      1.0, double(pending.size()) / double(config.maxChunksPerFlush));
  health.lastFlushMs = scheduler->now() - lastFlushTime;

  if (health.backpressure > config.dropThreshold) {
    health.warnings.push_back("High backpressure: " +
                              to_string(int(health.backpressure * 100)) +
                              "% of buffer in use");
  }
  if (droppedChunks > 0) {
    health.warnings.push_back(to_string(droppedChunks) +
                              " chunks dropped due to overflow");
  }
  if (paused) {
    health.warnings.push_back("Output delivery is paused");
  }
  if (!pending.empty() && !paused &&
      health.lastFlushMs > 10 * config.flushIntervalMs) {
    health.warnings.push_back("No flush for " + to_string(health.lastFlushMs) +
                              "ms with data pending");
  }
  health.isHealthy = health.backpressure <= config.dropThreshold &&
                     health.warnings.empty();
  return health;
}
}  // namespace dx
