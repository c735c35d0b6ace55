#include "HostConfig.hpp"

#include "SimpleIni.h"

namespace dx {
namespace {
int64_t readInt(const CSimpleIniA& ini, const char* section, const char* key,
                int64_t defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL || trim(value).empty()) {
    return defaultValue;
  }
  try {
    size_t consumed = 0;
    string text = trim(value);
    int64_t parsed = std::stoll(text, &consumed);
    if (consumed != text.length()) {
      throw std::invalid_argument(text);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::invalid_argument(string("Invalid integer for [") + section +
                                "] " + key + ": " + value);
  }
}

double readDouble(const CSimpleIniA& ini, const char* section, const char* key,
                  double defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL || trim(value).empty()) {
    return defaultValue;
  }
  try {
    size_t consumed = 0;
    string text = trim(value);
    double parsed = std::stod(text, &consumed);
    if (consumed != text.length()) {
      throw std::invalid_argument(text);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::invalid_argument(string("Invalid number for [") + section +
                                "] " + key + ": " + value);
  }
}

size_t readSize(const CSimpleIniA& ini, const char* section, const char* key,
                size_t defaultValue) {
  int64_t value = readInt(ini, section, key, int64_t(defaultValue));
  if (value < 0) {
    throw std::invalid_argument(string("Negative value for [") + section +
                                "] " + key);
  }
  return size_t(value);
}

HostConfig fromIni(const CSimpleIniA& ini) {
  HostConfig config;

  config.buffer.maxBufferSize =
      readSize(ini, "Buffer", "max_buffer_size", config.buffer.maxBufferSize);
  config.buffer.chunkSize =
      readSize(ini, "Buffer", "chunk_size", config.buffer.chunkSize);
  config.buffer.maxChunksPerFlush = readSize(
      ini, "Buffer", "max_chunks_per_flush", config.buffer.maxChunksPerFlush);
  config.buffer.flushIntervalMs = readInt(ini, "Buffer", "flush_interval_ms",
                                          config.buffer.flushIntervalMs);
  config.buffer.dropThreshold =
      readDouble(ini, "Buffer", "drop_threshold", config.buffer.dropThreshold);

  config.defaultCols =
      int(readInt(ini, "Session", "default_cols", config.defaultCols));
  config.defaultRows =
      int(readInt(ini, "Session", "default_rows", config.defaultRows));
  config.timings.promptDelayMs = readInt(ini, "Session", "prompt_delay_ms",
                                         config.timings.promptDelayMs);
  config.timings.healthIntervalMs = readInt(
      ini, "Session", "health_interval_ms", config.timings.healthIntervalMs);
  config.timings.killGraceMs =
      readInt(ini, "Session", "kill_grace_ms", config.timings.killGraceMs);
  config.shell = trim(ini.GetValue("Session", "shell", ""));

  config.reconnect.maxAttempts = int(readInt(
      ini, "Channel", "max_reconnect_attempts", config.reconnect.maxAttempts));
  config.reconnect.baseBackoffMs = readInt(ini, "Channel", "base_backoff_ms",
                                           config.reconnect.baseBackoffMs);
  config.reconnect.maxBackoffMs = readInt(ini, "Channel", "max_backoff_ms",
                                          config.reconnect.maxBackoffMs);
  config.duplicateWindowMs = readInt(ini, "Channel", "duplicate_window_ms",
                                     config.duplicateWindowMs);
  config.maxDuplicates =
      int(readInt(ini, "Channel", "max_duplicates", config.maxDuplicates));

  MonitorConfig& monitor = config.monitor;
  monitor.intervalMs =
      readInt(ini, "Monitor", "interval_ms", monitor.intervalMs);
  monitor.maxSamples =
      readSize(ini, "Monitor", "max_samples", monitor.maxSamples);
  monitor.maxAlerts = readSize(ini, "Monitor", "max_alerts", monitor.maxAlerts);
  monitor.pendingBytesWarning = readInt(ini, "Monitor", "pending_bytes_warning",
                                        monitor.pendingBytesWarning);
  monitor.pendingBytesCritical = readInt(
      ini, "Monitor", "pending_bytes_critical", monitor.pendingBytesCritical);
  monitor.latencyWarningMs = readInt(ini, "Monitor", "latency_warning_ms",
                                     monitor.latencyWarningMs);
  monitor.latencyCriticalMs = readInt(ini, "Monitor", "latency_critical_ms",
                                      monitor.latencyCriticalMs);
  monitor.utilizationWarningPercent =
      readDouble(ini, "Monitor", "utilization_warning_percent",
                 monitor.utilizationWarningPercent);
  monitor.utilizationCriticalPercent =
      readDouble(ini, "Monitor", "utilization_critical_percent",
                 monitor.utilizationCriticalPercent);
  monitor.droppedWarningPercent =
      readDouble(ini, "Monitor", "dropped_warning_percent",
                 monitor.droppedWarningPercent);
  monitor.droppedCriticalPercent =
      readDouble(ini, "Monitor", "dropped_critical_percent",
                 monitor.droppedCriticalPercent);

  config.verbose = int(readInt(ini, "Debug", "verbose", config.verbose));
  config.silent = readInt(ini, "Debug", "silent", 0) != 0;
  // logsize stays a string: it goes straight into easylogging's config.
  int64_t logsize = readInt(ini, "Debug", "logsize", 0);
  if (logsize != 0) {
    config.logsize = to_string(logsize);
  }
  config.logdir = trim(ini.GetValue("Debug", "logdir", ""));

  config.validate();
  return config;
}
}  // namespace

HostConfig HostConfig::load(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Could not read config file " + path);
  }
  LOG(INFO) << "Loaded config from " << path;
  return fromIni(ini);
}

HostConfig HostConfig::parse(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents.c_str(), contents.length());
  if (rc < 0) {
    throw std::runtime_error("Could not parse config data");
  }
  return fromIni(ini);
}

string HostConfig::defaultPath() {
  return sago::getConfigHome() + "/dxterm/dxterm.ini";
}

void HostConfig::validate() const {
  buffer.validate();
  if (defaultCols <= 0 || defaultRows <= 0) {
    throw std::invalid_argument("Default geometry must be positive");
  }
  if (timings.promptDelayMs < 0 || timings.killGraceMs < 0) {
    throw std::invalid_argument("Session delays must not be negative");
  }
  if (timings.healthIntervalMs <= 0) {
    throw std::invalid_argument("health_interval_ms must be positive");
  }
  if (reconnect.maxAttempts < 0) {
    throw std::invalid_argument("max_reconnect_attempts must not be negative");
  }
  if (reconnect.baseBackoffMs <= 0 ||
      reconnect.maxBackoffMs < reconnect.baseBackoffMs) {
    throw std::invalid_argument(
        "Backoff must be positive and max_backoff_ms >= base_backoff_ms");
  }
  if (duplicateWindowMs < 0 || maxDuplicates < 0) {
    throw std::invalid_argument("Duplicate throttling must not be negative");
  }
  monitor.validate();
  if (verbose < 0 || verbose > 9) {
    throw std::invalid_argument("verbose must be between 0 and 9");
  }
}
}  // namespace dx
