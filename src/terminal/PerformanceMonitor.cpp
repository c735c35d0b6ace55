#include "PerformanceMonitor.hpp"

namespace dx {
namespace {
string percentText(double percent) {
  ostringstream ss;
  ss << std::fixed;
  ss.precision(1);
  ss << percent;
  return ss.str();
}

template <typename T>
void trimHistory(deque<T>* history, size_t maxSize) {
  while (history->size() > maxSize) {
    history->pop_front();
  }
}

template <typename T>
vector<T> lastEntries(const map<string, deque<T>>& histories,
                      const string& terminalId, size_t limit) {
  vector<T> result;
  auto it = histories.find(terminalId);
  if (it == histories.end()) {
    return result;
  }
  size_t skip = it->second.size() > limit ? it->second.size() - limit : 0;
  result.assign(it->second.begin() + skip, it->second.end());
  return result;
}
}  // namespace

void MonitorConfig::validate() const {
  if (intervalMs <= 0) {
    throw std::invalid_argument("Monitor interval must be positive");
  }
  if (maxSamples == 0 || maxAlerts == 0) {
    throw std::invalid_argument("Monitor history must hold at least one entry");
  }
  if (pendingBytesWarning < 0 || pendingBytesCritical < pendingBytesWarning) {
    throw std::invalid_argument("Bad pending bytes thresholds");
  }
  if (latencyWarningMs < 0 || latencyCriticalMs < latencyWarningMs) {
    throw std::invalid_argument("Bad latency thresholds");
  }
  if (utilizationWarningPercent < 0 ||
      utilizationCriticalPercent < utilizationWarningPercent) {
    throw std::invalid_argument("Bad utilization thresholds");
  }
  if (droppedWarningPercent < 0 ||
      droppedCriticalPercent < droppedWarningPercent) {
    throw std::invalid_argument("Bad dropped chunk thresholds");
  }
}

PerformanceMonitor::PerformanceMonitor(shared_ptr<Scheduler> _scheduler,
                                       const MonitorConfig& _config)
    : scheduler(_scheduler), config(_config), monitoring(false) {
  config.validate();
}

PerformanceMonitor::~PerformanceMonitor() { timer.cancel(); }

void PerformanceMonitor::registerSession(shared_ptr<TerminalSession> session) {
  const string& id = session->getId();
  sessions[id] = session;
  samples[id].clear();
  alerts[id].clear();
  VLOG(1) << "Monitoring terminal " << id;
  if (!monitoring) {
    start();
  }
}

void PerformanceMonitor::unregisterSession(const string& terminalId) {
  if (sessions.erase(terminalId) == 0) {
    return;
  }
  samples.erase(terminalId);
  alerts.erase(terminalId);
  VLOG(1) << "Stopped monitoring terminal " << terminalId;
  if (sessions.empty()) {
    stop();
  }
}

void PerformanceMonitor::start() {
  if (monitoring) {
    return;
  }
  monitoring = true;
  timer = DeferredTask(scheduler, scheduler->scheduleRepeating(
                                      config.intervalMs, [this]() { collect(); }));
  LOG(INFO) << "Performance monitor sampling every " << config.intervalMs
            << "ms";
}

void PerformanceMonitor::stop() {
  if (!monitoring) {
    return;
  }
  monitoring = false;
  timer.cancel();
  LOG(INFO) << "Performance monitor stopped";
}

PerformanceSample PerformanceMonitor::sample(const TerminalSession& session,
                                             int64_t now) const {
  PerformanceSample s;
  s.terminalId = session.getId();
  s.timestamp = now;
  auto pid = session.getPid();
  s.pid = pid ? int(*pid) : 0;
  s.isRunning = session.isRunning();
  s.metrics = session.getBufferMetrics();
  s.health = session.getBufferHealth();
  s.utilizationPercent = s.health.bufferUtilization * 100.0;

  int64_t seen = s.metrics.chunksProcessed + s.metrics.droppedChunks +
                 s.metrics.pendingChunks;
  s.droppedPercent =
      seen > 0 ? double(s.metrics.droppedChunks) * 100.0 / double(seen) : 0.0;
  // An idle buffer has nothing waiting on a flush.
  s.latencyMs = s.metrics.pendingChunks > 0 ? s.health.lastFlushMs : 0;
  s.status = HEALTH_HEALTHY;
  return s;
}

vector<PerformanceAlert> PerformanceMonitor::analyze(
    const PerformanceSample& s) const {
  vector<PerformanceAlert> raised;
  auto raise = [&](AlertType type, AlertSeverity severity,
                   const string& message, const string& recommendation) {
    PerformanceAlert alert;
    alert.terminalId = s.terminalId;
    alert.type = type;
    alert.severity = severity;
    alert.message = message;
    alert.recommendation = recommendation;
    alert.timestamp = s.timestamp;
    raised.push_back(alert);
  };

  string pendingText = to_string(s.metrics.pendingBytes) + " bytes";
  if (s.metrics.pendingBytes > config.pendingBytesCritical) {
    raise(ALERT_MEMORY, SEVERITY_HIGH,
          "High buffered output: " + pendingText,
          "Pause noisy terminals or lower max_buffer_size");
  } else if (s.metrics.pendingBytes > config.pendingBytesWarning) {
    raise(ALERT_MEMORY, SEVERITY_MEDIUM,
          "Elevated buffered output: " + pendingText,
          "Monitor memory usage and consider optimization");
  }

  if (s.latencyMs > config.latencyCriticalMs) {
    raise(ALERT_LATENCY, SEVERITY_HIGH,
          "High buffer latency: " + to_string(s.latencyMs) + "ms",
          "Reduce flush interval or increase chunk processing rate");
  } else if (s.latencyMs > config.latencyWarningMs) {
    raise(ALERT_LATENCY, SEVERITY_MEDIUM,
          "Elevated buffer latency: " + to_string(s.latencyMs) + "ms",
          "Consider buffer optimization");
  }

  if (s.utilizationPercent > config.utilizationCriticalPercent) {
    raise(ALERT_BUFFER, SEVERITY_HIGH,
          "Buffer critically full: " + percentText(s.utilizationPercent) + "%",
          "Increase buffer size or improve processing speed");
  } else if (s.utilizationPercent > config.utilizationWarningPercent) {
    raise(ALERT_BUFFER, SEVERITY_MEDIUM,
          "Buffer utilization high: " + percentText(s.utilizationPercent) + "%",
          "Monitor buffer usage");
  }

  if (s.droppedPercent > config.droppedCriticalPercent) {
    raise(ALERT_BUFFER, SEVERITY_HIGH,
          "High data loss: " + percentText(s.droppedPercent) +
              "% chunks dropped",
          "Increase buffer size or optimize processing pipeline");
  } else if (s.droppedPercent > config.droppedWarningPercent) {
    raise(ALERT_BUFFER, SEVERITY_MEDIUM,
          "Data loss detected: " + percentText(s.droppedPercent) +
              "% chunks dropped",
          "Monitor and consider buffer optimization");
  }
  return raised;
}

void PerformanceMonitor::collect() {
  int64_t now = scheduler->now();
  vector<PerformanceAlert> raised;
  // Alert handlers may unregister sessions.
  auto snapshot = sessions;
  for (auto& it : snapshot) {
    PerformanceSample s = sample(*it.second, now);
    auto sessionAlerts = analyze(s);
    for (auto& alert : sessionAlerts) {
      if (alert.severity == SEVERITY_HIGH) {
        s.status = HEALTH_CRITICAL;
      } else if (s.status == HEALTH_HEALTHY) {
        s.status = HEALTH_WARNING;
      }
    }

    VLOG(2) << "Sampled " << it.first << ": " << healthName(s.status)
            << ", " << s.metrics.pendingBytes << " bytes pending";

    auto& history = samples[it.first];
    history.push_back(s);
    trimHistory(&history, config.maxSamples);
    if (!sessionAlerts.empty()) {
      auto& alertHistory = alerts[it.first];
      alertHistory.insert(alertHistory.end(), sessionAlerts.begin(),
                          sessionAlerts.end());
      trimHistory(&alertHistory, config.maxAlerts);
      raised.insert(raised.end(), sessionAlerts.begin(), sessionAlerts.end());
    }
  }

  for (auto& alert : raised) {
    LOG(WARNING) << "Terminal " << alert.terminalId << " ["
                 << alertTypeName(alert.type) << "]: " << alert.message
                 << " (" << alert.recommendation << ")";
    alertEvent.emit(alert);
  }
  updateEvent.emit(getGlobalStats());
}

GlobalPerformanceStats PerformanceMonitor::getGlobalStats() const {
  GlobalPerformanceStats stats;
  stats.totalTerminals = int(sessions.size());
  int64_t totalLatency = 0;
  int latencyCount = 0;
  for (auto& it : sessions) {
    if (it.second->isRunning()) {
      stats.activeTerminals++;
    }
    auto sampleIt = samples.find(it.first);
    if (sampleIt != samples.end() && !sampleIt->second.empty()) {
      const PerformanceSample& latest = sampleIt->second.back();
      stats.totalPendingBytes += latest.metrics.pendingBytes;
      totalLatency += latest.latencyMs;
      latencyCount++;
      switch (latest.status) {
        case HEALTH_HEALTHY:
          stats.healthyTerminals++;
          break;
        case HEALTH_WARNING:
          stats.warningTerminals++;
          break;
        case HEALTH_CRITICAL:
          stats.criticalTerminals++;
          break;
      }
    }
    auto alertIt = alerts.find(it.first);
    if (alertIt != alerts.end()) {
      stats.alertCount += int(alertIt->second.size());
    }
  }
  if (latencyCount > 0) {
    stats.averageLatency = double(totalLatency) / double(latencyCount);
  }
  return stats;
}

vector<PerformanceSample> PerformanceMonitor::getSessionSamples(
    const string& terminalId, size_t limit) const {
  return lastEntries(samples, terminalId, limit);
}

vector<PerformanceAlert> PerformanceMonitor::getSessionAlerts(
    const string& terminalId, size_t limit) const {
  return lastEntries(alerts, terminalId, limit);
}

void PerformanceMonitor::clearSessionData(const string& terminalId) {
  if (sessions.find(terminalId) == sessions.end()) {
    return;
  }
  samples[terminalId].clear();
  alerts[terminalId].clear();
  VLOG(1) << "Cleared performance data of " << terminalId;
}

void PerformanceMonitor::updateConfig(const MonitorConfig& newConfig) {
  newConfig.validate();
  bool intervalChanged = newConfig.intervalMs != config.intervalMs;
  config = newConfig;
  for (auto& it : samples) {
    trimHistory(&it.second, config.maxSamples);
  }
  for (auto& it : alerts) {
    trimHistory(&it.second, config.maxAlerts);
  }
  if (intervalChanged && monitoring) {
    stop();
    start();
  }
}

PerformanceReport PerformanceMonitor::exportData() const {
  PerformanceReport report;
  for (auto& it : sessions) {
    report.terminals.push_back(it.first);
  }
  for (auto& it : samples) {
    report.samples[it.first].assign(it.second.begin(), it.second.end());
  }
  for (auto& it : alerts) {
    report.alerts[it.first].assign(it.second.begin(), it.second.end());
  }
  report.globalStats = getGlobalStats();
  return report;
}

void PerformanceMonitor::destroy() {
  stop();
  sessions.clear();
  samples.clear();
  alerts.clear();
  alertEvent.disconnectAll();
  updateEvent.disconnectAll();
}

string PerformanceMonitor::healthName(SessionHealth health) {
  switch (health) {
    case HEALTH_HEALTHY:
      return "healthy";
    case HEALTH_WARNING:
      return "warning";
    case HEALTH_CRITICAL:
      return "critical";
  }
  return "unknown";
}

string PerformanceMonitor::alertTypeName(AlertType type) {
  switch (type) {
    case ALERT_MEMORY:
      return "memory";
    case ALERT_LATENCY:
      return "latency";
    case ALERT_BUFFER:
      return "buffer";
  }
  return "unknown";
}
}  // namespace dx
