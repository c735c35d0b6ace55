#ifndef __DX_PERFORMANCE_MONITOR__
#define __DX_PERFORMANCE_MONITOR__

#include "EventSignal.hpp"
#include "Headers.hpp"
#include "OutputBufferManager.hpp"
#include "Scheduler.hpp"
#include "TerminalSession.hpp"

namespace dx {
enum SessionHealth {
  HEALTH_HEALTHY = 0,
  HEALTH_WARNING = 1,
  HEALTH_CRITICAL = 2,
};

enum AlertType {
  ALERT_MEMORY = 0,
  ALERT_LATENCY = 1,
  ALERT_BUFFER = 2,
};

enum AlertSeverity {
  SEVERITY_MEDIUM = 1,
  SEVERITY_HIGH = 2,
};

/**
 * @brief Sampling cadence, history depth and alert thresholds.
 *
 * Each threshold pair is (warning, critical); a sample strictly above a
 * threshold raises an alert of that level.
 */
struct MonitorConfig {
  int64_t intervalMs = 5000;
  size_t maxSamples = 100;
  size_t maxAlerts = 50;

  /** @brief Output bytes held by a session's buffer. */
  int64_t pendingBytesWarning = 2 * 1024 * 1024;
  int64_t pendingBytesCritical = 4 * 1024 * 1024;
  /** @brief Age of the last flush while output is waiting. */
  int64_t latencyWarningMs = 50;
  int64_t latencyCriticalMs = 100;
  double utilizationWarningPercent = 70;
  double utilizationCriticalPercent = 85;
  double droppedWarningPercent = 1;
  double droppedCriticalPercent = 5;

  /** @throws std::invalid_argument */
  void validate() const;
};

struct PerformanceSample {
  string terminalId;
  int64_t timestamp;
  int pid;
  bool isRunning;
  BufferMetrics metrics;
  BufferHealth health;
  double utilizationPercent;
  double droppedPercent;
  int64_t latencyMs;
  SessionHealth status;
};

struct PerformanceAlert {
  string terminalId;
  AlertType type;
  AlertSeverity severity;
  string message;
  string recommendation;
  int64_t timestamp;
};

struct GlobalPerformanceStats {
  int totalTerminals = 0;
  int activeTerminals = 0;
  int64_t totalPendingBytes = 0;
  double averageLatency = 0;
  int alertCount = 0;
  int healthyTerminals = 0;
  int warningTerminals = 0;
  int criticalTerminals = 0;
};

/**
 * @brief Everything the monitor knows, for offline analysis.
 */
struct PerformanceReport {
  vector<string> terminals;
  map<string, vector<PerformanceSample>> samples;
  map<string, vector<PerformanceAlert>> alerts;
  GlobalPerformanceStats globalStats;
};

/**
 * @brief Periodically samples the output buffers of registered sessions.
 *
 * Sampling starts with the first registration and stops when the last
 * session is unregistered.  Each sample is checked against the thresholds
 * and every breach is kept in a bounded history and emitted as an alert.
 * A global summary is emitted after every sampling pass.
 */
class PerformanceMonitor {
 public:
  typedef function<void(const PerformanceAlert&)> AlertHandler;
  typedef function<void(const GlobalPerformanceStats&)> UpdateHandler;

  /** @throws std::invalid_argument when @p _config is invalid. */
  PerformanceMonitor(shared_ptr<Scheduler> _scheduler,
                     const MonitorConfig& _config = MonitorConfig());
  ~PerformanceMonitor();

  void registerSession(shared_ptr<TerminalSession> session);
  void unregisterSession(const string& terminalId);

  void start();
  void stop();
  bool isMonitoring() const { return monitoring; }

  /** @brief Takes one sample of every session now. */
  void collect();

  GlobalPerformanceStats getGlobalStats() const;
  /** @brief The most recent @p limit samples, oldest first. */
  vector<PerformanceSample> getSessionSamples(const string& terminalId,
                                              size_t limit = 10) const;
  vector<PerformanceAlert> getSessionAlerts(const string& terminalId,
                                            size_t limit = 10) const;
  void clearSessionData(const string& terminalId);

  /**
   * @brief Replaces the configuration, restarting the timer when running.
   * @throws std::invalid_argument
   */
  void updateConfig(const MonitorConfig& newConfig);
  const MonitorConfig& getConfig() const { return config; }

  PerformanceReport exportData() const;

  /** @brief Stops sampling and forgets all sessions and listeners. */
  void destroy();

  void onAlert(const AlertHandler& handler) { alertEvent.connect(handler); }
  void onUpdate(const UpdateHandler& handler) { updateEvent.connect(handler); }

  static string healthName(SessionHealth health);
  static string alertTypeName(AlertType type);

 protected:
  PerformanceSample sample(const TerminalSession& session, int64_t now) const;
  vector<PerformanceAlert> analyze(const PerformanceSample& sample) const;

  shared_ptr<Scheduler> scheduler;
  MonitorConfig config;
  bool monitoring;
  DeferredTask timer;
  map<string, shared_ptr<TerminalSession>> sessions;
  map<string, deque<PerformanceSample>> samples;
  map<string, deque<PerformanceAlert>> alerts;

  EventSignal<const PerformanceAlert&> alertEvent;
  EventSignal<const GlobalPerformanceStats&> updateEvent;
};
}  // namespace dx

#endif  // __DX_PERFORMANCE_MONITOR__
