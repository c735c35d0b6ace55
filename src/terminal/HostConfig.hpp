#ifndef __DX_HOST_CONFIG__
#define __DX_HOST_CONFIG__

#include "Headers.hpp"
#include "OutputBufferManager.hpp"
#include "PerformanceMonitor.hpp"
#include "SessionChannelBridge.hpp"
#include "TerminalSession.hpp"

namespace dx {
/**
 * @brief Settings for the host process, read from an INI file.
 *
 * Sections: [Buffer], [Session], [Channel], [Monitor] and [Debug].  Missing keys keep
 * their defaults.
 */
struct HostConfig {
  BufferConfig buffer = BufferConfig::sessionDefaults();
  SessionTimings timings;
  int defaultCols = TerminalSession::DEFAULT_COLS;
  int defaultRows = TerminalSession::DEFAULT_ROWS;
  /** @brief Shell for new sessions; empty means detect per platform. */
  string shell;

  ReconnectPolicy reconnect;
  int64_t duplicateWindowMs = 100;
  int maxDuplicates = 3;

  MonitorConfig monitor;

  int verbose = 0;
  bool silent = false;
  string logsize = "20971520";
  string logdir;

  /**
   * @throws std::runtime_error when the file cannot be read.
   * @throws std::invalid_argument when a value does not parse or is out of
   * range.
   */
  static HostConfig load(const string& path);
  /** @brief Same as load() for INI text already in memory. */
  static HostConfig parse(const string& contents);
  /** @brief <config home>/dxterm/dxterm.ini */
  static string defaultPath();

  /** @throws std::invalid_argument */
  void validate() const;
};
}  // namespace dx

#endif  // __DX_HOST_CONFIG__
