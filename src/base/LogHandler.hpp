#ifndef __DX_LOG_HANDLER__
#define __DX_LOG_HANDLER__

#include "Headers.hpp"

namespace dx {
/**
 * @brief Configures easylogging++ for the host process and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              bool appendPid = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Applies the verbosity and silence switches from the command line or
   * the config file.
   */
  static void applyDebugSettings(el::Configurations *defaultConf, int verbose,
                                 bool silent);

  /** @brief Rotates a full log to <filename>.1, replacing the older copy. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace dx
#endif  // __DX_LOG_HANDLER__
