#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace dx {
namespace {
const char *LOG_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
const char *VERBOSE_LOG_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";

// <prefix>[-<kind>]-<local time>[_<pid>].log
string logFileName(const string &prefix, const string &kind, bool appendPid) {
  time_t rawtime = time(NULL);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  char stamp[64];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &timeinfo);

  string name = prefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  name += string("-") + stamp;
  if (appendPid) {
    name += "_" + to_string(getpid());
  }
  return name + ".log";
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity is set from cxxopts or the config file, not easylogging's own
  // argument parsing.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  VERBOSE_LOG_FORMAT);
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix, bool logToStdout,
                                 bool redirectStderrToFile, bool appendPid,
                                 string maxlogsize) {
  string logPath =
      createLogFile(path, logFileName(filenamePrefix, "", appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path, logFileName(filenamePrefix, "stderr", appendPid));
  }
  return logPath;
}

void LogHandler::applyDebugSettings(el::Configurations *defaultConf,
                                    int verbose, bool silent) {
  if (verbose > 0) {
    el::Loggers::setVerboseLevel(verbose);
  }
  if (silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here: logging would recurse.
  string previous = string(filename) + ".1";
  ::remove(previous.c_str());
  if (::rename(filename, previous.c_str()) != 0) {
    ::remove(filename);
  }
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << ec.message() << endl;
    exit(1);
  }
  string fullPath = (fs::path(path) / filename).string();
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullPath = createLogFile(path, stderrFilename);
  FILE *stderrStream = freopen(fullPath.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Could not redirect stderr to " << fullPath;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace dx
