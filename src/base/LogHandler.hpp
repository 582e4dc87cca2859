#ifndef __JM_LOG_HANDLER__
#define __JM_LOG_HANDLER__

#include "Headers.hpp"
#include "SyncConfig.hpp"

namespace jm {
/**
 * @brief Configures easylogging++ for the JobMirror tools and tests.
 *
 * Typical order: setupLogHandler, setupStdoutLogger, applyConfig,
 * setupLogFiles, then installDefaultLogger once everything is decided.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies the [Debug] section of a config.  A verbosity given on the
   * command line wins over the one in the file.
   */
  static void applyConfig(el::Configurations *defaultConf,
                          const SyncConfig &config,
                          optional<int> verboseOverride);

  /**
   * @brief Sends the default logger to a new file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return The full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false, bool appendPid = false,
                              const string &maxlogsize = "20971520");

  /**
   * @brief Applies `defaultConf` to the default logger, names the calling
   * thread and enables log rotation.
   */
  static void installDefaultLogger(const el::Configurations &defaultConf,
                                   const string &threadName);

  /** @brief Rolled log files are deleted rather than kept. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace jm
#endif  // __JM_LOG_HANDLER__
