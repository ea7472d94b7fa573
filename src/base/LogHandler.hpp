#ifndef __LP_LOG_HANDLER__
#define __LP_LOG_HANDLER__

#include "Headers.hpp"

namespace lp {
/**
 * @brief Configures easylogging++ for the LivePatch binaries and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging under @p path.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param maxlogsize Rollover threshold in bytes, as a string.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /** @brief Removes a rolled-over log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

  /** @brief Applies a verbosity level, clamped to easylogging's 0-9 range. */
  static void setVerbosity(int level);

  /**
   * @brief Redirects stderr to a file created in the specified directory.
   */
  static void stderrToFile(const string &path, const string &stderrFilename);

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace lp
#endif  // __LP_LOG_HANDLER__
