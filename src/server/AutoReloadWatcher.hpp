#ifndef __LP_AUTO_RELOAD_WATCHER__
#define __LP_AUTO_RELOAD_WATCHER__

#include "Headers.hpp"

namespace lp {
/**
 * @brief Polls source directories for modified files and fires a callback
 * (normally PatchDispatcher::broadcastReload) when anything changes.
 *
 * Only files with a watched extension (or no extension) count. VCS, build,
 * dependency and hidden directories are skipped. Callbacks closer together
 * than the debounce window are dropped.
 */
class AutoReloadWatcher {
 public:
  AutoReloadWatcher(const vector<string>& _roots,
                    std::function<void()> _onChange,
                    std::chrono::milliseconds _pollPeriod =
                        std::chrono::milliseconds(1000),
                    std::chrono::milliseconds _debounce =
                        std::chrono::milliseconds(500));
  ~AutoReloadWatcher();

  /** @brief Takes the initial snapshot and starts the polling thread. */
  void start();
  /** @brief Stops and joins the polling thread. */
  void stop();
  bool isRunning();

  /**
   * @brief Compares a fresh snapshot to the last one.
   * @return true if the files changed and the callback was fired.
   */
  bool checkForChanges();

  /** @brief path -> modification time of every watched file. */
  static map<string, int64_t> snapshot(const vector<string>& roots);
  static bool isWatchedFile(const fs::path& path);
  static bool isSkippedDirectory(const fs::path& path);

 protected:
  void pollLoop();

  vector<string> roots;
  std::function<void()> onChange;
  std::chrono::milliseconds pollPeriod;
  std::chrono::milliseconds debounce;

  std::mutex watcherMutex;
  std::condition_variable wakeup;
  bool running;
  map<string, int64_t> previous;
  bool signalledOnce;
  std::chrono::steady_clock::time_point lastSignal;
  shared_ptr<thread> pollThread;
};
}  // namespace lp

#endif  // __LP_AUTO_RELOAD_WATCHER__
