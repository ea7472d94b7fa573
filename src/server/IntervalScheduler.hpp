#ifndef __LP_INTERVAL_SCHEDULER__
#define __LP_INTERVAL_SCHEDULER__

#include "Headers.hpp"

namespace lp {
/**
 * @brief A periodic task started by IntervalScheduler::every().
 *
 * stop() only flips a flag and wakes the timer, so it can be called from any
 * thread, including from inside the task, and as a patch cleanup.
 */
class Interval {
 public:
  Interval(std::chrono::milliseconds _period, std::function<void()> _fn);

  /** @brief Stops future runs. Idempotent, never blocks on the timer. */
  void stop();
  bool isStopped();
  inline bool isFinished() { return finished; }
  inline int64_t getRunCount() { return runCount; }

  /** @brief Timer loop, run by the scheduler on the interval's own thread. */
  void run();

 protected:
  std::chrono::milliseconds period;
  std::function<void()> fn;
  std::mutex intervalMutex;
  std::condition_variable wakeup;
  bool stopped;
  atomic<bool> finished;
  atomic<int64_t> runCount;
};

/**
 * @brief Owns the threads of every Interval it starts and joins them.
 */
class IntervalScheduler {
 public:
  IntervalScheduler();
  ~IntervalScheduler();

  /**
   * @brief Runs `fn` every `period` until the returned interval is stopped.
   * The first run happens one period from now.
   */
  shared_ptr<Interval> every(std::chrono::milliseconds period,
                             std::function<void()> fn);

  /** @brief Stops and joins every interval. */
  void shutdown();

  /** @brief Number of intervals that have not been stopped. */
  int activeCount();

 protected:
  /** @brief Joins the threads of intervals whose loops have returned. */
  void reap();

  std::recursive_mutex schedulerMutex;
  vector<pair<shared_ptr<Interval>, shared_ptr<thread>>> intervals;
  bool halted;
};
}  // namespace lp

#endif  // __LP_INTERVAL_SCHEDULER__
